#include "vine/commands/run_command.hpp"

#include <filesystem>
#include <optional>

#include "vine/model/loader.hpp"
#include "vine/vm/heap.hpp"
#include "vine/vm/machine.hpp"

namespace fs = std::filesystem;

namespace vine::commands
{
    namespace
    {

        struct RunOptions
        {
            std::string programFile;
            bool trace = false;
            bool quiet = false;
        };

        bool parseRunOptions(const std::vector<std::string> &args, RunOptions &out, const vine::Context &ctx)
        {
            for (const std::string &arg : args)
            {
                if (arg == "--trace")
                {
                    out.trace = true;
                }
                else if (arg == "--quiet" || arg == "-q")
                {
                    out.quiet = true;
                }
                else if (!arg.empty() && arg[0] == '-')
                {
                    ctx.error("Unknown option for run: ", arg);
                    return false;
                }
                else if (out.programFile.empty())
                {
                    out.programFile = arg;
                }
                else
                {
                    ctx.error("Unexpected argument for run: ", arg);
                    return false;
                }
            }

            if (out.programFile.empty())
            {
                ctx.error("Usage: vine run <program.json> [--trace] [--quiet]");
                return false;
            }
            return true;
        }

    } // namespace

    int runRunCommand(const vine::Context &ctx, const std::vector<std::string> &args)
    {
        RunOptions options;
        if (!parseRunOptions(args, options, ctx))
        {
            return 1;
        }

        const vine::Context runCtx(ctx.verbose() && !options.quiet);

        std::optional<model::ProgramSpec> program = model::loadProgramFile(fs::path(options.programFile), runCtx);
        if (!program.has_value())
        {
            return 1;
        }

        std::optional<Image> image = model::loadProgramCode(*program, runCtx);
        if (!image.has_value())
        {
            return 1;
        }

        HeapConfig heapConfig;
        heapConfig.sizeClasses = program->sizeClasses;
        heapConfig.objectsPerClass = program->objectsPerClass;

        std::optional<Heap> heap;
        try
        {
            heap.emplace(heapConfig);
        }
        catch (const HeapError &e)
        {
            runCtx.error("Invalid heap configuration in ", program->filePath.string(), " : ", e.what());
            return 1;
        }

        MachineConfig machineConfig;
        machineConfig.stackCapacity = program->stack;
        machineConfig.stepBudget = program->stepBudget;
        machineConfig.trace = options.trace;

        runCtx.log("Run ", program->name, " (", image->code.size(), " bytes, entry ", image->entry, ")");

        std::optional<Machine> machine;
        try
        {
            machine.emplace(image->code, image->entry, program->a, program->b, *heap, machineConfig);
        }
        catch (const std::exception &e)
        {
            runCtx.error("Cannot create machine for ", program->name, " (stack ", program->stack, ") : ", e.what());
            return 1;
        }
        machine->setContext(runCtx);
        ExecutionResult result = machine->execute();

        if (!result.ok())
        {
            runCtx.error(program->name, " faulted at ", result.offset, " after ", result.steps, " steps: ",
                         faultToString(result.fault), " (", result.message, ")");
            return 2;
        }

        runCtx.log(program->name, " halted after ", result.steps, " steps");
        for (size_t i = machine->stack().size(); i > 0; --i)
        {
            runCtx.log("  [", i - 1, "] ", machine->stack().at(i - 1));
        }
        runCtx.log("  R = ", machine->registerR());
        return 0;
    }

} // namespace vine::commands
