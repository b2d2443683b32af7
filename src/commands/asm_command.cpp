#include "vine/commands/asm_command.hpp"

#include <filesystem>
#include <optional>

#include "vine/bytecode/image.hpp"
#include "vine/model/loader.hpp"

namespace fs = std::filesystem;

namespace vine::commands
{

    int runAsmCommand(const vine::Context &ctx, const std::vector<std::string> &args)
    {
        std::string input;
        std::string output;

        for (size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            if (arg == "-o" || arg == "--output")
            {
                if (i + 1 >= args.size())
                {
                    ctx.error("Missing value for ", arg);
                    return 1;
                }
                output = args[++i];
            }
            else if (input.empty())
            {
                input = arg;
            }
            else
            {
                ctx.error("Unexpected argument for asm: ", arg);
                return 1;
            }
        }

        if (input.empty())
        {
            ctx.error("Usage: vine asm <file.vna> -o <file.vbc>");
            return 1;
        }

        fs::path source(input);
        if (source.extension() != ".vna")
        {
            ctx.error("asm expects a .vna source, got ", source.string());
            return 1;
        }

        fs::path target = output.empty() ? fs::path(source).replace_extension(".vbc") : fs::path(output);

        std::optional<Image> image = model::loadCodeFile(source, ctx);
        if (!image.has_value())
        {
            return 1;
        }
        return writeImage(target, *image, ctx) ? 0 : 1;
    }

} // namespace vine::commands
