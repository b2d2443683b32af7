#include "vine/commands/disasm_command.hpp"

#include <filesystem>
#include <optional>

#include "vine/model/loader.hpp"
#include "vine/vm/debug.hpp"

namespace fs = std::filesystem;

namespace vine::commands
{

    int runDisasmCommand(const vine::Context &ctx, const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            ctx.error("Usage: vine disasm <file.vna|file.vbc>");
            return 1;
        }

        fs::path file(args[0]);
        std::optional<Image> image = model::loadCodeFile(file, ctx);
        if (!image.has_value())
        {
            return 1;
        }

        Debug::disassembleCode(ctx, image->code, image->entry, file.filename().string().c_str());
        return 0;
    }

} // namespace vine::commands
