#include <iostream>
#include <string>
#include <vector>

#include "vine/commands/asm_command.hpp"
#include "vine/commands/disasm_command.hpp"
#include "vine/commands/run_command.hpp"
#include "vine/core/context.hpp"

namespace
{

    constexpr const char *kAppName = "vine";
    constexpr const char *kVersion = "0.1.0";

    void printHelp()
    {
        std::cout << kAppName << " " << kVersion << " - bytecode virtual machine\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << kAppName << " run <program.json> [--trace] [--quiet]\n"
                  << "  " << kAppName << " asm <file.vna> [-o <file.vbc>]\n"
                  << "  " << kAppName << " disasm <file.vna|file.vbc>\n"
                  << "  " << kAppName << " help | version\n"
                  << "\n"
                  << "Exit codes for run: 0 halted, 2 faulted, 1 usage or load error\n"
                  << "\n"
                  << "Examples:\n"
                  << "  " << kAppName << " run programs/add.json\n"
                  << "  " << kAppName << " asm programs/countdown.vna -o countdown.vbc\n"
                  << "  " << kAppName << " disasm countdown.vbc\n";
    }

    std::vector<std::string> collectArgs(int argc, char **argv, int startIndex)
    {
        std::vector<std::string> out;
        for (int i = startIndex; i < argc; ++i)
        {
            out.emplace_back(argv[i]);
        }
        return out;
    }

} // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        printHelp();
        return 1;
    }

    const std::string command = argv[1];
    const vine::Context ctx(true);

    if (command == "help" || command == "--help" || command == "-h")
    {
        printHelp();
        return 0;
    }
    if (command == "version" || command == "--version" || command == "-v")
    {
        std::cout << kAppName << " " << kVersion << '\n';
        return 0;
    }

    if (command == "run")
    {
        return vine::commands::runRunCommand(ctx, collectArgs(argc, argv, 2));
    }
    if (command == "asm")
    {
        return vine::commands::runAsmCommand(ctx, collectArgs(argc, argv, 2));
    }
    if (command == "disasm")
    {
        return vine::commands::runDisasmCommand(ctx, collectArgs(argc, argv, 2));
    }

    std::cerr << "Unknown command: " << command << '\n';
    printHelp();
    return 1;
}
