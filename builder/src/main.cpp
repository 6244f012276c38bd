#include <iostream>
#include <string>
#include <vector>

#include "commands/build_command.hpp"
#include "commands/command_support.hpp"
#include "commands/deps_command.hpp"
#include "commands/env_command.hpp"
#include "commands/image_command.hpp"
#include "commands/merge_command.hpp"
#include "core/context.hpp"

namespace
{

    constexpr const char *kAppName = "muslforge";
    constexpr const char *kVersionLine = "static musl toolchain and builder image pipeline";

    void printHelp()
    {
        std::cout << kAppName << " - " << kVersionLine << "\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << kAppName << " deps [--arch A] [--prefix DIR] [--work DIR] [--pipeline FILE] [--jobs N]\n"
                  << "       [--without a,b] [--require-checksums] [--rebuild] [--clean] [--dry-run] [--plan]\n"
                  << "  " << kAppName << " env [--arch A] [--prefix DIR] [--format shell|docker]\n"
                  << "  " << kAppName << " image [--arch A] [--image NAME] [--date YYYYMMDD] [--latest] [--push]\n"
                  << "       [--context DIR] [--digests DIR] [--binary FILE] [--pipeline FILE] [--without a,b] [--dry-run]\n"
                  << "  " << kAppName << " merge [--image NAME] [--platforms p,q] [--digests DIR] [--date YYYYMMDD]\n"
                  << "       [--no-latest] [--dry-run]\n"
                  << "  " << kAppName << " build [x86_64|aarch64] [--source DIR] [--image REF] [--dry-run]\n"
                  << "\n"
                  << "Global options:\n"
                  << "  --config FILE   configuration file (default ./muslforge.json)\n"
                  << "  --quiet         only print warnings and errors\n"
                  << "  --verbose       print debug output\n"
                  << "\n"
                  << "Examples:\n"
                  << "  " << kAppName << " deps --arch aarch64 --prefix /opt/musl --jobs 4\n"
                  << "  " << kAppName << " deps --without rlottie,opencv --plan\n"
                  << "  " << kAppName << " env --arch aarch64 --format docker\n"
                  << "  " << kAppName << " image --arch arm64 --push --digests /tmp/digests\n"
                  << "  " << kAppName << " merge --digests /tmp/digests\n"
                  << "  " << kAppName << " build aarch64\n";
    }

} // namespace

int main(int argc, char **argv)
{
    muslforge::commands::GlobalOptions global;
    std::string command;
    std::vector<std::string> args;
    std::string error;
    if (!muslforge::commands::splitCommandLine(std::vector<std::string>(argv + 1, argv + argc), global, command, args, error))
    {
        std::cerr << error << '\n';
        return 1;
    }

    if (command.empty())
    {
        printHelp();
        return 1;
    }
    if (command == "help" || command == "--help" || command == "-h")
    {
        printHelp();
        return 0;
    }
    if (command == "version" || command == "--version" || command == "-v")
    {
        std::cout << kAppName << " - " << kVersionLine << '\n';
        return 0;
    }

    const muslforge::Context ctx(global.verbose, global.quiet);

    if (command == "deps")
    {
        return muslforge::commands::runDepsCommand(ctx, global.configFile, args);
    }
    if (command == "env")
    {
        return muslforge::commands::runEnvCommand(ctx, global.configFile, args);
    }
    if (command == "image")
    {
        return muslforge::commands::runImageCommand(ctx, global.configFile, args);
    }
    if (command == "merge")
    {
        return muslforge::commands::runMergeCommand(ctx, global.configFile, args);
    }
    if (command == "build")
    {
        return muslforge::commands::runBuildCommand(ctx, global.configFile, args);
    }

    std::cerr << "Unknown command: " << command << '\n';
    printHelp();
    return 1;
}
