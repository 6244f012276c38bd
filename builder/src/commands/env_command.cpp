#include "commands/env_command.hpp"

#include <iostream>

#include "commands/command_support.hpp"
#include "core/failure.hpp"
#include "driver/build_driver.hpp"
#include "toolchain/toolchain_config.hpp"

namespace fs = std::filesystem;

namespace muslforge::commands
{
    namespace
    {

        struct EnvOptions
        {
            std::string arch;
            std::string prefix;
            std::string format = "shell";
        };

        bool parseOptions(const std::vector<std::string> &args, EnvOptions &opt, const muslforge::Context &ctx)
        {
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--arch")
                {
                    if (!takeValue(args, i, opt.arch, ctx))
                    {
                        return false;
                    }
                    continue;
                }
                if (arg == "--prefix")
                {
                    if (!takeValue(args, i, opt.prefix, ctx))
                    {
                        return false;
                    }
                    continue;
                }
                if (arg == "--format")
                {
                    if (!takeValue(args, i, opt.format, ctx))
                    {
                        return false;
                    }
                    if (opt.format != "shell" && opt.format != "docker")
                    {
                        ctx.error("Invalid --format: ", opt.format, " (shell or docker)");
                        return false;
                    }
                    continue;
                }

                ctx.error("Unknown env option: ", arg);
                return false;
            }
            return true;
        }

    } // namespace

    int runEnvCommand(const muslforge::Context &ctx, const fs::path &configFile, const std::vector<std::string> &args)
    {
        EnvOptions opt;
        if (!parseOptions(args, opt, ctx))
        {
            return kUsageExitCode;
        }

        auto settings = loadCommandSettings(ctx, configFile);
        if (!settings.has_value())
        {
            return exitCodeFor(FailureKind::InvalidConfiguration);
        }
        if (!opt.prefix.empty())
        {
            settings->prefix = fs::absolute(opt.prefix);
        }

        model::Arch arch = model::Arch::X86_64;
        Outcome outcome = driver::resolveArch(opt.arch, arch);
        if (!outcome.ok())
        {
            return reportOutcome(ctx, outcome);
        }

        const auto config = toolchain::makeToolchainConfig(arch, settings->prefix, settings->toolchain);
        if (opt.format == "docker")
        {
            std::cout << toolchain::formatEnvironment(config.imageEnvironment(), toolchain::EnvFormat::Docker);
        }
        else
        {
            std::cout << toolchain::formatEnvironment(config.environment(), toolchain::EnvFormat::Shell);
        }
        return 0;
    }

} // namespace muslforge::commands
