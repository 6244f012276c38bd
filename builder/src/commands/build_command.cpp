#include "commands/build_command.hpp"

#include "commands/command_support.hpp"
#include "core/failure.hpp"
#include "driver/build_driver.hpp"

namespace fs = std::filesystem;

namespace muslforge::commands
{
    namespace
    {

        struct BuildOptions
        {
            std::string arch;
            std::string source;
            std::string image;
            bool dryRun = false;
        };

        bool parseOptions(const std::vector<std::string> &args, BuildOptions &opt, const muslforge::Context &ctx)
        {
            std::vector<std::string> positionals;
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--dry-run")
                {
                    opt.dryRun = true;
                    continue;
                }
                if (arg == "--source")
                {
                    if (!takeValue(args, i, opt.source, ctx))
                    {
                        return false;
                    }
                    continue;
                }
                if (arg == "--image")
                {
                    if (!takeValue(args, i, opt.image, ctx))
                    {
                        return false;
                    }
                    continue;
                }

                if (arg.rfind("--", 0) == 0)
                {
                    ctx.error("Unknown build option: ", arg);
                    return false;
                }
                positionals.push_back(arg);
            }

            if (positionals.size() > 1)
            {
                ctx.error("build: expected at most one architecture, got ", positionals.size());
                return false;
            }
            if (!positionals.empty())
            {
                opt.arch = positionals.front();
            }
            return true;
        }

    } // namespace

    int runBuildCommand(const muslforge::Context &ctx, const fs::path &configFile, const std::vector<std::string> &args)
    {
        BuildOptions opt;
        if (!parseOptions(args, opt, ctx))
        {
            return kUsageExitCode;
        }

        auto settings = loadCommandSettings(ctx, configFile);
        if (!settings.has_value())
        {
            return exitCodeFor(FailureKind::InvalidConfiguration);
        }

        driver::DriverRequest request;
        request.arch = opt.arch;
        request.source = opt.source;
        request.image = opt.image;
        request.dryRun = opt.dryRun;
        return reportOutcome(ctx, driver::runDriver(request, settings.value(), ctx));
    }

} // namespace muslforge::commands
