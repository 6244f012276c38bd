#include "commands/deps_command.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include "commands/command_support.hpp"
#include "core/failure.hpp"
#include "driver/build_driver.hpp"
#include "model/loader.hpp"
#include "pipeline/pipeline.hpp"
#include "toolchain/toolchain_config.hpp"

namespace fs = std::filesystem;

namespace muslforge::commands
{
    namespace
    {

        struct DepsOptions
        {
            std::string arch;
            std::string prefix;
            std::string workDir;
            std::string pipelineFile;
            std::size_t jobs = 1;
            std::vector<std::string> without;
            bool requireChecksums = false;
            bool rebuild = false;
            bool clean = false;
            bool dryRun = false;
            bool planOnly = false;
        };

        bool parseOptions(const std::vector<std::string> &args, DepsOptions &opt, const muslforge::Context &ctx)
        {
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--require-checksums")
                {
                    opt.requireChecksums = true;
                    continue;
                }
                if (arg == "--rebuild")
                {
                    opt.rebuild = true;
                    continue;
                }
                if (arg == "--clean")
                {
                    opt.clean = true;
                    continue;
                }
                if (arg == "--dry-run")
                {
                    opt.dryRun = true;
                    continue;
                }
                if (arg == "--plan")
                {
                    opt.planOnly = true;
                    continue;
                }
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
                if (arg == "--work")
                {
                    if (!takeValue(args, i, opt.workDir, ctx))
                    {
                        return false;
                    }
                    continue;
                }
                if (arg == "--pipeline")
                {
                    if (!takeValue(args, i, opt.pipelineFile, ctx))
                    {
                        return false;
                    }
                    continue;
                }
                if (arg == "--without")
                {
                    std::string value;
                    if (!takeValue(args, i, value, ctx))
                    {
                        return false;
                    }
                    for (const auto &name : splitList(value))
                    {
                        opt.without.push_back(name);
                    }
                    continue;
                }
                if (arg == "--jobs" || arg == "-j")
                {
                    std::string value;
                    if (!takeValue(args, i, value, ctx) || !parsePositive("--jobs", value, opt.jobs, ctx))
                    {
                        return false;
                    }
                    continue;
                }

                ctx.error("Unknown deps option: ", arg);
                return false;
            }
            return true;
        }

    } // namespace

    int runDepsCommand(const muslforge::Context &ctx, const fs::path &configFile, const std::vector<std::string> &args)
    {
        DepsOptions opt;
        if (!parseOptions(args, opt, ctx))
        {
            return kUsageExitCode;
        }

        auto settings = loadCommandSettings(ctx, configFile);
        if (!settings.has_value())
        {
            return exitCodeFor(FailureKind::InvalidConfiguration);
        }
        if (!opt.pipelineFile.empty())
        {
            settings->pipelineFile = fs::absolute(opt.pipelineFile);
        }
        if (!opt.prefix.empty())
        {
            settings->prefix = fs::absolute(opt.prefix);
        }
        if (!opt.workDir.empty())
        {
            settings->workDir = fs::absolute(opt.workDir);
        }

        auto loaded = model::loadPipeline(settings.value(), ctx);
        if (!loaded.has_value())
        {
            return exitCodeFor(FailureKind::InvalidConfiguration);
        }

        std::string error;
        auto selected = model::selectDependencies(loaded.value(), opt.without, error);
        if (!selected.has_value())
        {
            return reportOutcome(ctx, Outcome::failure(FailureKind::InvalidConfiguration, error));
        }

        if (opt.planOnly)
        {
            const auto lines = pipeline::describeOrder(selected.value(), error);
            if (lines.empty() && !error.empty())
            {
                return reportOutcome(ctx, Outcome::failure(FailureKind::Configure, error));
            }
            for (const auto &line : lines)
            {
                ctx.log(line);
            }
            return 0;
        }

        model::Arch arch = model::Arch::X86_64;
        Outcome outcome = driver::resolveArch(opt.arch, arch);
        if (!outcome.ok())
        {
            return reportOutcome(ctx, outcome);
        }

        const auto config = toolchain::makeToolchainConfig(arch, settings->prefix, settings->toolchain);

        pipeline::PipelineOptions options;
        options.workDir = settings->workDir;
        options.jobs = opt.jobs;
        options.requireChecksums = opt.requireChecksums;
        options.rebuild = opt.rebuild;
        options.clean = opt.clean;
        options.dryRun = opt.dryRun;
        options.captureLogs = opt.jobs > 1;
        options.tools = settings->tools;

        return reportOutcome(ctx, pipeline::runPipeline(selected.value(), config, options, ctx));
    }

} // namespace muslforge::commands
