#include "pipeline/pipeline.hpp"

#include <mutex>
#include <system_error>
#include <unordered_map>

#include "io/fs_utils.hpp"
#include "io/process.hpp"
#include "pipeline/fetcher.hpp"
#include "pipeline/graph.hpp"
#include "pipeline/install.hpp"
#include "pipeline/recipe.hpp"
#include "pipeline/scheduler.hpp"

namespace fs = std::filesystem;

namespace muslforge::pipeline
{
    namespace
    {

        constexpr std::size_t kLogTailLines = 40;

        std::string joinNames(const std::vector<std::string> &names)
        {
            std::string out;
            for (const auto &name : names)
            {
                if (!out.empty())
                {
                    out += ", ";
                }
                out += name;
            }
            return out;
        }

        class DependencyBuilder
        {
        public:
            DependencyBuilder(
                const model::Pipeline &pipeline,
                const toolchain::ToolchainConfig &config,
                const PipelineOptions &options,
                const muslforge::Context &ctx)
                : pipeline_(pipeline), config_(config), options_(options), ctx_(ctx)
            {
                for (const auto &spec : pipeline_)
                {
                    byName_.emplace(spec.name, &spec);
                }
            }

            Outcome build(const model::DependencySpec &spec)
            {
                const StepPaths paths = stepPaths(options_.workDir, spec);

                if (!options_.rebuild && !options_.dryRun && isInstalled(spec))
                {
                    ctx_.log("==> ", spec.name, " ", spec.version, " already installed, skipping");
                    return Outcome::success();
                }

                const fs::path logFile = options_.captureLogs && !options_.dryRun ? paths.logFile : fs::path();
                if (!logFile.empty())
                {
                    std::error_code ec;
                    fs::remove(logFile, ec);
                    io::ensureDir(logFile.parent_path());
                }

                ctx_.log("==> ", spec.name, " ", spec.version, ": fetch");
                FetchOptions fetchOptions;
                fetchOptions.requireChecksums = options_.requireChecksums;
                fetchOptions.dryRun = options_.dryRun;
                Outcome outcome = fetchSource(spec, paths, options_.tools, fetchOptions, ctx_);
                if (!outcome.ok())
                {
                    return outcome;
                }

                ctx_.log("==> ", spec.name, ": extract");
                outcome = extractArchive(spec, paths, options_.tools, options_.dryRun, ctx_);
                if (!outcome.ok())
                {
                    return outcome;
                }

                outcome = prepareConfigure(spec, paths);
                if (!outcome.ok())
                {
                    return outcome;
                }

                const StepPlan plan = planStep(spec, config_, paths, options_.tools);

                ctx_.log("==> ", spec.name, ": configure");
                outcome = runPhase(spec, plan.configure, FailureKind::Configure, logFile);
                if (!outcome.ok())
                {
                    return outcome;
                }

                ctx_.log("==> ", spec.name, ": compile");
                outcome = runPhase(spec, plan.compile, FailureKind::Compile, logFile);
                if (!outcome.ok())
                {
                    return outcome;
                }

                ctx_.log("==> ", spec.name, ": install");
                outcome = runPhase(spec, plan.install, FailureKind::Install, logFile);
                if (!outcome.ok())
                {
                    return outcome;
                }
                if (options_.dryRun)
                {
                    return Outcome::success();
                }

                outcome = finishStage(spec, paths);
                if (!outcome.ok())
                {
                    return outcome;
                }
                return promote(spec, paths);
            }

        private:
            bool isInstalled(const model::DependencySpec &spec) const
            {
                auto record = readInstallRecord(config_.prefix(), spec.name);
                return record.has_value() &&
                       record->version == spec.version &&
                       record->arch == model::archName(config_.arch()) &&
                       missingDiscoveryMetadata(config_.prefix(), spec).empty();
            }

            Outcome prepareConfigure(const model::DependencySpec &spec, const StepPaths &paths)
            {
                if (options_.dryRun)
                {
                    return Outcome::success();
                }

                for (const auto &patch : spec.linkPatches)
                {
                    Outcome patched = applyLinkPatch(paths.sourceDir, patch);
                    if (!patched.ok())
                    {
                        return patched;
                    }
                    ctx_.log("Patched ", patch.file, ": ", patch.token, " -> ", patch.token, patch.append);
                }

                for (const auto &depName : spec.depends)
                {
                    auto it = byName_.find(depName);
                    if (it == byName_.end())
                    {
                        return Outcome::failure(
                            FailureKind::Configure,
                            spec.name + " requires " + depName + ", which is not part of this run");
                    }
                    const auto missing = missingDiscoveryMetadata(config_.prefix(), *it->second);
                    if (!missing.empty())
                    {
                        return Outcome::failure(
                            FailureKind::Configure,
                            spec.name + " requires " + depName + " but " + joinNames(missing) + " is missing from " +
                                config_.pkgConfigDir().string());
                    }
                }

                std::error_code ec;
                fs::remove_all(paths.stageDir, ec);
                if (ec || !io::ensureDir(paths.stageDir))
                {
                    return Outcome::failure(FailureKind::Configure, "cannot prepare stage " + paths.stageDir.string());
                }
                return Outcome::success();
            }

            Outcome runPhase(
                const model::DependencySpec &spec,
                const std::vector<Command> &commands,
                FailureKind kind,
                const fs::path &logFile)
            {
                for (const auto &command : commands)
                {
                    io::ProcessOptions processOptions;
                    processOptions.cwd = command.cwd;
                    processOptions.env = command.env;
                    processOptions.logFile = logFile;
                    processOptions.dryRun = options_.dryRun;

                    auto result = io::runCommand(command.program, command.args, processOptions, ctx_);
                    if (result.code == 0)
                    {
                        continue;
                    }

                    if (!logFile.empty())
                    {
                        ctx_.error("Last lines of ", logFile.string(), ":");
                        for (const auto &line : io::tailLines(logFile, kLogTailLines))
                        {
                            ctx_.error("  ", line);
                        }
                    }
                    return Outcome::failure(
                        kind,
                        spec.name + ": " + result.commandLine + " exited with " + std::to_string(result.code));
                }
                return Outcome::success();
            }

            Outcome finishStage(const model::DependencySpec &spec, const StepPaths &paths)
            {
                const fs::path staged = paths.stagedPrefix(config_.prefix());

                if (spec.stripLibPrefix)
                {
                    std::string error;
                    const auto renamed = stripRedundantLibPrefix(staged, error);
                    for (const auto &file : renamed)
                    {
                        ctx_.log("Renamed archive to ", file.filename().string());
                    }
                    if (!error.empty())
                    {
                        return Outcome::failure(FailureKind::Install, spec.name + ": " + error);
                    }
                }

                const auto shared = findSharedObjects(staged);
                if (!shared.empty())
                {
                    return Outcome::failure(
                        FailureKind::Install,
                        spec.name + " installed shared objects (" + shared.front().string() + "), only static archives are allowed");
                }

                for (const auto &patch : spec.linkPatches)
                {
                    Outcome checked = checkLinkPatchInstalled(staged, patch);
                    if (!checked.ok())
                    {
                        return checked;
                    }
                }

                const auto missing = missingDiscoveryMetadata(staged, spec);
                if (!missing.empty())
                {
                    return Outcome::failure(
                        FailureKind::Install,
                        spec.name + " did not install " + joinNames(missing));
                }
                return Outcome::success();
            }

            Outcome promote(const model::DependencySpec &spec, const StepPaths &paths)
            {
                InstallRecord record;
                record.name = spec.name;
                record.version = spec.version;
                record.arch = model::archName(config_.arch());

                {
                    std::lock_guard<std::mutex> lock(promoteMutex_);
                    Outcome promoted = promoteStage(paths.stagedPrefix(config_.prefix()), config_.prefix(), record.files);
                    if (!promoted.ok())
                    {
                        return promoted;
                    }
                    if (!writeInstallRecord(config_.prefix(), record))
                    {
                        return Outcome::failure(
                            FailureKind::Install,
                            "cannot write " + installRecordPath(config_.prefix(), spec.name).string());
                    }
                }

                std::error_code ec;
                fs::remove_all(paths.stageDir, ec);
                ctx_.log("==> ", spec.name, " ", spec.version, " installed (", record.files.size(), " files)");
                return Outcome::success();
            }

            const model::Pipeline &pipeline_;
            const toolchain::ToolchainConfig &config_;
            const PipelineOptions &options_;
            const muslforge::Context &ctx_;
            std::unordered_map<std::string, const model::DependencySpec *> byName_;
            std::mutex promoteMutex_;
        };

    } // namespace

    Outcome runPipeline(
        const model::Pipeline &pipeline,
        const toolchain::ToolchainConfig &config,
        const PipelineOptions &options,
        const muslforge::Context &ctx)
    {
        std::string error;
        auto graph = DependencyGraph::build(pipeline, error);
        if (!graph.has_value())
        {
            return Outcome::failure(FailureKind::Configure, error);
        }

        ctx.log("Target ", config.triple(), ", prefix ", config.prefix().string());
        if (!config.archFlags().empty())
        {
            ctx.log("Architecture flags: ", toolchain::joinFlags(config.archFlags()));
        }

        if (options.clean)
        {
            io::removePath(config.prefix(), options.dryRun, ctx);
        }
        if (!options.dryRun)
        {
            if (!io::ensureDir(config.prefix()) || !io::ensureDir(options.workDir))
            {
                return Outcome::failure(
                    FailureKind::Install,
                    "cannot create " + config.prefix().string() + " or " + options.workDir.string());
            }
        }

        DependencyBuilder builder(pipeline, config, options, ctx);
        const auto report = runGraph(
            graph.value(),
            options.jobs,
            [&](std::size_t node)
            { return builder.build(pipeline[node]); },
            ctx);

        if (!report.outcome.ok())
        {
            if (!report.failed.empty())
            {
                ctx.error("Failed: ", joinNames(report.failed));
            }
            if (!report.completed.empty())
            {
                ctx.error("Completed: ", joinNames(report.completed));
            }
            if (!report.skipped.empty())
            {
                ctx.error("Not started: ", joinNames(report.skipped));
            }
            return report.outcome;
        }

        if (options.dryRun)
        {
            ctx.log("Dry run finished, nothing was installed");
            return Outcome::success();
        }

        Outcome verified = verifyPrefix(config.prefix(), pipeline, config.arch());
        if (!verified.ok())
        {
            return verified;
        }
        ctx.log("All ", pipeline.size(), " dependencies installed into ", config.prefix().string());
        return Outcome::success();
    }

    std::vector<std::string> describeOrder(const model::Pipeline &pipeline, std::string &error)
    {
        std::vector<std::string> out;
        auto graph = DependencyGraph::build(pipeline, error);
        if (!graph.has_value())
        {
            return out;
        }

        for (std::size_t idx : graph->order())
        {
            const auto &spec = pipeline[idx];
            std::string line = spec.name + " " + spec.version;
            if (!spec.depends.empty())
            {
                line += " <- " + joinNames(spec.depends);
            }
            out.push_back(line);
        }
        return out;
    }

} // namespace muslforge::pipeline
