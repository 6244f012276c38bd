#include "commands/image_command.hpp"

#include "commands/command_support.hpp"
#include "core/failure.hpp"
#include "driver/build_driver.hpp"
#include "image/assembler.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;

namespace muslforge::commands
{
    namespace
    {

        struct ImageOptions
        {
            std::string arch;
            std::string image;
            std::string date;
            std::string contextDir;
            std::string digestsDir;
            std::string executable;
            std::string pipelineFile;
            std::vector<std::string> without;
            bool latest = false;
            bool push = false;
            bool dryRun = false;
        };

        bool parseOptions(const std::vector<std::string> &args, ImageOptions &opt, const muslforge::Context &ctx)
        {
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--latest")
                {
                    opt.latest = true;
                    continue;
                }
                if (arg == "--push")
                {
                    opt.push = true;
                    continue;
                }
                if (arg == "--dry-run")
                {
                    opt.dryRun = true;
                    continue;
                }

                std::string *target = nullptr;
                if (arg == "--arch")
                {
                    target = &opt.arch;
                }
                else if (arg == "--image")
                {
                    target = &opt.image;
                }
                else if (arg == "--date")
                {
                    target = &opt.date;
                }
                else if (arg == "--context")
                {
                    target = &opt.contextDir;
                }
                else if (arg == "--digests")
                {
                    target = &opt.digestsDir;
                }
                else if (arg == "--binary")
                {
                    target = &opt.executable;
                }
                else if (arg == "--pipeline")
                {
                    target = &opt.pipelineFile;
                }
                if (target != nullptr)
                {
                    if (!takeValue(args, i, *target, ctx))
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

                ctx.error("Unknown image option: ", arg);
                return false;
            }
            return true;
        }

    } // namespace

    int runImageCommand(const muslforge::Context &ctx, const fs::path &configFile, const std::vector<std::string> &args)
    {
        ImageOptions opt;
        if (!parseOptions(args, opt, ctx))
        {
            return kUsageExitCode;
        }

        auto settings = loadCommandSettings(ctx, configFile);
        if (!settings.has_value())
        {
            return exitCodeFor(FailureKind::InvalidConfiguration);
        }
        if (!opt.image.empty())
        {
            settings->image = opt.image;
        }
        if (!opt.pipelineFile.empty())
        {
            settings->pipelineFile = fs::absolute(opt.pipelineFile);
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

        image::ImageRequest request;
        Outcome outcome = driver::resolveArch(opt.arch, request.arch);
        if (!outcome.ok())
        {
            return reportOutcome(ctx, outcome);
        }
        request.date = opt.date;
        request.latest = opt.latest;
        request.push = opt.push;
        request.dryRun = opt.dryRun;
        request.executable = opt.executable;
        request.contextDir = opt.contextDir.empty()
                                 ? fs::absolute("image-context") / model::archName(request.arch)
                                 : fs::absolute(opt.contextDir);
        if (!opt.digestsDir.empty())
        {
            request.digestsDir = opt.digestsDir;
        }

        ctx.log("Image: ", settings->image, " (", model::archPlatform(request.arch), ")");
        return reportOutcome(ctx, image::assembleImage(request, settings.value(), selected.value(), ctx));
    }

} // namespace muslforge::commands
