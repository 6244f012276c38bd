#include "commands/merge_command.hpp"

#include "commands/command_support.hpp"
#include "core/failure.hpp"
#include "image/merge.hpp"
#include "model/arch.hpp"

namespace fs = std::filesystem;

namespace muslforge::commands
{
    namespace
    {

        struct MergeOptions
        {
            std::string image;
            std::string date;
            std::string digestsDir;
            std::vector<std::string> platforms;
            bool latest = true;
            bool dryRun = false;
        };

        bool parseOptions(const std::vector<std::string> &args, MergeOptions &opt, const muslforge::Context &ctx)
        {
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--no-latest")
                {
                    opt.latest = false;
                    continue;
                }
                if (arg == "--dry-run")
                {
                    opt.dryRun = true;
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
                if (arg == "--date")
                {
                    if (!takeValue(args, i, opt.date, ctx))
                    {
                        return false;
                    }
                    continue;
                }
                if (arg == "--digests")
                {
                    if (!takeValue(args, i, opt.digestsDir, ctx))
                    {
                        return false;
                    }
                    continue;
                }
                if (arg == "--platforms")
                {
                    std::string value;
                    if (!takeValue(args, i, value, ctx))
                    {
                        return false;
                    }
                    for (const auto &item : splitList(value))
                    {
                        const auto arch = model::parseArch(item);
                        if (!arch.has_value())
                        {
                            ctx.error("Unsupported platform: ", item);
                            return false;
                        }
                        opt.platforms.push_back(model::archPlatform(arch.value()));
                    }
                    continue;
                }

                ctx.error("Unknown merge option: ", arg);
                return false;
            }
            return true;
        }

    } // namespace

    int runMergeCommand(const muslforge::Context &ctx, const fs::path &configFile, const std::vector<std::string> &args)
    {
        MergeOptions opt;
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

        image::MergeRequest request;
        request.platforms = opt.platforms;
        request.date = opt.date;
        request.latest = opt.latest;
        request.dryRun = opt.dryRun;
        if (!opt.digestsDir.empty())
        {
            request.digestsDir = opt.digestsDir;
        }

        return reportOutcome(ctx, image::mergeImages(request, settings.value(), ctx));
    }

} // namespace muslforge::commands
