#include "pipeline/fetcher.hpp"

#include <system_error>

#include "io/fs_utils.hpp"
#include "io/process.hpp"

namespace fs = std::filesystem;

namespace muslforge::pipeline
{

    Outcome fetchSource(
        const model::DependencySpec &spec,
        const StepPaths &paths,
        const model::Tools &tools,
        const FetchOptions &options,
        const muslforge::Context &ctx)
    {
        if (spec.sha256.empty())
        {
            if (options.requireChecksums)
            {
                return Outcome::failure(FailureKind::Fetch, "no sha256 pinned for " + spec.name);
            }
            ctx.warn("No sha256 pinned for ", spec.name, ", archive is not verified");
        }

        const std::string url = model::resolvedUrl(spec);
        const fs::path partial = paths.archive.string() + ".part";

        if (!options.dryRun && !io::ensureDir(paths.downloads))
        {
            return Outcome::failure(FailureKind::Fetch, "cannot create " + paths.downloads.string());
        }

        std::error_code ec;
        fs::remove(partial, ec);

        ctx.log("Fetch ", spec.name, " ", spec.version, " <- ", url);
        io::ProcessOptions processOptions;
        processOptions.dryRun = options.dryRun;
        auto result = io::runCommand(
            tools.curl,
            {"--fail", "--location", "--silent", "--show-error", "--output", partial.string(), url},
            processOptions,
            ctx);
        if (result.code != 0)
        {
            fs::remove(partial, ec);
            return Outcome::failure(
                FailureKind::Fetch,
                "download of " + url + " failed with exit code " + std::to_string(result.code));
        }
        if (options.dryRun)
        {
            return Outcome::success();
        }

        fs::rename(partial, paths.archive, ec);
        if (ec)
        {
            return Outcome::failure(FailureKind::Fetch, "cannot store " + paths.archive.string() + ": " + ec.message());
        }

        if (!spec.sha256.empty())
        {
            return verifyChecksum(spec, paths.archive, tools, ctx);
        }
        return Outcome::success();
    }

    Outcome verifyChecksum(
        const model::DependencySpec &spec,
        const fs::path &archive,
        const model::Tools &tools,
        const muslforge::Context &ctx)
    {
        const fs::path checkList = archive.string() + ".sha256";
        if (!io::writeTextFile(checkList, spec.sha256 + "  " + archive.filename().string() + "\n"))
        {
            return Outcome::failure(FailureKind::Fetch, "cannot write " + checkList.string());
        }

        auto result = io::runCommand(
            tools.sha256sum,
            {"--check", "--status", checkList.filename().string()},
            archive.parent_path(),
            ctx);
        if (result.code != 0)
        {
            return Outcome::failure(FailureKind::Fetch, "sha256 mismatch for " + archive.string());
        }
        ctx.log("Verified sha256 of ", archive.filename().string());
        return Outcome::success();
    }

    Outcome extractArchive(
        const model::DependencySpec &spec,
        const StepPaths &paths,
        const model::Tools &tools,
        bool dryRun,
        const muslforge::Context &ctx)
    {
        if (!dryRun)
        {
            std::error_code ec;
            fs::remove_all(paths.extractRoot, ec);
            if (ec || !io::ensureDir(paths.extractRoot))
            {
                return Outcome::failure(FailureKind::Extract, "cannot prepare " + paths.extractRoot.string());
            }
        }

        io::ProcessResult result;
        if (spec.format == model::ArchiveFormat::Zip)
        {
            result = io::runCommand(
                tools.unzip,
                {"-q", "-o", paths.archive.string(), "-d", paths.extractRoot.string()},
                {},
                ctx,
                dryRun);
        }
        else
        {
            result = io::runCommand(
                tools.tar,
                {"-xf", paths.archive.string(), "-C", paths.extractRoot.string()},
                {},
                ctx,
                dryRun);
        }

        if (result.code != 0)
        {
            return Outcome::failure(
                FailureKind::Extract,
                "cannot unpack " + paths.archive.string() + " (exit code " + std::to_string(result.code) + ")");
        }

        std::error_code ec;
        if (!dryRun && !fs::is_directory(paths.sourceDir, ec))
        {
            return Outcome::failure(
                FailureKind::Extract,
                "archive of " + spec.name + " did not unpack to " + paths.sourceDir.filename().string());
        }
        return Outcome::success();
    }

} // namespace muslforge::pipeline
