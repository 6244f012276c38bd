#include "image/merge.hpp"

#include <algorithm>
#include <ctime>
#include <system_error>

#include "image/assembler.hpp"
#include "io/process.hpp"
#include "model/arch.hpp"

namespace fs = std::filesystem;

namespace muslforge::image
{

    std::optional<std::vector<ArchDigest>> collectDigests(
        const fs::path &digestsDir,
        const std::vector<std::string> &platforms,
        std::string &error)
    {
        std::vector<ArchDigest> out;
        for (const auto &platform : platforms)
        {
            const fs::path dir = digestArtifactDir(digestsDir, platform);
            std::error_code ec;
            if (!fs::is_directory(dir, ec))
            {
                error = "no digest artifact for " + platform + " (" + dir.string() + ")";
                return std::nullopt;
            }

            std::vector<std::string> names;
            for (const auto &entry : fs::directory_iterator(dir, ec))
            {
                names.push_back(entry.path().filename().string());
            }
            if (ec)
            {
                error = "cannot read " + dir.string() + ": " + ec.message();
                return std::nullopt;
            }
            if (names.size() != 1)
            {
                error = "expected one digest for " + platform + ", found " + std::to_string(names.size());
                return std::nullopt;
            }
            if (!isDigestHex(names.front()))
            {
                error = "malformed digest artifact for " + platform + ": " + names.front();
                return std::nullopt;
            }
            out.push_back(ArchDigest{platform, "sha256:" + names.front()});
        }
        return out;
    }

    Outcome validateManifestList(const ManifestList &list, const std::vector<std::string> &platforms)
    {
        if (list.tags.empty())
        {
            return Outcome::failure(FailureKind::ManifestPublish, "manifest list has no tags");
        }
        for (const auto &platform : platforms)
        {
            const auto count = std::count_if(list.digests.begin(), list.digests.end(), [&](const ArchDigest &digest)
                                             { return digest.platform == platform; });
            if (count != 1)
            {
                return Outcome::failure(
                    FailureKind::MissingDigestArtifact,
                    "manifest list needs exactly one digest for " + platform);
            }
        }
        for (const auto &digest : list.digests)
        {
            if (!isValidDigest(digest.digest))
            {
                return Outcome::failure(
                    FailureKind::MissingDigestArtifact,
                    "malformed digest for " + digest.platform + ": " + digest.digest);
            }
        }
        return Outcome::success();
    }

    std::vector<std::string> manifestCreateArgs(const std::string &image, const ManifestList &list)
    {
        std::vector<std::string> args = {"buildx", "imagetools", "create"};
        for (const auto &tag : list.tags)
        {
            args.push_back("-t");
            args.push_back(tag);
        }
        for (const auto &digest : list.digests)
        {
            args.push_back(image + "@" + digest.digest);
        }
        return args;
    }

    Outcome mergeImages(const MergeRequest &request, const model::Settings &settings, const muslforge::Context &ctx)
    {
        const auto &platforms = request.platforms.empty() ? settings.platforms : request.platforms;

        // A manifest missing one of the architectures would replace the published one.
        for (model::Arch arch : model::supportedArches())
        {
            const std::string required = model::archPlatform(arch);
            if (std::find(platforms.begin(), platforms.end(), required) == platforms.end())
            {
                return Outcome::failure(
                    FailureKind::MissingDigestArtifact,
                    "no digest expected for " + required + ", a partial manifest is not published");
            }
        }

        std::string error;
        auto digests = collectDigests(request.digestsDir, platforms, error);
        if (!digests.has_value())
        {
            return Outcome::failure(FailureKind::MissingDigestArtifact, error);
        }

        const std::string date = request.date.empty() ? dateStamp(std::time(nullptr)) : request.date;
        ManifestList list;
        list.tags = imageTags(settings.image, date, request.latest);
        list.digests = digests.value();

        Outcome outcome = validateManifestList(list, platforms);
        if (!outcome.ok())
        {
            return outcome;
        }

        for (const auto &digest : list.digests)
        {
            ctx.log(digest.platform, " -> ", digest.digest);
        }

        auto created = io::runCommand(settings.tools.docker, manifestCreateArgs(settings.image, list), fs::path(), ctx, request.dryRun);
        if (created.code != 0)
        {
            return Outcome::failure(
                FailureKind::ManifestPublish,
                "imagetools create exited with " + std::to_string(created.code));
        }

        auto inspected = io::runCommand(
            settings.tools.docker,
            {"buildx", "imagetools", "inspect", list.tags.front()},
            fs::path(),
            ctx,
            request.dryRun);
        if (inspected.code != 0)
        {
            return Outcome::failure(
                FailureKind::ManifestPublish,
                "imagetools inspect of " + list.tags.front() + " exited with " + std::to_string(inspected.code));
        }

        ctx.log("Published ", list.tags.front(), " for ", platforms.size(), " platforms");
        return Outcome::success();
    }

} // namespace muslforge::image
