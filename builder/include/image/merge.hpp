#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/failure.hpp"
#include "image/digest.hpp"
#include "model/specs.hpp"

namespace muslforge::image {

struct ManifestList {
    std::vector<std::string> tags;
    std::vector<ArchDigest> digests;
};

struct MergeRequest {
    std::filesystem::path digestsDir = "digests";
    std::vector<std::string> platforms;
    std::string date;
    bool latest = true;
    bool dryRun = false;
};

// One digest per expected platform, in the order of `platforms`.
std::optional<std::vector<ArchDigest>> collectDigests(
    const std::filesystem::path &digestsDir,
    const std::vector<std::string> &platforms,
    std::string &error
);

// Every platform present exactly once, every digest well formed.
Outcome validateManifestList(const ManifestList &list, const std::vector<std::string> &platforms);

std::vector<std::string> manifestCreateArgs(const std::string &image, const ManifestList &list);

Outcome mergeImages(const MergeRequest &request, const model::Settings &settings, const muslforge::Context &ctx);

} // namespace muslforge::image
