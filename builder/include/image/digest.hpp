#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "core/failure.hpp"

namespace muslforge::image {

// Content digest of one platform's image, "sha256:<hex>".
struct ArchDigest {
    std::string platform;
    std::string digest;
};

bool isValidDigest(const std::string &digest);
bool isDigestHex(const std::string &hex);
std::string digestHex(const std::string &digest);

// <digests>/digest-<platform slug>
std::filesystem::path digestArtifactDir(const std::filesystem::path &digestsDir, const std::string &platform);

// Writes the digest as an empty file named after its hex value, replacing
// whatever the platform directory held before.
Outcome exportDigest(const std::filesystem::path &digestsDir, const ArchDigest &digest);

// Reads "containerimage.digest" from a buildx metadata file.
std::optional<std::string> readMetadataDigest(const std::filesystem::path &metadataFile);

} // namespace muslforge::image
