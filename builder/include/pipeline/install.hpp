#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/failure.hpp"
#include "model/specs.hpp"

namespace muslforge::pipeline {

struct InstallRecord {
    std::string name;
    std::string version;
    std::string arch;
    std::vector<std::string> files;
};

std::filesystem::path installRecordPath(const std::filesystem::path &prefix, const std::string &name);
std::optional<InstallRecord> readInstallRecord(const std::filesystem::path &prefix, const std::string &name);
bool writeInstallRecord(const std::filesystem::path &prefix, const InstallRecord &record);

// Rewrites `token` to `token + append` in the source tree. Already patched
// files are left alone.
Outcome applyLinkPatch(const std::filesystem::path &sourceDir, const model::LinkPatch &patch);
Outcome checkLinkPatchInstalled(const std::filesystem::path &installedPrefix, const model::LinkPatch &patch);

// Renames liblibfoo.a to libfoo.a below root. Returns the new names.
std::vector<std::filesystem::path> stripRedundantLibPrefix(const std::filesystem::path &root, std::string &error);
std::vector<std::filesystem::path> findRedundantLibPrefix(const std::filesystem::path &root);

std::vector<std::filesystem::path> findSharedObjects(const std::filesystem::path &root);

// Names of discovery metadata files of spec missing from the prefix.
std::vector<std::string> missingDiscoveryMetadata(const std::filesystem::path &prefix, const model::DependencySpec &spec);

// Moves every file of stagedPrefix into prefix, one atomic rename per file.
Outcome promoteStage(
    const std::filesystem::path &stagedPrefix,
    const std::filesystem::path &prefix,
    std::vector<std::string> &files
);

// Every dependency of the pipeline has its record and discovery metadata.
Outcome verifyPrefix(const std::filesystem::path &prefix, const model::Pipeline &pipeline, model::Arch arch);

} // namespace muslforge::pipeline
