#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace muslforge::io {

bool ensureDir(const std::filesystem::path &path);
bool removePath(const std::filesystem::path &path, bool dryRun, const muslforge::Context &ctx);

std::optional<std::string> readTextFile(const std::filesystem::path &path);
bool writeTextFile(const std::filesystem::path &path, const std::string &content);

// Regular files below root, relative to it, sorted.
std::vector<std::filesystem::path> listFilesRecursive(const std::filesystem::path &root);

// Copies to a temporary sibling and renames over the destination.
bool replaceFileAtomically(
    const std::filesystem::path &source,
    const std::filesystem::path &destination,
    std::error_code &ec
);

std::vector<std::string> tailLines(const std::filesystem::path &path, std::size_t count);

} // namespace muslforge::io
