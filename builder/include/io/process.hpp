#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace muslforge::io {

struct ProcessResult {
    int code = -1;
    std::string commandLine;
    long long processId = -1;
};

struct ProcessOptions {
    std::filesystem::path cwd;
    // Merged over the parent environment; an empty value still overrides.
    std::map<std::string, std::string> env;
    // When set, stdout and stderr of the child are appended to this file.
    std::filesystem::path logFile;
    bool dryRun = false;
};

std::string shellQuote(const std::string &value);
std::string displayCommand(const std::string &command, const std::vector<std::string> &args);

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const muslforge::Context &ctx,
    bool dryRun = false
);
ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const ProcessOptions &options,
    const muslforge::Context &ctx
);
std::optional<std::string> environmentValue(const std::string &name);
std::optional<std::filesystem::path> currentExecutablePath();

} // namespace muslforge::io
