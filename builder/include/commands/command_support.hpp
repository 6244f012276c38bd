#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/specs.hpp"

namespace muslforge::commands {

// Exit code for malformed command lines.
constexpr int kUsageExitCode = 1;

struct GlobalOptions {
    std::filesystem::path configFile;
    bool quiet = false;
    bool verbose = false;
};

// Pulls --config, --quiet/-q and --verbose from anywhere in `argv` (without
// the program name). The first remaining word is the command.
bool splitCommandLine(
    const std::vector<std::string> &argv,
    GlobalOptions &global,
    std::string &command,
    std::vector<std::string> &args,
    std::string &error
);

std::optional<model::Settings> loadCommandSettings(const muslforge::Context &ctx, const std::filesystem::path &configFile);

// Splits "a,b,,c" into {"a", "b", "c"}.
std::vector<std::string> splitList(const std::string &value);

// Reads the value following args[i] into out and advances i.
bool takeValue(const std::vector<std::string> &args, std::size_t &i, std::string &out, const muslforge::Context &ctx);

bool parsePositive(const std::string &option, const std::string &text, std::size_t &out, const muslforge::Context &ctx);

} // namespace muslforge::commands
