#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace muslforge::commands {

int runBuildCommand(
    const muslforge::Context &ctx,
    const std::filesystem::path &configFile,
    const std::vector<std::string> &args
);

} // namespace muslforge::commands
