#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "model/specs.hpp"
#include "toolchain/toolchain_config.hpp"

namespace muslforge::pipeline {

struct Command {
    std::string program;
    std::vector<std::string> args;
    std::filesystem::path cwd;
    toolchain::Environment env;
};

// Scratch locations of one dependency inside the work directory.
struct StepPaths {
    std::filesystem::path downloads;
    std::filesystem::path archive;
    std::filesystem::path extractRoot;
    std::filesystem::path sourceDir;
    std::filesystem::path buildDir;
    std::filesystem::path stageDir;
    std::filesystem::path logFile;

    // The prefix as seen inside the stage (DESTDIR + prefix).
    std::filesystem::path stagedPrefix(const std::filesystem::path &prefix) const;
};

StepPaths stepPaths(const std::filesystem::path &workDir, const model::DependencySpec &spec);

struct StepPlan {
    std::vector<Command> configure;
    std::vector<Command> compile;
    std::vector<Command> install;
};

StepPlan planStep(
    const model::DependencySpec &spec,
    const toolchain::ToolchainConfig &config,
    const StepPaths &paths,
    const model::Tools &tools
);

} // namespace muslforge::pipeline
