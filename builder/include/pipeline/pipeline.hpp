#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/failure.hpp"
#include "model/specs.hpp"
#include "toolchain/toolchain_config.hpp"

namespace muslforge::pipeline {

struct PipelineOptions {
    std::filesystem::path workDir = "/build";
    std::size_t jobs = 1;
    bool requireChecksums = false;
    bool rebuild = false;
    bool clean = false;
    bool dryRun = false;
    // Child output goes to <work>/logs/<name>.log instead of the terminal.
    bool captureLogs = false;
    model::Tools tools;
};

// Builds every dependency of `pipeline` into config.prefix(). A dependency
// is promoted into the prefix only after it installed completely.
Outcome runPipeline(
    const model::Pipeline &pipeline,
    const toolchain::ToolchainConfig &config,
    const PipelineOptions &options,
    const muslforge::Context &ctx
);

// Resolved build order, one "name version <- requirements" line each.
std::vector<std::string> describeOrder(const model::Pipeline &pipeline, std::string &error);

} // namespace muslforge::pipeline
