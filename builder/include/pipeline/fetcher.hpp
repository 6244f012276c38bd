#pragma once

#include "core/context.hpp"
#include "core/failure.hpp"
#include "model/specs.hpp"
#include "pipeline/recipe.hpp"

namespace muslforge::pipeline {

struct FetchOptions {
    bool requireChecksums = false;
    bool dryRun = false;
};

// Downloads the pinned archive once; any error aborts, there is no retry.
Outcome fetchSource(
    const model::DependencySpec &spec,
    const StepPaths &paths,
    const model::Tools &tools,
    const FetchOptions &options,
    const muslforge::Context &ctx
);

Outcome verifyChecksum(
    const model::DependencySpec &spec,
    const std::filesystem::path &archive,
    const model::Tools &tools,
    const muslforge::Context &ctx
);

// Unpacks into a fresh extract root and checks the expected source directory.
Outcome extractArchive(
    const model::DependencySpec &spec,
    const StepPaths &paths,
    const model::Tools &tools,
    bool dryRun,
    const muslforge::Context &ctx
);

} // namespace muslforge::pipeline
