#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/failure.hpp"
#include "nlohmann/json.hpp"
#include "model/specs.hpp"
#include "toolchain/toolchain_config.hpp"

namespace muslforge::image {

struct ImageRequest {
    model::Arch arch = model::Arch::X86_64;
    std::string date;
    bool latest = false;
    bool push = false;
    bool dryRun = false;
    std::filesystem::path contextDir;
    std::filesystem::path digestsDir = "digests";
    // muslforge binary copied into the context; must run on the target platform.
    std::filesystem::path executable;
};

// YYYYMMDD in UTC.
std::string dateStamp(std::time_t now);
std::vector<std::string> imageTags(const std::string &image, const std::string &date, bool latest);

std::string renderDockerfile(
    const model::Settings &settings,
    const toolchain::ToolchainConfig &config
);

// Configuration handed to the muslforge run inside the builder stage.
nlohmann::json contextConfig(const model::Settings &settings);

Outcome writeBuildContext(
    const ImageRequest &request,
    const model::Settings &settings,
    const model::Pipeline &pipeline,
    const toolchain::ToolchainConfig &config,
    const muslforge::Context &ctx
);

Outcome assembleImage(
    const ImageRequest &request,
    const model::Settings &settings,
    const model::Pipeline &pipeline,
    const muslforge::Context &ctx
);

} // namespace muslforge::image
