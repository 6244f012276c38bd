#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/specs.hpp"
#include "nlohmann/json.hpp"

namespace muslforge::model {

// Pinned dependency set of this pipeline revision.
Pipeline defaultPipeline();

std::optional<Pipeline> loadPipelineFile(const std::filesystem::path &pipelineFile, const muslforge::Context &ctx);
std::optional<Pipeline> parsePipeline(const nlohmann::json &data, const muslforge::Context &ctx);
nlohmann::json pipelineToJson(const Pipeline &pipeline);

std::filesystem::path resolveConfigFile(const std::string &explicitFile);
std::optional<Settings> loadSettings(const std::filesystem::path &configFile, const muslforge::Context &ctx);

// Pipeline named by the settings, or the built-in one.
std::optional<Pipeline> loadPipeline(const Settings &settings, const muslforge::Context &ctx);

// Drops optional dependencies named in `without`. Unknown or non-optional
// names are reported through `error`.
std::optional<Pipeline> selectDependencies(
    const Pipeline &pipeline,
    const std::vector<std::string> &without,
    std::string &error
);

} // namespace muslforge::model
