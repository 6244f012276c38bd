#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace muslforge::io {

// Throws std::runtime_error naming `origin` when the text is not a JSON object.
nlohmann::json parseJsonObject(const std::string &text, const std::string &origin);
nlohmann::json loadJsonFile(const std::filesystem::path &path);

// Writes through a temporary sibling renamed over `path`.
bool writeJsonFile(const std::filesystem::path &path, const nlohmann::json &data);

std::vector<std::string> splitFlags(const std::string &text);

} // namespace muslforge::io
