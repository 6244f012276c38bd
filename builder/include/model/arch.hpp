#pragma once

#include <optional>
#include <string>
#include <vector>

namespace muslforge::model {

enum class Arch {
    X86_64,
    Aarch64
};

// Accepts x86_64/amd64, aarch64/arm64 and the linux/<arch> platform form.
std::optional<Arch> parseArch(const std::string &value);
std::optional<Arch> hostArch(std::string *rawName = nullptr);

std::string archName(Arch arch);
std::string archPlatform(Arch arch);
std::string archTriple(Arch arch);
std::string archRustTarget(Arch arch);
std::string platformSlug(const std::string &platform);

std::vector<Arch> supportedArches();

} // namespace muslforge::model
