#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "model/arch.hpp"
#include "model/specs.hpp"

namespace muslforge::toolchain {

using Environment = std::map<std::string, std::string>;

// Architecture specific compiler flags, empty for architectures needing none.
std::vector<std::string> archFlagOverlay(model::Arch arch);

class ToolchainConfig;

// makeJobs of 0 uses the hardware concurrency.
ToolchainConfig makeToolchainConfig(
    model::Arch arch,
    const std::filesystem::path &prefix,
    const model::ToolchainSettings &settings,
    std::size_t makeJobs = 0
);

// Cross-compilation settings of one pipeline run. Only makeToolchainConfig
// builds one and nothing mutates it afterwards.
class ToolchainConfig {
public:
    model::Arch arch() const { return arch_; }
    const std::string &triple() const { return triple_; }
    const std::string &cc() const { return cc_; }
    const std::string &cxx() const { return cxx_; }
    const std::string &ar() const { return ar_; }
    const std::string &ranlib() const { return ranlib_; }
    const std::filesystem::path &prefix() const { return prefix_; }
    const std::vector<std::filesystem::path> &includeDirs() const { return includeDirs_; }
    const std::vector<std::filesystem::path> &libDirs() const { return libDirs_; }
    const std::vector<std::string> &staticLinkFlags() const { return staticLinkFlags_; }
    const std::vector<std::string> &archFlags() const { return archFlags_; }
    const std::vector<std::string> &optFlags() const { return optFlags_; }
    std::size_t makeJobs() const { return makeJobs_; }

    std::filesystem::path pkgConfigDir() const;
    std::vector<std::string> cflags() const;
    std::vector<std::string> ldflags() const;

    // Variables every build step runs with.
    Environment environment() const;
    // Variables baked into the builder image for application builds.
    Environment imageEnvironment() const;

private:
    friend ToolchainConfig makeToolchainConfig(
        model::Arch arch,
        const std::filesystem::path &prefix,
        const model::ToolchainSettings &settings,
        std::size_t makeJobs
    );

    ToolchainConfig() = default;

    model::Arch arch_ = model::Arch::X86_64;
    std::string triple_;
    std::string cc_;
    std::string cxx_;
    std::string ar_;
    std::string ranlib_;
    std::filesystem::path prefix_;
    std::vector<std::filesystem::path> includeDirs_;
    std::vector<std::filesystem::path> libDirs_;
    std::vector<std::string> staticLinkFlags_;
    std::vector<std::string> archFlags_;
    std::vector<std::string> optFlags_;
    std::size_t makeJobs_ = 1;
};

std::string joinFlags(const std::vector<std::string> &flags);

enum class EnvFormat {
    Shell,
    Docker
};

// One line per variable: `export K='V'` or `ENV K="V"`.
std::string formatEnvironment(const Environment &env, EnvFormat format);

} // namespace muslforge::toolchain
