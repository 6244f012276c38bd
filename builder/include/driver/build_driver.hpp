#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/failure.hpp"
#include "model/arch.hpp"
#include "model/specs.hpp"

namespace muslforge::driver {

// Host state forwarded into the build container.
struct HostEnvironment {
    std::optional<std::string> rustFlags;
    std::optional<std::string> aarch64CFlags;
    bool tty = false;
};

HostEnvironment captureHostEnvironment();

struct DriverRequest {
    // Empty selects the host architecture.
    std::string arch;
    std::filesystem::path source;
    std::string image;
    bool dryRun = false;
};

struct DriverPlan {
    model::Arch arch = model::Arch::X86_64;
    std::string image;
    std::filesystem::path cacheDir;
    std::filesystem::path source;
    std::string workdir;
    std::string registry;
    std::vector<std::string> command;
    HostEnvironment host;
};

Outcome resolveArch(const std::string &requested, model::Arch &arch);

// $CARGO_HOME when it names a directory, else $HOME/.cargo.
std::filesystem::path resolveCacheDir(
    const std::optional<std::string> &cargoHome,
    const std::optional<std::string> &home
);

std::optional<DriverPlan> planDriver(
    const DriverRequest &request,
    const model::Settings &settings,
    const HostEnvironment &host,
    Outcome &outcome
);

// Environment variables passed with -e, in order.
std::vector<std::pair<std::string, std::string>> forwardedEnvironment(const DriverPlan &plan);
std::vector<std::string> dockerRunArgs(const DriverPlan &plan);

Outcome runDriver(const DriverRequest &request, const model::Settings &settings, const muslforge::Context &ctx);

} // namespace muslforge::driver
