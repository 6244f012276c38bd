#include "driver/build_driver.hpp"

#include <system_error>
#include <utility>

#include <unistd.h>

#include "io/cache_lock.hpp"
#include "io/fs_utils.hpp"
#include "io/process.hpp"
#include "toolchain/toolchain_config.hpp"

namespace fs = std::filesystem;

namespace muslforge::driver
{
    namespace
    {

        constexpr const char *kAarch64CFlagsVar = "CFLAGS_aarch64_unknown_linux_musl";
        constexpr const char *kLockFileName = ".muslforge.lock";

        std::optional<std::string> nonEmpty(const std::optional<std::string> &value)
        {
            if (value.has_value() && !value->empty())
            {
                return value;
            }
            return std::nullopt;
        }

    } // namespace

    HostEnvironment captureHostEnvironment()
    {
        HostEnvironment host;
        host.rustFlags = io::environmentValue("RUSTFLAGS");
        host.aarch64CFlags = io::environmentValue(kAarch64CFlagsVar);
        host.tty = isatty(STDIN_FILENO) != 0;
        return host;
    }

    Outcome resolveArch(const std::string &requested, model::Arch &arch)
    {
        if (!requested.empty())
        {
            auto parsed = model::parseArch(requested);
            if (!parsed.has_value())
            {
                return Outcome::failure(FailureKind::UnsupportedArchitecture, "unsupported architecture: " + requested);
            }
            arch = parsed.value();
            return Outcome::success();
        }

        std::string raw;
        auto host = model::hostArch(&raw);
        if (!host.has_value())
        {
            return Outcome::failure(
                FailureKind::UnsupportedArchitecture,
                "unsupported host architecture: " + (raw.empty() ? std::string("unknown") : raw));
        }
        arch = host.value();
        return Outcome::success();
    }

    fs::path resolveCacheDir(const std::optional<std::string> &cargoHome, const std::optional<std::string> &home)
    {
        if (nonEmpty(cargoHome).has_value())
        {
            std::error_code ec;
            if (fs::is_directory(cargoHome.value(), ec))
            {
                return fs::path(cargoHome.value());
            }
        }
        if (nonEmpty(home).has_value())
        {
            return fs::path(home.value()) / ".cargo";
        }
        return fs::path(".cargo");
    }

    std::optional<DriverPlan> planDriver(
        const DriverRequest &request,
        const model::Settings &settings,
        const HostEnvironment &host,
        Outcome &outcome)
    {
        DriverPlan plan;
        outcome = resolveArch(request.arch, plan.arch);
        if (!outcome.ok())
        {
            return std::nullopt;
        }

        std::error_code ec;
        plan.source = fs::weakly_canonical(request.source.empty() ? fs::current_path(ec) : request.source, ec);
        if (ec || !fs::is_directory(plan.source, ec))
        {
            outcome = Outcome::failure(FailureKind::InvalidConfiguration, "source directory not found: " + request.source.string());
            return std::nullopt;
        }

        plan.image = request.image.empty() ? settings.image + ":latest" : request.image;
        plan.cacheDir = resolveCacheDir(io::environmentValue("CARGO_HOME"), io::environmentValue("HOME"));
        plan.workdir = settings.driver.workdir.empty() ? "/build/" + plan.source.filename().string() : settings.driver.workdir;
        plan.registry = settings.driver.registry;
        plan.command = settings.driver.command;
        if (plan.command.empty())
        {
            outcome = Outcome::failure(FailureKind::InvalidConfiguration, "driver command is empty");
            return std::nullopt;
        }
        plan.host = host;
        outcome = Outcome::success();
        return plan;
    }

    std::vector<std::pair<std::string, std::string>> forwardedEnvironment(const DriverPlan &plan)
    {
        std::vector<std::pair<std::string, std::string>> out;
        if (plan.host.rustFlags.has_value())
        {
            out.emplace_back("RUSTFLAGS", plan.host.rustFlags.value());
        }
        if (plan.arch == model::Arch::Aarch64)
        {
            const std::string value = plan.host.aarch64CFlags.has_value()
                                          ? plan.host.aarch64CFlags.value()
                                          : toolchain::joinFlags(toolchain::archFlagOverlay(plan.arch));
            out.emplace_back(kAarch64CFlagsVar, value);
        }
        return out;
    }

    std::vector<std::string> dockerRunArgs(const DriverPlan &plan)
    {
        std::vector<std::string> args = {"run", "--platform", model::archPlatform(plan.arch)};
        args.push_back(plan.host.tty ? "-it" : "-i");
        args.push_back("--rm");
        args.push_back("-v");
        args.push_back((plan.cacheDir / "registry").string() + ":" + plan.registry);
        args.push_back("-v");
        args.push_back(plan.source.string() + ":" + plan.workdir);
        args.push_back("--workdir");
        args.push_back(plan.workdir);
        for (const auto &[key, value] : forwardedEnvironment(plan))
        {
            args.push_back("-e");
            args.push_back(key + "=" + value);
        }
        args.push_back(plan.image);
        args.insert(args.end(), plan.command.begin(), plan.command.end());
        args.push_back("--target");
        args.push_back(model::archRustTarget(plan.arch));
        return args;
    }

    Outcome runDriver(const DriverRequest &request, const model::Settings &settings, const muslforge::Context &ctx)
    {
        Outcome outcome;
        auto plan = planDriver(request, settings, captureHostEnvironment(), outcome);
        if (!plan.has_value())
        {
            return outcome;
        }

        ctx.log("Building ", plan->source.string(), " for ", model::archRustTarget(plan->arch), " in ", plan->image);

        io::CacheLock lock;
        if (!request.dryRun)
        {
            if (!io::ensureDir(plan->cacheDir / "registry"))
            {
                return Outcome::failure(FailureKind::InvalidConfiguration, "cannot create " + (plan->cacheDir / "registry").string());
            }
            std::string error;
            ctx.debug("Waiting for cache lock ", (plan->cacheDir / kLockFileName).string());
            if (!lock.acquire(plan->cacheDir / kLockFileName, true, error))
            {
                return Outcome::failure(FailureKind::InvalidConfiguration, error);
            }
        }

        auto result = io::runCommand(settings.tools.docker, dockerRunArgs(plan.value()), fs::path(), ctx, request.dryRun);
        if (result.code != 0)
        {
            return Outcome::failure(
                FailureKind::Compile,
                "build container exited with " + std::to_string(result.code));
        }
        return Outcome::success();
    }

} // namespace muslforge::driver
