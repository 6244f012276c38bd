#include "toolchain/toolchain_config.hpp"

#include <algorithm>
#include <sstream>
#include <thread>

#include "io/process.hpp"

namespace fs = std::filesystem;

namespace muslforge::toolchain
{
    namespace
    {

        void appendUnique(std::vector<std::string> &list, const std::string &value)
        {
            if (value.empty())
            {
                return;
            }
            if (std::find(list.begin(), list.end(), value) == list.end())
            {
                list.push_back(value);
            }
        }

        std::string rustTargetEnvSuffix(model::Arch arch)
        {
            std::string out = model::archRustTarget(arch);
            std::replace(out.begin(), out.end(), '-', '_');
            return out;
        }

        std::string dockerQuote(const std::string &value)
        {
            std::string out = "\"";
            for (char ch : value)
            {
                if (ch == '"' || ch == '\\' || ch == '$')
                {
                    out.push_back('\\');
                }
                out.push_back(ch);
            }
            out.push_back('"');
            return out;
        }

    } // namespace

    std::vector<std::string> archFlagOverlay(model::Arch arch)
    {
        if (arch == model::Arch::Aarch64)
        {
            // Outline atomics need libgcc helpers that musl static links lack.
            return {"-mno-outline-atomics"};
        }
        return {};
    }

    ToolchainConfig makeToolchainConfig(
        model::Arch arch,
        const fs::path &prefix,
        const model::ToolchainSettings &settings,
        std::size_t makeJobs)
    {
        ToolchainConfig config;
        config.arch_ = arch;
        config.triple_ = model::archTriple(arch);
        config.cc_ = settings.cc;
        config.cxx_ = settings.cxx;
        config.ar_ = settings.ar;
        config.ranlib_ = settings.ranlib;
        config.prefix_ = prefix;
        config.includeDirs_ = {prefix / "include"};
        config.libDirs_ = {prefix / "lib"};
        config.staticLinkFlags_ = {"-static"};
        config.optFlags_ = settings.optFlags;

        for (const auto &flag : archFlagOverlay(arch))
        {
            appendUnique(config.archFlags_, flag);
        }
        auto extra = settings.archFlags.find(model::archName(arch));
        if (extra != settings.archFlags.end())
        {
            for (const auto &flag : extra->second)
            {
                appendUnique(config.archFlags_, flag);
            }
        }

        if (makeJobs == 0)
        {
            makeJobs = std::max(1U, std::thread::hardware_concurrency());
        }
        config.makeJobs_ = makeJobs;
        return config;
    }

    fs::path ToolchainConfig::pkgConfigDir() const
    {
        return prefix_ / "lib" / "pkgconfig";
    }

    std::vector<std::string> ToolchainConfig::cflags() const
    {
        std::vector<std::string> out = optFlags_;
        out.push_back("-fPIC");
        for (const auto &dir : includeDirs_)
        {
            out.push_back("-I" + dir.string());
        }
        out.insert(out.end(), archFlags_.begin(), archFlags_.end());
        return out;
    }

    std::vector<std::string> ToolchainConfig::ldflags() const
    {
        std::vector<std::string> out;
        for (const auto &dir : libDirs_)
        {
            out.push_back("-L" + dir.string());
        }
        out.insert(out.end(), staticLinkFlags_.begin(), staticLinkFlags_.end());
        return out;
    }

    Environment ToolchainConfig::environment() const
    {
        const std::string cflagsText = joinFlags(cflags());
        const std::string pkgDir = pkgConfigDir().string();

        Environment env;
        env["CC"] = cc_;
        env["CXX"] = cxx_;
        env["AR"] = ar_;
        env["RANLIB"] = ranlib_;
        env["CFLAGS"] = cflagsText;
        env["CXXFLAGS"] = cflagsText;
        env["LDFLAGS"] = joinFlags(ldflags());
        env["PKG_CONFIG_PATH"] = pkgDir;
        env["PKG_CONFIG_LIBDIR"] = pkgDir;
        env["PKG_CONFIG_ALLOW_CROSS"] = "1";
        env["OPENSSL_DIR"] = prefix_.string();
        env["OPENSSL_STATIC"] = "1";
        return env;
    }

    Environment ToolchainConfig::imageEnvironment() const
    {
        const std::string pkgDir = pkgConfigDir().string();

        Environment env;
        env["CC"] = cc_;
        env["MUSL_DIR"] = prefix_.string();
        env["CFLAGS"] = "-I" + (prefix_ / "include").string();
        env["LDFLAGS"] = "-L" + (prefix_ / "lib").string();
        env["OPENSSL_DIR"] = prefix_.string();
        env["OPENSSL_STATIC"] = "1";
        env["TARGET_PKG_CONFIG_PATH"] = pkgDir;
        env["FFMPEG_PKG_CONFIG_PATH"] = pkgDir;
        env["TARGET_PKG_CONFIG_ALLOW_CROSS"] = "1";
        env["RUSTFLAGS"] = "-Copt-level=s -Clink-arg=-s";
        env["BINDGEN_EXTRA_CLANG_ARGS"] = "-I/usr/include/" + model::archName(arch_) + "-linux-musl";
        if (!archFlags_.empty())
        {
            env["CFLAGS_" + rustTargetEnvSuffix(arch_)] = joinFlags(archFlags_);
        }
        return env;
    }

    std::string joinFlags(const std::vector<std::string> &flags)
    {
        std::string out;
        for (const auto &flag : flags)
        {
            if (flag.empty())
            {
                continue;
            }
            if (!out.empty())
            {
                out.push_back(' ');
            }
            out += flag;
        }
        return out;
    }

    std::string formatEnvironment(const Environment &env, EnvFormat format)
    {
        std::ostringstream out;
        for (const auto &[key, value] : env)
        {
            if (format == EnvFormat::Docker)
            {
                out << "ENV " << key << '=' << dockerQuote(value) << '\n';
            }
            else
            {
                out << "export " << key << '=' << io::shellQuote(value) << '\n';
            }
        }
        return out.str();
    }

} // namespace muslforge::toolchain
