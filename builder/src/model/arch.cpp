#include "model/arch.hpp"

#include <algorithm>
#include <cctype>

#include <sys/utsname.h>

namespace muslforge::model
{
    namespace
    {

        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

    } // namespace

    std::optional<Arch> parseArch(const std::string &value)
    {
        std::string key = lower(value);
        if (key.rfind("linux/", 0) == 0)
        {
            key = key.substr(6);
        }

        if (key == "x86_64" || key == "amd64")
        {
            return Arch::X86_64;
        }
        if (key == "aarch64" || key == "arm64")
        {
            return Arch::Aarch64;
        }
        return std::nullopt;
    }

    std::optional<Arch> hostArch(std::string *rawName)
    {
        struct utsname info
        {
        };
        if (uname(&info) != 0)
        {
            return std::nullopt;
        }
        if (rawName != nullptr)
        {
            *rawName = info.machine;
        }
        return parseArch(info.machine);
    }

    std::string archName(Arch arch)
    {
        return arch == Arch::Aarch64 ? "aarch64" : "x86_64";
    }

    std::string archPlatform(Arch arch)
    {
        return arch == Arch::Aarch64 ? "linux/arm64" : "linux/amd64";
    }

    std::string archTriple(Arch arch)
    {
        return archName(arch) + "-linux-musl";
    }

    std::string archRustTarget(Arch arch)
    {
        return archName(arch) + "-unknown-linux-musl";
    }

    std::string platformSlug(const std::string &platform)
    {
        std::string out = platform;
        std::replace(out.begin(), out.end(), '/', '_');
        return out;
    }

    std::vector<Arch> supportedArches()
    {
        return {Arch::X86_64, Arch::Aarch64};
    }

} // namespace muslforge::model
