#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "model/arch.hpp"

namespace muslforge::model {

enum class ArchiveFormat {
    TarGz,
    TarXz,
    Zip
};

enum class BuildSystem {
    Configure,
    CMake
};

// Appends `append` after `token` in a source file before configure.
// `installed` names the file under the prefix that must carry the result.
struct LinkPatch {
    std::string file;
    std::string token;
    std::string append;
    std::string installed;
};

struct DependencySpec {
    std::string name;
    std::string version;
    int position = 0;

    std::string url;
    std::string archive;
    std::string sourceDir;
    ArchiveFormat format = ArchiveFormat::TarGz;
    std::string sha256;

    BuildSystem system = BuildSystem::Configure;
    std::string configureScript = "configure";
    std::string installTarget = "install";
    std::vector<std::string> args;
    std::map<std::string, std::vector<std::string>> archArgs;

    std::vector<std::string> depends;
    std::vector<std::string> pkgConfig;
    bool optional = false;

    std::vector<LinkPatch> linkPatches;
    bool stripLibPrefix = false;
};

using Pipeline = std::vector<DependencySpec>;

struct Tools {
    std::string curl = "curl";
    std::string sha256sum = "sha256sum";
    std::string tar = "tar";
    std::string unzip = "unzip";
    std::string make = "make";
    std::string cmake = "cmake";
    std::string docker = "docker";
};

struct ToolchainSettings {
    std::string cc = "musl-gcc";
    std::string cxx = "g++";
    std::string ar = "ar";
    std::string ranlib = "ranlib";
    std::vector<std::string> optFlags = {"-O2"};
    std::map<std::string, std::vector<std::string>> archFlags;
};

struct DriverSettings {
    std::string registry = "/usr/local/cargo/registry";
    std::string workdir;
    std::vector<std::string> command = {"cargo", "build", "--release"};
};

struct Settings {
    std::string image = "ghcr.io/nanpuyue/avatar-bot-builder";
    std::vector<std::string> platforms = {"linux/amd64", "linux/arm64"};
    std::filesystem::path prefix = "/opt/musl";
    std::filesystem::path workDir = "/build";
    std::string baseImage = "rust:latest";
    std::filesystem::path pipelineFile;

    ToolchainSettings toolchain;
    DriverSettings driver;
    Tools tools;
};

// Extra `${key}` values, e.g. the toolchain of the run.
using TemplateValues = std::map<std::string, std::string>;

// Expands ${name}, ${version} and any key of `values`. Unknown keys stay as written.
std::string expandTemplate(const std::string &text, const DependencySpec &spec, const TemplateValues &values = {});
std::string archiveExtension(ArchiveFormat format);

inline std::string resolvedUrl(const DependencySpec &spec)
{
    return expandTemplate(spec.url, spec);
}

inline std::string resolvedArchive(const DependencySpec &spec)
{
    if (!spec.archive.empty())
    {
        return expandTemplate(spec.archive, spec);
    }
    return spec.name + "-" + spec.version + archiveExtension(spec.format);
}

inline std::string resolvedSourceDir(const DependencySpec &spec)
{
    if (!spec.sourceDir.empty())
    {
        return expandTemplate(spec.sourceDir, spec);
    }
    return spec.name + "-" + spec.version;
}

} // namespace muslforge::model
