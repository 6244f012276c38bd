#include "image/assembler.hpp"

#include <sstream>
#include <system_error>

#include "image/digest.hpp"
#include "io/fs_utils.hpp"
#include "io/json_reader.hpp"
#include "io/process.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace muslforge::image
{
    namespace
    {

        constexpr const char *kInstallDir = "/opt/muslforge";
        constexpr const char *kBuilderPackages =
            "ca-certificates curl unzip xz-utils make cmake nasm yasm perl pkg-config musl-tools g++";
        constexpr const char *kRuntimePackages = "musl musl-dev musl-tools libclang-dev";

        json flagMap(const std::map<std::string, std::vector<std::string>> &flags)
        {
            json out = json::object();
            for (const auto &[key, value] : flags)
            {
                out[key] = value;
            }
            return out;
        }

    } // namespace

    std::string dateStamp(std::time_t now)
    {
        std::tm utc{};
        gmtime_r(&now, &utc);
        char buffer[16] = {};
        std::strftime(buffer, sizeof(buffer), "%Y%m%d", &utc);
        return buffer;
    }

    std::vector<std::string> imageTags(const std::string &image, const std::string &date, bool latest)
    {
        std::vector<std::string> tags = {image + ":" + date};
        if (latest)
        {
            tags.push_back(image + ":latest");
        }
        return tags;
    }

    json contextConfig(const model::Settings &settings)
    {
        json toolchain;
        toolchain["CC"] = settings.toolchain.cc;
        toolchain["CXX"] = settings.toolchain.cxx;
        toolchain["AR"] = settings.toolchain.ar;
        toolchain["RANLIB"] = settings.toolchain.ranlib;
        toolchain["OptFlags"] = settings.toolchain.optFlags;
        toolchain["ArchFlags"] = flagMap(settings.toolchain.archFlags);

        json root;
        root["Prefix"] = settings.prefix.generic_string();
        root["WorkDir"] = "/build";
        root["Pipeline"] = "pipeline.json";
        root["Toolchain"] = toolchain;
        return json{{"Configuration", root}};
    }

    std::string renderDockerfile(const model::Settings &settings, const toolchain::ToolchainConfig &config)
    {
        const std::string prefix = settings.prefix.generic_string();
        const std::string installDir = kInstallDir;

        std::ostringstream out;
        out << "# Generated by muslforge image\n"
            << "FROM " << settings.baseImage << " AS builder\n"
            << "RUN apt-get update \\\n"
            << "    && apt-get install -y --no-install-recommends " << kBuilderPackages << " \\\n"
            << "    && rm -rf /var/lib/apt/lists/*\n"
            << "COPY muslforge muslforge.json pipeline.json " << installDir << "/\n"
            << "RUN " << installDir << "/muslforge deps --config " << installDir << "/muslforge.json"
            << " --arch " << model::archName(config.arch()) << "\n"
            << "\n"
            << "FROM " << settings.baseImage << "\n"
            << "COPY --from=builder " << prefix << " " << prefix << "\n"
            << "RUN apt-get update \\\n"
            << "    && apt-get install -y --no-install-recommends " << kRuntimePackages << " \\\n"
            << "    && rm -rf /var/lib/apt/lists/* \\\n"
            << "    && rustup target add " << model::archRustTarget(config.arch()) << "\n"
            << toolchain::formatEnvironment(config.imageEnvironment(), toolchain::EnvFormat::Docker)
            << "CMD [\"/bin/bash\"]\n";
        return out.str();
    }

    Outcome writeBuildContext(
        const ImageRequest &request,
        const model::Settings &settings,
        const model::Pipeline &pipeline,
        const toolchain::ToolchainConfig &config,
        const muslforge::Context &ctx)
    {
        fs::path executable = request.executable;
        if (executable.empty())
        {
            auto self = io::currentExecutablePath();
            if (!self.has_value())
            {
                return Outcome::failure(FailureKind::ImageBuild, "cannot locate the muslforge executable");
            }
            executable = self.value();
        }

        std::error_code ec;
        if (!fs::is_regular_file(executable, ec))
        {
            return Outcome::failure(FailureKind::ImageBuild, "executable not found: " + executable.string());
        }
        if (!io::ensureDir(request.contextDir))
        {
            return Outcome::failure(FailureKind::ImageBuild, "cannot create " + request.contextDir.string());
        }

        const fs::path copied = request.contextDir / "muslforge";
        fs::copy_file(executable, copied, fs::copy_options::overwrite_existing, ec);
        if (ec)
        {
            return Outcome::failure(
                FailureKind::ImageBuild,
                "cannot copy " + executable.string() + ": " + ec.message());
        }
        fs::permissions(copied, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                    fs::perms::others_read | fs::perms::others_exec,
                        ec);

        const bool written =
            io::writeJsonFile(request.contextDir / "pipeline.json", model::pipelineToJson(pipeline)) &&
            io::writeJsonFile(request.contextDir / "muslforge.json", contextConfig(settings)) &&
            io::writeTextFile(request.contextDir / "Dockerfile", renderDockerfile(settings, config));
        if (!written)
        {
            return Outcome::failure(FailureKind::ImageBuild, "cannot write build context " + request.contextDir.string());
        }

        ctx.log("Build context ready: ", request.contextDir.string());
        return Outcome::success();
    }

    Outcome assembleImage(
        const ImageRequest &request,
        const model::Settings &settings,
        const model::Pipeline &pipeline,
        const muslforge::Context &ctx)
    {
        const auto config = toolchain::makeToolchainConfig(request.arch, settings.prefix, settings.toolchain);
        const std::string platform = model::archPlatform(request.arch);

        Outcome outcome = writeBuildContext(request, settings, pipeline, config, ctx);
        if (!outcome.ok())
        {
            return outcome;
        }

        const std::string date = request.date.empty() ? dateStamp(std::time(nullptr)) : request.date;
        const fs::path metadataFile = request.contextDir / "metadata.json";
        std::error_code ec;
        fs::remove(metadataFile, ec);

        std::vector<std::string> args = {"buildx", "build", "--platform", platform, "--metadata-file", metadataFile.string()};
        for (const auto &tag : imageTags(settings.image, date, request.latest))
        {
            args.push_back("-t");
            args.push_back(tag);
        }
        if (request.push)
        {
            args.push_back("--push");
        }
        args.push_back(request.contextDir.string());

        auto result = io::runCommand(settings.tools.docker, args, fs::path(), ctx, request.dryRun);
        if (result.code != 0)
        {
            return Outcome::failure(
                FailureKind::ImageBuild,
                platform + " image build exited with " + std::to_string(result.code));
        }
        if (request.dryRun || !request.push)
        {
            return Outcome::success();
        }

        auto digest = readMetadataDigest(metadataFile);
        if (!digest.has_value())
        {
            return Outcome::failure(
                FailureKind::ImageBuild,
                "no valid containerimage.digest in " + metadataFile.string());
        }

        outcome = exportDigest(request.digestsDir, ArchDigest{platform, digest.value()});
        if (!outcome.ok())
        {
            return outcome;
        }
        ctx.log("Pushed ", platform, " as ", digest.value());
        return Outcome::success();
    }

} // namespace muslforge::image
