#include "model/loader.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace muslforge::model
{

    namespace
    {

        constexpr const char *kConfigFileName = "muslforge.json";

        std::vector<std::string> toStringList(const json &node)
        {
            std::vector<std::string> out;
            if (!node.is_array())
            {
                return out;
            }

            for (const auto &item : node)
            {
                if (!item.is_string())
                {
                    continue;
                }
                std::string value = item.get<std::string>();
                if (!value.empty())
                {
                    out.push_back(value);
                }
            }
            return out;
        }

        // Flag fields accept "a b c" or ["a", "b", "c"].
        std::vector<std::string> toFlagList(const json &node)
        {
            if (node.is_string())
            {
                return io::splitFlags(node.get<std::string>());
            }
            return toStringList(node);
        }

        std::map<std::string, std::vector<std::string>> toFlagMap(const json &node)
        {
            std::map<std::string, std::vector<std::string>> out;
            if (!node.is_object())
            {
                return out;
            }
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                const auto arch = parseArch(it.key());
                if (!arch.has_value())
                {
                    throw std::runtime_error("unknown architecture key: " + it.key());
                }
                out[archName(arch.value())] = toFlagList(it.value());
            }
            return out;
        }

        ArchiveFormat parseFormat(const std::string &value)
        {
            if (value == "tar.gz" || value == "tgz")
            {
                return ArchiveFormat::TarGz;
            }
            if (value == "tar.xz" || value == "txz")
            {
                return ArchiveFormat::TarXz;
            }
            if (value == "zip")
            {
                return ArchiveFormat::Zip;
            }
            throw std::runtime_error("unknown archive format: " + value);
        }

        std::string formatName(ArchiveFormat format)
        {
            return archiveExtension(format).substr(1);
        }

        BuildSystem parseSystem(const std::string &value)
        {
            if (value == "configure" || value == "autotools")
            {
                return BuildSystem::Configure;
            }
            if (value == "cmake")
            {
                return BuildSystem::CMake;
            }
            throw std::runtime_error("unknown build system: " + value);
        }

        DependencySpec parseDependency(const json &node, int position)
        {
            if (!node.is_object())
            {
                throw std::runtime_error("dependency entry is not an object");
            }

            DependencySpec spec;
            spec.position = position;
            spec.name = node.value("name", "");
            spec.version = node.value("version", "");
            spec.url = node.value("url", "");
            if (spec.name.empty() || spec.version.empty() || spec.url.empty())
            {
                throw std::runtime_error("dependency needs name, version and url");
            }

            spec.archive = node.value("archive", "");
            spec.sourceDir = node.value("source_dir", "");
            spec.format = parseFormat(node.value("format", "tar.gz"));
            spec.sha256 = node.value("sha256", "");
            spec.system = parseSystem(node.value("system", "configure"));
            spec.configureScript = node.value("configure_script", "configure");
            spec.installTarget = node.value("install_target", "install");

            if (node.contains("args"))
            {
                spec.args = toFlagList(node["args"]);
            }
            if (node.contains("arch_args"))
            {
                spec.archArgs = toFlagMap(node["arch_args"]);
            }

            spec.depends = toStringList(node.value("depends", json::array()));
            spec.pkgConfig = toStringList(node.value("pkg_config", json::array()));
            spec.optional = node.value("optional", false);
            spec.stripLibPrefix = node.value("strip_lib_prefix", false);

            if (node.contains("link_patches") && node["link_patches"].is_array())
            {
                for (const auto &item : node["link_patches"])
                {
                    LinkPatch patch;
                    patch.file = item.value("file", "");
                    patch.token = item.value("token", "");
                    patch.append = item.value("append", "");
                    patch.installed = item.value("installed", "");
                    if (patch.file.empty() || patch.token.empty() || patch.append.empty())
                    {
                        throw std::runtime_error("link patch of " + spec.name + " needs file, token and append");
                    }
                    spec.linkPatches.push_back(patch);
                }
            }

            return spec;
        }

        void applyToolchain(const json &node, ToolchainSettings &out)
        {
            if (!node.is_object())
            {
                return;
            }
            out.cc = node.value("CC", out.cc);
            out.cxx = node.value("CXX", out.cxx);
            out.ar = node.value("AR", out.ar);
            out.ranlib = node.value("RANLIB", out.ranlib);
            if (node.contains("OptFlags"))
            {
                out.optFlags = toFlagList(node["OptFlags"]);
            }
            if (node.contains("ArchFlags"))
            {
                out.archFlags = toFlagMap(node["ArchFlags"]);
            }
        }

        void applyTools(const json &node, Tools &out)
        {
            if (!node.is_object())
            {
                return;
            }
            out.curl = node.value("curl", out.curl);
            out.sha256sum = node.value("sha256sum", out.sha256sum);
            out.tar = node.value("tar", out.tar);
            out.unzip = node.value("unzip", out.unzip);
            out.make = node.value("make", out.make);
            out.cmake = node.value("cmake", out.cmake);
            out.docker = node.value("docker", out.docker);
        }

        fs::path toAbsolute(const fs::path &base, const std::string &value)
        {
            fs::path path(value);
            if (path.is_absolute())
            {
                return path;
            }
            return fs::absolute(base / path);
        }

    } // namespace

    Pipeline defaultPipeline()
    {
        Pipeline out;

        DependencySpec zlib;
        zlib.name = "zlib";
        zlib.version = "1.3.1";
        zlib.url = "https://zlib.net/fossils/zlib-${version}.tar.gz";
        zlib.args = {"--static"};
        zlib.pkgConfig = {"zlib"};
        out.push_back(zlib);

        DependencySpec openssl;
        openssl.name = "openssl";
        openssl.version = "3.2.1";
        openssl.url = "https://www.openssl.org/source/openssl-${version}.tar.gz";
        openssl.configureScript = "Configure";
        openssl.installTarget = "install_sw";
        openssl.args = {"--libdir=lib", "no-shared", "no-tests", "no-docs", "zlib"};
        openssl.archArgs["x86_64"] = {"linux-x86_64"};
        openssl.archArgs["aarch64"] = {"linux-aarch64"};
        openssl.depends = {"zlib"};
        openssl.pkgConfig = {"openssl", "libssl", "libcrypto"};
        out.push_back(openssl);

        DependencySpec libvpx;
        libvpx.name = "libvpx";
        libvpx.version = "1.14.0";
        libvpx.url = "https://github.com/webmproject/libvpx/archive/refs/tags/v${version}.tar.gz";
        libvpx.args = {"--disable-unit-tests", "--disable-examples", "--disable-docs",
                       "--enable-static", "--disable-shared", "--enable-pic"};
        libvpx.archArgs["x86_64"] = {"--target=x86_64-linux-gcc"};
        libvpx.archArgs["aarch64"] = {"--target=arm64-linux-gcc"};
        libvpx.pkgConfig = {"vpx"};
        out.push_back(libvpx);

        DependencySpec ffmpeg;
        ffmpeg.name = "ffmpeg";
        ffmpeg.version = "6.1.1";
        ffmpeg.url = "https://ffmpeg.org/releases/ffmpeg-${version}.tar.xz";
        ffmpeg.format = ArchiveFormat::TarXz;
        ffmpeg.args = {"--enable-gpl", "--enable-nonfree", "--enable-zlib", "--enable-libvpx",
                       "--disable-programs", "--disable-doc", "--enable-static", "--disable-shared",
                       "--pkg-config-flags=--static",
                       "--cc=${cc}", "--cxx=${cxx}", "--ar=${ar}", "--ranlib=${ranlib}",
                       "--extra-cflags=${cflags}", "--extra-ldflags=${ldflags}"};
        ffmpeg.depends = {"zlib", "libvpx"};
        ffmpeg.pkgConfig = {"libavcodec", "libavformat", "libavutil", "libswscale", "libswresample"};
        out.push_back(ffmpeg);

        DependencySpec rlottie;
        rlottie.name = "rlottie";
        rlottie.version = "d400087";
        rlottie.url = "https://codeload.github.com/Samsung/rlottie/zip/${version}";
        rlottie.archive = "rlottie-${version}.zip";
        rlottie.format = ArchiveFormat::Zip;
        rlottie.system = BuildSystem::CMake;
        rlottie.args = {"-DLOTTIE_MODULE=OFF", "-DLIB_INSTALL_DIR=${prefix}/lib"};
        rlottie.pkgConfig = {"rlottie"};
        rlottie.optional = true;
        rlottie.linkPatches.push_back({"rlottie.pc.in", "-lrlottie", " -lstdc++", "lib/pkgconfig/rlottie.pc"});
        out.push_back(rlottie);

        DependencySpec opencv;
        opencv.name = "opencv";
        opencv.version = "4.9.0";
        opencv.url = "https://github.com/opencv/opencv/archive/refs/tags/${version}.tar.gz";
        opencv.system = BuildSystem::CMake;
        opencv.args = {"-DOPENCV_GENERATE_PKGCONFIG=ON", "-DBUILD_LIST=core,imgproc,imgcodecs,objdetect",
                       "-DBUILD_TESTS=OFF", "-DBUILD_PERF_TESTS=OFF", "-DBUILD_EXAMPLES=OFF",
                       "-DBUILD_opencv_apps=OFF", "-DWITH_FFMPEG=OFF", "-DBUILD_ZLIB=OFF",
                       "-DWITH_IPP=OFF", "-DWITH_ITT=OFF",
                       "-DOPENCV_LIB_INSTALL_PATH=lib", "-DOPENCV_3P_LIB_INSTALL_PATH=lib"};
        opencv.depends = {"zlib"};
        opencv.pkgConfig = {"opencv4"};
        opencv.optional = true;
        opencv.stripLibPrefix = true;
        out.push_back(opencv);

        for (std::size_t i = 0; i < out.size(); ++i)
        {
            out[i].position = static_cast<int>(i);
        }
        return out;
    }

    std::optional<Pipeline> parsePipeline(const json &data, const muslforge::Context &ctx)
    {
        try
        {
            const json *list = &data;
            if (data.is_object())
            {
                if (!data.contains("Dependencies"))
                {
                    throw std::runtime_error("missing Dependencies array");
                }
                list = &data["Dependencies"];
            }
            if (!list->is_array() || list->empty())
            {
                throw std::runtime_error("Dependencies must be a non-empty array");
            }

            Pipeline pipeline;
            std::set<std::string> names;
            int position = 0;
            for (const auto &item : *list)
            {
                DependencySpec spec = parseDependency(item, position++);
                if (!names.insert(spec.name).second)
                {
                    throw std::runtime_error("duplicate dependency: " + spec.name);
                }
                pipeline.push_back(spec);
            }
            return pipeline;
        }
        catch (const std::exception &e)
        {
            ctx.error("Failed parse pipeline: ", e.what());
            return std::nullopt;
        }
    }

    std::optional<Pipeline> loadPipelineFile(const fs::path &pipelineFile, const muslforge::Context &ctx)
    {
        try
        {
            json data = io::loadJsonFile(pipelineFile);
            return parsePipeline(data, ctx);
        }
        catch (const std::exception &e)
        {
            ctx.error("Failed parse pipeline ", pipelineFile.string(), " : ", e.what());
            return std::nullopt;
        }
    }

    json pipelineToJson(const Pipeline &pipeline)
    {
        json list = json::array();
        for (const auto &spec : pipeline)
        {
            json node;
            node["name"] = spec.name;
            node["version"] = spec.version;
            node["url"] = spec.url;
            if (!spec.archive.empty())
            {
                node["archive"] = spec.archive;
            }
            if (!spec.sourceDir.empty())
            {
                node["source_dir"] = spec.sourceDir;
            }
            node["format"] = formatName(spec.format);
            if (!spec.sha256.empty())
            {
                node["sha256"] = spec.sha256;
            }
            node["system"] = spec.system == BuildSystem::CMake ? "cmake" : "configure";
            node["configure_script"] = spec.configureScript;
            node["install_target"] = spec.installTarget;
            node["args"] = spec.args;
            if (!spec.archArgs.empty())
            {
                node["arch_args"] = spec.archArgs;
            }
            node["depends"] = spec.depends;
            node["pkg_config"] = spec.pkgConfig;
            node["optional"] = spec.optional;
            node["strip_lib_prefix"] = spec.stripLibPrefix;

            json patches = json::array();
            for (const auto &patch : spec.linkPatches)
            {
                patches.push_back({{"file", patch.file},
                                   {"token", patch.token},
                                   {"append", patch.append},
                                   {"installed", patch.installed}});
            }
            node["link_patches"] = patches;
            list.push_back(node);
        }
        return json{{"Dependencies", list}};
    }

    fs::path resolveConfigFile(const std::string &explicitFile)
    {
        if (!explicitFile.empty())
        {
            return fs::absolute(explicitFile);
        }
        return fs::absolute(kConfigFileName);
    }

    std::optional<Settings> loadSettings(const fs::path &configFile, const muslforge::Context &ctx)
    {
        Settings settings;
        std::error_code ec;
        if (configFile.empty() || !fs::exists(configFile, ec))
        {
            return settings;
        }

        try
        {
            json data = io::loadJsonFile(configFile);
            json root = data;
            if (data.contains("Configuration") && data["Configuration"].is_object())
            {
                root = data["Configuration"];
            }

            const fs::path base = fs::absolute(configFile).parent_path();

            settings.image = root.value("Image", settings.image);
            if (root.contains("Platforms"))
            {
                std::vector<std::string> platforms;
                for (const auto &item : toStringList(root["Platforms"]))
                {
                    const auto arch = parseArch(item);
                    if (!arch.has_value())
                    {
                        throw std::runtime_error("unsupported platform: " + item);
                    }
                    platforms.push_back(archPlatform(arch.value()));
                }
                if (platforms.empty())
                {
                    throw std::runtime_error("Platforms must not be empty");
                }
                settings.platforms = platforms;
            }
            if (root.contains("Prefix") && root["Prefix"].is_string())
            {
                settings.prefix = toAbsolute(base, root["Prefix"].get<std::string>());
            }
            if (root.contains("WorkDir") && root["WorkDir"].is_string())
            {
                settings.workDir = toAbsolute(base, root["WorkDir"].get<std::string>());
            }
            settings.baseImage = root.value("BaseImage", settings.baseImage);
            if (root.contains("Pipeline") && root["Pipeline"].is_string())
            {
                settings.pipelineFile = toAbsolute(base, root["Pipeline"].get<std::string>());
            }

            applyToolchain(root.value("Toolchain", json::object()), settings.toolchain);
            applyTools(root.value("Tools", json::object()), settings.tools);

            if (root.contains("Driver") && root["Driver"].is_object())
            {
                const auto &driver = root["Driver"];
                settings.driver.registry = driver.value("Registry", settings.driver.registry);
                settings.driver.workdir = driver.value("Workdir", settings.driver.workdir);
                if (driver.contains("Command"))
                {
                    settings.driver.command = toFlagList(driver["Command"]);
                }
            }

            return settings;
        }
        catch (const std::exception &e)
        {
            ctx.error("Failed parse config ", configFile.string(), " : ", e.what());
            return std::nullopt;
        }
    }

    std::optional<Pipeline> loadPipeline(const Settings &settings, const muslforge::Context &ctx)
    {
        if (settings.pipelineFile.empty())
        {
            return defaultPipeline();
        }
        return loadPipelineFile(settings.pipelineFile, ctx);
    }

    std::optional<Pipeline> selectDependencies(
        const Pipeline &pipeline,
        const std::vector<std::string> &without,
        std::string &error)
    {
        for (const auto &name : without)
        {
            auto it = std::find_if(pipeline.begin(), pipeline.end(), [&](const DependencySpec &spec)
                                   { return spec.name == name; });
            if (it == pipeline.end())
            {
                error = "unknown dependency: " + name;
                return std::nullopt;
            }
            if (!it->optional)
            {
                error = "dependency is required and cannot be disabled: " + name;
                return std::nullopt;
            }
        }

        Pipeline out;
        for (const auto &spec : pipeline)
        {
            if (std::find(without.begin(), without.end(), spec.name) == without.end())
            {
                out.push_back(spec);
            }
        }
        return out;
    }

} // namespace muslforge::model
