#include <algorithm>
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "model/loader.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using muslforge::testing::makeContext;
using muslforge::testing::TempDir;
using muslforge::testing::writeFile;
using nlohmann::json;

namespace
{

    const muslforge::model::DependencySpec *findSpec(const muslforge::model::Pipeline &pipeline, const std::string &name)
    {
        auto it = std::find_if(pipeline.begin(), pipeline.end(), [&](const muslforge::model::DependencySpec &spec)
                               { return spec.name == name; });
        return it == pipeline.end() ? nullptr : &*it;
    }

} // namespace

TEST(LoaderDefaults, DefaultPipelinePinsAllDependencies)
{
    const auto pipeline = muslforge::model::defaultPipeline();
    ASSERT_EQ(pipeline.size(), 6u);

    const char *expected[] = {"zlib", "openssl", "libvpx", "ffmpeg", "rlottie", "opencv"};
    for (std::size_t i = 0; i < pipeline.size(); ++i)
    {
        EXPECT_EQ(pipeline[i].name, expected[i]);
        EXPECT_EQ(pipeline[i].position, static_cast<int>(i));
        EXPECT_FALSE(pipeline[i].version.empty());
        EXPECT_FALSE(pipeline[i].pkgConfig.empty());
    }

    const auto *ffmpeg = findSpec(pipeline, "ffmpeg");
    ASSERT_NE(ffmpeg, nullptr);
    EXPECT_EQ(ffmpeg->depends, (std::vector<std::string>{"zlib", "libvpx"}));
    EXPECT_EQ(muslforge::model::resolvedUrl(*ffmpeg), "https://ffmpeg.org/releases/ffmpeg-6.1.1.tar.xz");
}

TEST(LoaderDefaults, RlottieCarriesStdcxxLinkPatch)
{
    const auto pipeline = muslforge::model::defaultPipeline();
    const auto *rlottie = findSpec(pipeline, "rlottie");
    ASSERT_NE(rlottie, nullptr);
    ASSERT_EQ(rlottie->linkPatches.size(), 1u);
    EXPECT_EQ(rlottie->linkPatches[0].file, "rlottie.pc.in");
    EXPECT_EQ(rlottie->linkPatches[0].token, "-lrlottie");
    EXPECT_EQ(rlottie->linkPatches[0].append, " -lstdc++");
    EXPECT_TRUE(rlottie->optional);
    EXPECT_EQ(muslforge::model::resolvedArchive(*rlottie), "rlottie-d400087.zip");
    EXPECT_NE(std::find(rlottie->args.begin(), rlottie->args.end(), "-DLIB_INSTALL_DIR=${prefix}/lib"),
              rlottie->args.end());
}

TEST(LoaderDefaults, FfmpegReceivesToolchainOnItsConfigureLine)
{
    const auto pipeline = muslforge::model::defaultPipeline();
    const auto *ffmpeg = findSpec(pipeline, "ffmpeg");
    ASSERT_NE(ffmpeg, nullptr);
    for (const char *arg : {"--cc=${cc}", "--cxx=${cxx}", "--extra-cflags=${cflags}", "--extra-ldflags=${ldflags}"})
    {
        EXPECT_NE(std::find(ffmpeg->args.begin(), ffmpeg->args.end(), arg), ffmpeg->args.end()) << arg;
    }
}

TEST(LoaderPipeline, ParsesFieldsAndFlagStrings)
{
    auto ctx = makeContext();
    const json data = json::parse(R"({
        "Dependencies": [
            {"name": "zlib", "version": "1.3.1", "url": "https://example.invalid/${name}-${version}.tar.gz",
             "args": "--static  --64", "pkg_config": ["zlib"]},
            {"name": "tool", "version": "2", "url": "https://example.invalid/tool.zip", "format": "zip",
             "system": "cmake", "depends": ["zlib"], "arch_args": {"arm64": "-DARM=ON"}, "optional": true}
        ]
    })");

    auto pipeline = muslforge::model::parsePipeline(data, ctx);
    ASSERT_TRUE(pipeline.has_value());
    ASSERT_EQ(pipeline->size(), 2u);

    const auto &zlib = (*pipeline)[0];
    EXPECT_EQ(zlib.args, (std::vector<std::string>{"--static", "--64"}));
    EXPECT_EQ(muslforge::model::resolvedUrl(zlib), "https://example.invalid/zlib-1.3.1.tar.gz");
    EXPECT_EQ(muslforge::model::resolvedSourceDir(zlib), "zlib-1.3.1");

    const auto &tool = (*pipeline)[1];
    EXPECT_EQ(tool.position, 1);
    EXPECT_EQ(tool.format, muslforge::model::ArchiveFormat::Zip);
    EXPECT_EQ(tool.system, muslforge::model::BuildSystem::CMake);
    EXPECT_EQ(tool.archArgs.at("aarch64"), (std::vector<std::string>{"-DARM=ON"}));
    EXPECT_TRUE(tool.optional);
}

TEST(LoaderPipeline, RejectsDuplicatesAndMissingFields)
{
    auto ctx = makeContext();
    EXPECT_FALSE(muslforge::model::parsePipeline(json::parse(R"({"Dependencies": [
        {"name": "a", "version": "1", "url": "u"},
        {"name": "a", "version": "2", "url": "u"}]})"),
                                                 ctx)
                     .has_value());
    EXPECT_FALSE(muslforge::model::parsePipeline(json::parse(R"({"Dependencies": [{"name": "a", "url": "u"}]})"), ctx)
                     .has_value());
    EXPECT_FALSE(muslforge::model::parsePipeline(json::parse(R"({"Dependencies": [
        {"name": "a", "version": "1", "url": "u", "format": "rar"}]})"),
                                                 ctx)
                     .has_value());
}

TEST(LoaderPipeline, SerializedPipelineParsesBack)
{
    auto ctx = makeContext();
    const auto original = muslforge::model::defaultPipeline();
    auto parsed = muslforge::model::parsePipeline(muslforge::model::pipelineToJson(original), ctx);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), original.size());
    for (std::size_t i = 0; i < original.size(); ++i)
    {
        EXPECT_EQ((*parsed)[i].name, original[i].name);
        EXPECT_EQ((*parsed)[i].archArgs, original[i].archArgs);
        EXPECT_EQ((*parsed)[i].linkPatches.size(), original[i].linkPatches.size());
        EXPECT_EQ((*parsed)[i].stripLibPrefix, original[i].stripLibPrefix);
    }
}

TEST(LoaderSettings, MissingFileMeansDefaults)
{
    auto ctx = makeContext();
    auto settings = muslforge::model::loadSettings("/muslforge/does/not/exist.json", ctx);
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->prefix, fs::path("/opt/musl"));
    EXPECT_EQ(settings->platforms, (std::vector<std::string>{"linux/amd64", "linux/arm64"}));
}

TEST(LoaderSettings, ReadsWrappedConfiguration)
{
    TempDir dir("settings");
    auto ctx = makeContext();
    writeFile(dir.path() / "muslforge.json", R"({
        "Configuration": {
            "Image": "registry.example/builder",
            "Platforms": ["arm64"],
            "Prefix": "/opt/static",
            "WorkDir": "work",
            "Pipeline": "deps.json",
            "Toolchain": {"CC": "aarch64-linux-musl-gcc", "OptFlags": "-Os", "ArchFlags": {"aarch64": ["-march=armv8-a"]}},
            "Driver": {"Command": "cargo build --release --locked"},
            "Tools": {"curl": "/usr/local/bin/curl"}
        }
    })");

    auto settings = muslforge::model::loadSettings(dir.path() / "muslforge.json", ctx);
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->image, "registry.example/builder");
    EXPECT_EQ(settings->platforms, (std::vector<std::string>{"linux/arm64"}));
    EXPECT_EQ(settings->prefix, fs::path("/opt/static"));
    EXPECT_EQ(settings->workDir, fs::absolute(dir.path() / "work"));
    EXPECT_EQ(settings->pipelineFile, fs::absolute(dir.path() / "deps.json"));
    EXPECT_EQ(settings->toolchain.cc, "aarch64-linux-musl-gcc");
    EXPECT_EQ(settings->toolchain.optFlags, (std::vector<std::string>{"-Os"}));
    EXPECT_EQ(settings->toolchain.archFlags.at("aarch64"), (std::vector<std::string>{"-march=armv8-a"}));
    EXPECT_EQ(settings->driver.command, (std::vector<std::string>{"cargo", "build", "--release", "--locked"}));
    EXPECT_EQ(settings->tools.curl, "/usr/local/bin/curl");
    EXPECT_EQ(settings->tools.tar, "tar");
}

TEST(LoaderSettings, RelativePrefixResolvesAgainstConfigDirectory)
{
    TempDir dir("relprefix");
    auto ctx = makeContext();
    writeFile(dir.path() / "muslforge.json", R"({"Prefix": "out/musl"})");

    auto settings = muslforge::model::loadSettings(dir.path() / "muslforge.json", ctx);
    ASSERT_TRUE(settings.has_value());
    EXPECT_TRUE(settings->prefix.is_absolute());
    EXPECT_EQ(settings->prefix, fs::absolute(dir.path() / "out/musl"));
}

TEST(LoaderSettings, UnsupportedPlatformIsRejected)
{
    TempDir dir("badplatform");
    auto ctx = makeContext();
    writeFile(dir.path() / "muslforge.json", R"({"Platforms": ["linux/s390x"]})");
    EXPECT_FALSE(muslforge::model::loadSettings(dir.path() / "muslforge.json", ctx).has_value());
}

TEST(LoaderSelect, OnlyOptionalDependenciesCanBeDisabled)
{
    const auto pipeline = muslforge::model::defaultPipeline();
    std::string error;

    auto without = muslforge::model::selectDependencies(pipeline, {"rlottie", "opencv"}, error);
    ASSERT_TRUE(without.has_value()) << error;
    EXPECT_EQ(without->size(), 4u);
    EXPECT_EQ(findSpec(without.value(), "opencv"), nullptr);

    EXPECT_FALSE(muslforge::model::selectDependencies(pipeline, {"zlib"}, error).has_value());
    EXPECT_NE(error.find("zlib"), std::string::npos);

    EXPECT_FALSE(muslforge::model::selectDependencies(pipeline, {"nope"}, error).has_value());
}
