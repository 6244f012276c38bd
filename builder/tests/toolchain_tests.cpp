#include <string>

#include <gtest/gtest.h>

#include "toolchain/toolchain_config.hpp"

using muslforge::model::Arch;
using muslforge::toolchain::makeToolchainConfig;

namespace
{

    bool contains(const std::string &text, const std::string &needle)
    {
        return text.find(needle) != std::string::npos;
    }

} // namespace

TEST(ToolchainConfig, Aarch64CarriesOutlineAtomicsOverlay)
{
    const auto config = makeToolchainConfig(Arch::Aarch64, "/opt/musl", muslforge::model::ToolchainSettings{}, 2);
    const auto env = config.environment();

    EXPECT_EQ(config.triple(), "aarch64-linux-musl");
    EXPECT_TRUE(contains(env.at("CFLAGS"), "-mno-outline-atomics"));
    EXPECT_TRUE(contains(env.at("CXXFLAGS"), "-mno-outline-atomics"));
    EXPECT_EQ(config.makeJobs(), 2u);
}

TEST(ToolchainConfig, X86HasNoArchFlags)
{
    const auto config = makeToolchainConfig(Arch::X86_64, "/opt/musl", muslforge::model::ToolchainSettings{});
    const auto env = config.environment();

    EXPECT_TRUE(config.archFlags().empty());
    EXPECT_FALSE(contains(env.at("CFLAGS"), "-mno-outline-atomics"));
    EXPECT_GE(config.makeJobs(), 1u);
}

TEST(ToolchainConfig, EnvironmentPointsAtPrefix)
{
    const auto config = makeToolchainConfig(Arch::X86_64, "/opt/musl", muslforge::model::ToolchainSettings{});
    const auto env = config.environment();

    EXPECT_EQ(env.at("CC"), "musl-gcc");
    EXPECT_EQ(env.at("PKG_CONFIG_PATH"), "/opt/musl/lib/pkgconfig");
    EXPECT_EQ(env.at("PKG_CONFIG_LIBDIR"), "/opt/musl/lib/pkgconfig");
    EXPECT_EQ(env.at("PKG_CONFIG_ALLOW_CROSS"), "1");
    EXPECT_EQ(env.at("OPENSSL_DIR"), "/opt/musl");
    EXPECT_EQ(env.at("OPENSSL_STATIC"), "1");
    EXPECT_TRUE(contains(env.at("CFLAGS"), "-I/opt/musl/include"));
    EXPECT_TRUE(contains(env.at("LDFLAGS"), "-L/opt/musl/lib"));
    EXPECT_TRUE(contains(env.at("LDFLAGS"), "-static"));
}

TEST(ToolchainConfig, SettingsArchFlagsAreAppendedOnce)
{
    muslforge::model::ToolchainSettings settings;
    settings.archFlags["aarch64"] = {"-mno-outline-atomics", "-march=armv8-a"};
    const auto config = makeToolchainConfig(Arch::Aarch64, "/opt/musl", settings);

    ASSERT_EQ(config.archFlags().size(), 2u);
    EXPECT_EQ(config.archFlags()[0], "-mno-outline-atomics");
    EXPECT_EQ(config.archFlags()[1], "-march=armv8-a");
}

TEST(ToolchainConfig, ImageEnvironmentExportsRustTargetFlags)
{
    const auto arm = makeToolchainConfig(Arch::Aarch64, "/opt/musl", muslforge::model::ToolchainSettings{});
    const auto armEnv = arm.imageEnvironment();
    EXPECT_EQ(armEnv.at("CFLAGS_aarch64_unknown_linux_musl"), "-mno-outline-atomics");
    EXPECT_EQ(armEnv.at("MUSL_DIR"), "/opt/musl");
    EXPECT_EQ(armEnv.at("FFMPEG_PKG_CONFIG_PATH"), "/opt/musl/lib/pkgconfig");

    const auto x86 = makeToolchainConfig(Arch::X86_64, "/opt/musl", muslforge::model::ToolchainSettings{});
    const auto x86Env = x86.imageEnvironment();
    EXPECT_EQ(x86Env.count("CFLAGS_x86_64_unknown_linux_musl"), 0u);
}

TEST(ToolchainFormat, ShellAndDockerLines)
{
    muslforge::toolchain::Environment env;
    env["A"] = "x y";
    env["B"] = "say \"hi\"";

    EXPECT_EQ(
        muslforge::toolchain::formatEnvironment(env, muslforge::toolchain::EnvFormat::Shell),
        "export A='x y'\nexport B='say \"hi\"'\n");
    EXPECT_EQ(
        muslforge::toolchain::formatEnvironment(env, muslforge::toolchain::EnvFormat::Docker),
        "ENV A=\"x y\"\nENV B=\"say \\\"hi\\\"\"\n");
}
