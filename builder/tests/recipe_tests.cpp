#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "model/loader.hpp"
#include "pipeline/recipe.hpp"

using muslforge::model::Arch;
using muslforge::model::DependencySpec;
using muslforge::pipeline::Command;
using muslforge::pipeline::planStep;
using muslforge::pipeline::stepPaths;

namespace
{

    const DependencySpec &defaultSpec(const std::string &name)
    {
        static const auto pipeline = muslforge::model::defaultPipeline();
        return *std::find_if(pipeline.begin(), pipeline.end(), [&](const DependencySpec &spec)
                             { return spec.name == name; });
    }

    std::vector<Command> allCommands(const muslforge::pipeline::StepPlan &plan)
    {
        std::vector<Command> out = plan.configure;
        out.insert(out.end(), plan.compile.begin(), plan.compile.end());
        out.insert(out.end(), plan.install.begin(), plan.install.end());
        return out;
    }

    bool hasArg(const Command &command, const std::string &arg)
    {
        return std::find(command.args.begin(), command.args.end(), arg) != command.args.end();
    }

} // namespace

TEST(RecipePaths, StepPathsLiveUnderWorkDir)
{
    const auto paths = stepPaths("/build", defaultSpec("ffmpeg"));
    EXPECT_EQ(paths.archive, "/build/downloads/ffmpeg-6.1.1.tar.xz");
    EXPECT_EQ(paths.sourceDir, "/build/src/ffmpeg/ffmpeg-6.1.1");
    EXPECT_EQ(paths.stageDir, "/build/stage/ffmpeg");
    EXPECT_EQ(paths.stagedPrefix("/opt/musl"), "/build/stage/ffmpeg/opt/musl");
    EXPECT_EQ(paths.logFile, "/build/logs/ffmpeg.log");
}

TEST(RecipePlan, ConfigureSystemUsesPrefixArgsAndArchArgs)
{
    const auto &openssl = defaultSpec("openssl");
    const auto config = muslforge::toolchain::makeToolchainConfig(Arch::Aarch64, "/opt/musl", {}, 3);
    const auto paths = stepPaths("/build", openssl);
    const auto plan = planStep(openssl, config, paths, muslforge::model::Tools{});

    ASSERT_EQ(plan.configure.size(), 1u);
    const auto &configure = plan.configure.front();
    EXPECT_EQ(configure.program, "./Configure");
    EXPECT_EQ(configure.cwd, paths.sourceDir);
    EXPECT_EQ(configure.args.front(), "--prefix=/opt/musl");
    EXPECT_TRUE(hasArg(configure, "no-shared"));
    EXPECT_EQ(configure.args.back(), "linux-aarch64");

    ASSERT_EQ(plan.compile.size(), 1u);
    EXPECT_EQ(plan.compile.front().program, "make");
    EXPECT_TRUE(hasArg(plan.compile.front(), "-j3"));

    ASSERT_EQ(plan.install.size(), 1u);
    EXPECT_EQ(plan.install.front().args.front(), "install_sw");
    EXPECT_TRUE(hasArg(plan.install.front(), "DESTDIR=/build/stage/openssl"));
}

TEST(RecipePlan, CMakeSystemInstallsThroughDestdir)
{
    const auto &opencv = defaultSpec("opencv");
    const auto config = muslforge::toolchain::makeToolchainConfig(Arch::X86_64, "/opt/musl", {}, 2);
    const auto paths = stepPaths("/build", opencv);
    muslforge::model::Tools tools;
    tools.cmake = "/usr/bin/cmake";
    const auto plan = planStep(opencv, config, paths, tools);

    const auto &configure = plan.configure.front();
    EXPECT_EQ(configure.program, "/usr/bin/cmake");
    EXPECT_TRUE(hasArg(configure, "-DCMAKE_INSTALL_PREFIX=/opt/musl"));
    EXPECT_TRUE(hasArg(configure, "-DBUILD_SHARED_LIBS=OFF"));
    EXPECT_TRUE(hasArg(configure, "-DCMAKE_C_COMPILER=musl-gcc"));
    EXPECT_TRUE(hasArg(configure, "-DOPENCV_GENERATE_PKGCONFIG=ON"));

    EXPECT_EQ(plan.compile.front().args, (std::vector<std::string>{"--build", paths.buildDir.string(), "-j", "2"}));
    EXPECT_EQ(plan.install.front().env.at("DESTDIR"), "/build/stage/opencv");
}

TEST(RecipePlan, EveryAarch64CommandCarriesArchFlags)
{
    const auto config = muslforge::toolchain::makeToolchainConfig(Arch::Aarch64, "/opt/musl", {});
    for (const auto &spec : muslforge::model::defaultPipeline())
    {
        const auto plan = planStep(spec, config, stepPaths("/build", spec), muslforge::model::Tools{});
        for (const auto &command : allCommands(plan))
        {
            EXPECT_NE(command.env.at("CFLAGS").find("-mno-outline-atomics"), std::string::npos)
                << spec.name << ": " << command.program;
        }
    }
}

TEST(RecipePlan, FfmpegConfigureNamesTheToolchainOnItsCommandLine)
{
    const auto &ffmpeg = defaultSpec("ffmpeg");
    const auto config = muslforge::toolchain::makeToolchainConfig(Arch::Aarch64, "/opt/musl", {});
    const auto plan = planStep(ffmpeg, config, stepPaths("/build", ffmpeg), muslforge::model::Tools{});

    const auto &configure = plan.configure.front();
    EXPECT_TRUE(hasArg(configure, "--cc=musl-gcc"));
    EXPECT_TRUE(hasArg(configure, "--cxx=g++"));
    EXPECT_TRUE(hasArg(configure, "--ar=ar"));
    EXPECT_TRUE(hasArg(configure, "--ranlib=ranlib"));
    EXPECT_TRUE(hasArg(configure, "--extra-cflags=" + muslforge::toolchain::joinFlags(config.cflags())));
    EXPECT_TRUE(hasArg(configure, "--extra-ldflags=-L/opt/musl/lib -static"));

    const auto cflags = std::find_if(configure.args.begin(), configure.args.end(), [](const std::string &arg)
                                     { return arg.rfind("--extra-cflags=", 0) == 0; });
    ASSERT_NE(cflags, configure.args.end());
    EXPECT_NE(cflags->find("-mno-outline-atomics"), std::string::npos);
    EXPECT_NE(cflags->find("-I/opt/musl/include"), std::string::npos);
    for (const auto &arg : configure.args)
    {
        EXPECT_EQ(arg.find("${"), std::string::npos) << arg;
    }
}

TEST(RecipePlan, RlottieInstallsLibrariesUnderThePrefix)
{
    const auto &rlottie = defaultSpec("rlottie");
    const auto config = muslforge::toolchain::makeToolchainConfig(Arch::X86_64, "/opt/static", {});
    const auto plan = planStep(rlottie, config, stepPaths("/build", rlottie), muslforge::model::Tools{});

    EXPECT_TRUE(hasArg(plan.configure.front(), "-DLIB_INSTALL_DIR=/opt/static/lib"));
}

TEST(RecipePlan, ArchArgsExpandToolchainPlaceholders)
{
    DependencySpec spec;
    spec.name = "demo";
    spec.version = "1.0";
    spec.args = {"--host-cc=${cc}", "--keep=${unknown}"};
    spec.archArgs["aarch64"] = {"--libdir=${prefix}/lib/${name}"};
    const auto config = muslforge::toolchain::makeToolchainConfig(Arch::Aarch64, "/opt/musl", {});
    const auto plan = planStep(spec, config, stepPaths("/build", spec), muslforge::model::Tools{});

    EXPECT_EQ(plan.configure.front().args,
              (std::vector<std::string>{"--prefix=/opt/musl", "--host-cc=musl-gcc", "--keep=${unknown}",
                                        "--libdir=/opt/musl/lib/demo"}));
}

TEST(RecipePlan, X86CommandsCarryNoArchFlags)
{
    const auto config = muslforge::toolchain::makeToolchainConfig(Arch::X86_64, "/opt/musl", {});
    for (const auto &spec : muslforge::model::defaultPipeline())
    {
        const auto plan = planStep(spec, config, stepPaths("/build", spec), muslforge::model::Tools{});
        for (const auto &command : allCommands(plan))
        {
            EXPECT_EQ(command.env.at("CFLAGS").find("-mno-outline-atomics"), std::string::npos);
            for (const auto &arg : command.args)
            {
                EXPECT_EQ(arg.find("-mno-outline-atomics"), std::string::npos);
            }
        }
    }
}
