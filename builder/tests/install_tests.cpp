#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "pipeline/install.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using muslforge::FailureKind;
using muslforge::model::LinkPatch;
using muslforge::testing::readFile;
using muslforge::testing::TempDir;
using muslforge::testing::writeFile;

namespace
{

    LinkPatch rlottiePatch()
    {
        return LinkPatch{"rlottie.pc.in", "-lrlottie", " -lstdc++", "lib/pkgconfig/rlottie.pc"};
    }

} // namespace

TEST(InstallLinkPatch, AppendsStdcxxAfterLibrary)
{
    TempDir dir("patch");
    writeFile(dir.path() / "rlottie.pc.in", "Name: rlottie\nLibs: -L${libdir} -lrlottie\n");

    ASSERT_TRUE(muslforge::pipeline::applyLinkPatch(dir.path(), rlottiePatch()).ok());
    EXPECT_EQ(readFile(dir.path() / "rlottie.pc.in"), "Name: rlottie\nLibs: -L${libdir} -lrlottie -lstdc++\n");
}

TEST(InstallLinkPatch, SecondApplicationChangesNothing)
{
    TempDir dir("patch_twice");
    writeFile(dir.path() / "rlottie.pc.in", "Libs: -lrlottie\n");

    ASSERT_TRUE(muslforge::pipeline::applyLinkPatch(dir.path(), rlottiePatch()).ok());
    ASSERT_TRUE(muslforge::pipeline::applyLinkPatch(dir.path(), rlottiePatch()).ok());
    EXPECT_EQ(readFile(dir.path() / "rlottie.pc.in"), "Libs: -lrlottie -lstdc++\n");
}

TEST(InstallLinkPatch, MissingFileOrTokenIsConfigureFailure)
{
    TempDir dir("patch_missing");
    EXPECT_EQ(muslforge::pipeline::applyLinkPatch(dir.path(), rlottiePatch()).kind, FailureKind::Configure);

    writeFile(dir.path() / "rlottie.pc.in", "Libs: -lother\n");
    EXPECT_EQ(muslforge::pipeline::applyLinkPatch(dir.path(), rlottiePatch()).kind, FailureKind::Configure);
}

TEST(InstallLinkPatch, InstalledFileMustCarryPatch)
{
    TempDir dir("patch_installed");
    EXPECT_EQ(muslforge::pipeline::checkLinkPatchInstalled(dir.path(), rlottiePatch()).kind, FailureKind::Install);

    writeFile(dir.path() / "lib/pkgconfig/rlottie.pc", "Libs: -lrlottie\n");
    EXPECT_EQ(muslforge::pipeline::checkLinkPatchInstalled(dir.path(), rlottiePatch()).kind, FailureKind::Install);

    writeFile(dir.path() / "lib/pkgconfig/rlottie.pc", "Libs: -lrlottie -lstdc++\n");
    EXPECT_TRUE(muslforge::pipeline::checkLinkPatchInstalled(dir.path(), rlottiePatch()).ok());
}

TEST(InstallArtifacts, RedundantLibPrefixIsStripped)
{
    TempDir dir("strip");
    writeFile(dir.path() / "lib/liblibopenjp2.a", "a");
    writeFile(dir.path() / "lib/libopencv_core.a", "a");

    std::string error;
    const auto renamed = muslforge::pipeline::stripRedundantLibPrefix(dir.path(), error);
    EXPECT_TRUE(error.empty()) << error;
    ASSERT_EQ(renamed.size(), 1u);
    EXPECT_TRUE(fs::exists(dir.path() / "lib/libopenjp2.a"));
    EXPECT_FALSE(fs::exists(dir.path() / "lib/liblibopenjp2.a"));
    EXPECT_TRUE(muslforge::pipeline::findRedundantLibPrefix(dir.path()).empty());
}

TEST(InstallArtifacts, SharedObjectsAreFound)
{
    TempDir dir("shared");
    writeFile(dir.path() / "lib/libz.a", "a");
    writeFile(dir.path() / "lib/libz.so.1.3.1", "so");
    writeFile(dir.path() / "lib/libvpx.so", "so");

    const auto shared = muslforge::pipeline::findSharedObjects(dir.path());
    EXPECT_EQ(shared.size(), 2u);
}

TEST(InstallPromotion, StageIsMergedAndRecorded)
{
    TempDir dir("promote");
    const fs::path staged = dir.path() / "stage/opt/musl";
    const fs::path prefix = dir.path() / "prefix";
    writeFile(staged / "lib/libz.a", "archive");
    writeFile(staged / "lib/pkgconfig/zlib.pc", "Name: zlib\n");
    writeFile(prefix / "lib/libz.a", "old");

    std::vector<std::string> files;
    ASSERT_TRUE(muslforge::pipeline::promoteStage(staged, prefix, files).ok());
    EXPECT_EQ(files, (std::vector<std::string>{"lib/libz.a", "lib/pkgconfig/zlib.pc"}));
    EXPECT_EQ(readFile(prefix / "lib/libz.a"), "archive");

    muslforge::pipeline::InstallRecord record{"zlib", "1.3.1", "x86_64", files};
    ASSERT_TRUE(muslforge::pipeline::writeInstallRecord(prefix, record));
    auto loaded = muslforge::pipeline::readInstallRecord(prefix, "zlib");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->version, "1.3.1");
    EXPECT_EQ(loaded->files, files);
}

TEST(InstallPromotion, EmptyStageIsInstallFailure)
{
    TempDir dir("promote_empty");
    fs::create_directories(dir.path() / "stage/opt/musl");
    std::vector<std::string> files;
    EXPECT_EQ(
        muslforge::pipeline::promoteStage(dir.path() / "stage/opt/musl", dir.path() / "prefix", files).kind,
        FailureKind::Install);
}

TEST(InstallVerify, PrefixNeedsRecordAndMetadata)
{
    TempDir dir("verify");
    muslforge::model::DependencySpec zlib;
    zlib.name = "zlib";
    zlib.version = "1.3.1";
    zlib.pkgConfig = {"zlib"};
    const muslforge::model::Pipeline pipeline = {zlib};

    EXPECT_EQ(muslforge::pipeline::verifyPrefix(dir.path(), pipeline, muslforge::model::Arch::X86_64).kind,
              FailureKind::Install);

    ASSERT_TRUE(muslforge::pipeline::writeInstallRecord(dir.path(), {"zlib", "1.3.1", "x86_64", {}}));
    EXPECT_EQ(muslforge::pipeline::verifyPrefix(dir.path(), pipeline, muslforge::model::Arch::X86_64).kind,
              FailureKind::Install);

    writeFile(dir.path() / "lib/pkgconfig/zlib.pc", "Name: zlib\n");
    EXPECT_TRUE(muslforge::pipeline::verifyPrefix(dir.path(), pipeline, muslforge::model::Arch::X86_64).ok());
    EXPECT_EQ(muslforge::pipeline::verifyPrefix(dir.path(), pipeline, muslforge::model::Arch::Aarch64).kind,
              FailureKind::Install);
}
