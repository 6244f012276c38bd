#include <string>

#include <gtest/gtest.h>

#include "core/failure.hpp"
#include "test_support.hpp"

using muslforge::FailureKind;
using muslforge::Outcome;

TEST(FailureCodes, EveryKindHasDistinctExitCode)
{
    EXPECT_EQ(muslforge::exitCodeFor(FailureKind::None), 0);
    EXPECT_EQ(muslforge::exitCodeFor(FailureKind::InvalidConfiguration), 2);
    EXPECT_EQ(muslforge::exitCodeFor(FailureKind::Fetch), 10);
    EXPECT_EQ(muslforge::exitCodeFor(FailureKind::Extract), 11);
    EXPECT_EQ(muslforge::exitCodeFor(FailureKind::Configure), 12);
    EXPECT_EQ(muslforge::exitCodeFor(FailureKind::Compile), 13);
    EXPECT_EQ(muslforge::exitCodeFor(FailureKind::Install), 14);
    EXPECT_EQ(muslforge::exitCodeFor(FailureKind::UnsupportedArchitecture), 20);
    EXPECT_EQ(muslforge::exitCodeFor(FailureKind::MissingDigestArtifact), 30);
    EXPECT_EQ(muslforge::exitCodeFor(FailureKind::ManifestPublish), 31);
    EXPECT_EQ(muslforge::exitCodeFor(FailureKind::ImageBuild), 32);
}

TEST(FailureCodes, ReportOutcomeReturnsExitCode)
{
    auto ctx = muslforge::testing::makeContext();
    EXPECT_EQ(muslforge::reportOutcome(ctx, Outcome::success()), 0);
    EXPECT_EQ(muslforge::reportOutcome(ctx, Outcome::failure(FailureKind::Fetch, "404")), 10);
    EXPECT_STREQ(muslforge::failureName(FailureKind::ManifestPublish), "ManifestPublishFailure");
}
