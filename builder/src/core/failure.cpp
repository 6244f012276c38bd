#include "core/failure.hpp"

namespace muslforge
{

    const char *failureName(FailureKind kind)
    {
        switch (kind)
        {
        case FailureKind::None:
            return "Success";
        case FailureKind::InvalidConfiguration:
            return "InvalidConfiguration";
        case FailureKind::Fetch:
            return "FetchFailure";
        case FailureKind::Extract:
            return "ExtractFailure";
        case FailureKind::Configure:
            return "ConfigureFailure";
        case FailureKind::Compile:
            return "CompileFailure";
        case FailureKind::Install:
            return "InstallFailure";
        case FailureKind::UnsupportedArchitecture:
            return "UnsupportedArchitecture";
        case FailureKind::MissingDigestArtifact:
            return "MissingDigestArtifact";
        case FailureKind::ManifestPublish:
            return "ManifestPublishFailure";
        case FailureKind::ImageBuild:
            return "ImageBuildFailure";
        }
        return "UnknownFailure";
    }

    int exitCodeFor(FailureKind kind)
    {
        switch (kind)
        {
        case FailureKind::None:
            return 0;
        case FailureKind::InvalidConfiguration:
            return 2;
        case FailureKind::Fetch:
            return 10;
        case FailureKind::Extract:
            return 11;
        case FailureKind::Configure:
            return 12;
        case FailureKind::Compile:
            return 13;
        case FailureKind::Install:
            return 14;
        case FailureKind::UnsupportedArchitecture:
            return 20;
        case FailureKind::MissingDigestArtifact:
            return 30;
        case FailureKind::ManifestPublish:
            return 31;
        case FailureKind::ImageBuild:
            return 32;
        }
        return 1;
    }

} // namespace muslforge
