#pragma once

#include <string>
#include <utility>

namespace muslforge {

enum class FailureKind {
    None,
    InvalidConfiguration,
    Fetch,
    Extract,
    Configure,
    Compile,
    Install,
    UnsupportedArchitecture,
    MissingDigestArtifact,
    ManifestPublish,
    ImageBuild
};

struct Outcome {
    FailureKind kind = FailureKind::None;
    std::string detail;

    bool ok() const { return kind == FailureKind::None; }

    static Outcome success() { return {}; }
    static Outcome failure(FailureKind kind, std::string detail) { return {kind, std::move(detail)}; }
};

const char *failureName(FailureKind kind);
int exitCodeFor(FailureKind kind);

// Logs the failure (if any) and returns the process exit code for it.
template <typename Ctx>
int reportOutcome(const Ctx &ctx, const Outcome &outcome) {
    if (!outcome.ok()) {
        ctx.error(failureName(outcome.kind), ": ", outcome.detail);
    }
    return exitCodeFor(outcome.kind);
}

} // namespace muslforge
