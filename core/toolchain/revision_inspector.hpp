#pragma once

#include "process/command_runner.hpp"
#include "toolchain/lookup_cache.hpp"
#include <optional>
#include <string>

namespace adabench {

/// Identity of a checked-out source tree.
struct RevisionInfo {
    std::string commit_hash;
    std::optional<std::string> version_name;  // from a "v<digit>..." tag at HEAD, without the "v"
};

class RevisionInspector {
public:
    virtual ~RevisionInspector() = default;

    virtual RevisionInfo inspect(const std::string& source_path) = 0;
};

// ─── Git Revision Inspector ────────────────────────────────────
// Runs `git rev-parse HEAD` and `git tag --points-at HEAD`. Memoized
// per path.

class GitRevisionInspector : public RevisionInspector {
public:
    explicit GitRevisionInspector(CommandRunner& runner);

    RevisionInfo inspect(const std::string& source_path) override;

    /// Picks the version tag out of `git tag` output. More than one
    /// version tag at the same commit is a ConfigurationError.
    static std::optional<std::string> versionFromTags(const std::string& tag_output);

private:
    RevisionInfo query(const std::string& source_path);

    CommandRunner& runner_;
    LookupCache<std::string, RevisionInfo> cache_;
};

} // namespace adabench
