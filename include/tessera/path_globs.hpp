#pragma once

#include <tessera/result.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tessera {

// What to do when an include filespec matches nothing.
enum class GlobMatchErrorBehavior { Ignore, Warn, Error };

const char* to_string(GlobMatchErrorBehavior behavior);
Result<GlobMatchErrorBehavior> parse_match_error_behavior(const std::string& name);

// Defaults consulted when a PathGlobs is built without an explicit policy.
struct GlobDefaults {
    GlobMatchErrorBehavior match_error_behavior = GlobMatchErrorBehavior::Warn;

    // The process-wide defaults. The first call freezes them.
    static const GlobDefaults& process();

    // Install the process-wide defaults. Allowed once, and only before the
    // first call to process().
    static Status configure(const GlobDefaults& defaults);
};

// Include and exclude filespecs plus a zero-match policy. Building one
// never touches the filesystem.
class PathGlobs {
public:
    // Without an explicit `behavior`, the policy comes from `defaults`, or
    // from GlobDefaults::process() when none is given. The process
    // defaults are only read (and so frozen) in that last case.
    PathGlobs(std::vector<std::string> include,
              std::vector<std::string> exclude = {},
              std::optional<GlobMatchErrorBehavior> behavior = std::nullopt,
              const GlobDefaults* defaults = nullptr);

    const std::vector<std::string>& include() const { return *include_; }
    const std::vector<std::string>& exclude() const { return *exclude_; }
    GlobMatchErrorBehavior match_error_behavior() const { return behavior_; }

    // Same filespecs, different policy. The filespec storage is shared.
    PathGlobs with_match_error_behavior(GlobMatchErrorBehavior behavior) const;

    bool operator==(const PathGlobs& other) const;
    bool operator!=(const PathGlobs& other) const { return !(*this == other); }

private:
    using Specs = std::shared_ptr<const std::vector<std::string>>;
    struct SharedSpecs {};

    PathGlobs(Specs include, Specs exclude, GlobMatchErrorBehavior behavior, SharedSpecs)
        : include_(std::move(include)), exclude_(std::move(exclude)), behavior_(behavior) {}

    Specs include_;
    Specs exclude_;
    GlobMatchErrorBehavior behavior_;
};

// The unit of work for the resolver: filespecs plus the directory they
// are relative to.
struct PathGlobsAndRoot {
    PathGlobs path_globs;
    std::string root;
};

} // namespace tessera
