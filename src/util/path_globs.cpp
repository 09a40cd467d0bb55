#include <tessera/path_globs.hpp>
#include <tessera/glob.hpp>
#include <cctype>
#include <mutex>

namespace tessera {

namespace {

std::mutex s_defaults_mutex;
bool s_defaults_frozen = false;
bool s_defaults_configured = false;
GlobDefaults s_defaults;

std::shared_ptr<const std::vector<std::string>> normalize_all(std::vector<std::string> specs) {
    for (auto& spec : specs) {
        spec = glob_normalize(spec);
    }
    return std::make_shared<const std::vector<std::string>>(std::move(specs));
}

} // namespace

const char* to_string(GlobMatchErrorBehavior behavior) {
    switch (behavior) {
        case GlobMatchErrorBehavior::Ignore: return "ignore";
        case GlobMatchErrorBehavior::Warn:   return "warn";
        case GlobMatchErrorBehavior::Error:  return "error";
    }
    return "unknown";
}

Result<GlobMatchErrorBehavior> parse_match_error_behavior(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    for (auto b : {GlobMatchErrorBehavior::Ignore, GlobMatchErrorBehavior::Warn,
                   GlobMatchErrorBehavior::Error}) {
        if (lower == to_string(b)) {
            return Result<GlobMatchErrorBehavior>::ok(b);
        }
    }
    return TesseraError(TesseraError::Config,
        "unknown glob match error behavior: '" + name + "'",
        "expected one of: ignore, warn, error");
}

const GlobDefaults& GlobDefaults::process() {
    std::lock_guard<std::mutex> lock(s_defaults_mutex);
    s_defaults_frozen = true;
    return s_defaults;
}

Status GlobDefaults::configure(const GlobDefaults& defaults) {
    std::lock_guard<std::mutex> lock(s_defaults_mutex);
    if (s_defaults_configured) {
        return TesseraError(TesseraError::Config,
            "glob defaults were already configured for this process");
    }
    if (s_defaults_frozen) {
        return TesseraError(TesseraError::Config,
            "glob defaults were read before being configured",
            "apply the configuration before building any PathGlobs");
    }
    s_defaults = defaults;
    s_defaults_configured = true;
    return ok_status();
}

PathGlobs::PathGlobs(std::vector<std::string> include,
                     std::vector<std::string> exclude,
                     std::optional<GlobMatchErrorBehavior> behavior,
                     const GlobDefaults* defaults)
    : include_(normalize_all(std::move(include))),
      exclude_(normalize_all(std::move(exclude))),
      behavior_(GlobMatchErrorBehavior::Warn) {
    if (behavior) {
        behavior_ = *behavior;
    } else if (defaults) {
        behavior_ = defaults->match_error_behavior;
    } else {
        behavior_ = GlobDefaults::process().match_error_behavior;
    }
}

PathGlobs PathGlobs::with_match_error_behavior(GlobMatchErrorBehavior behavior) const {
    return PathGlobs(include_, exclude_, behavior, SharedSpecs{});
}

bool PathGlobs::operator==(const PathGlobs& other) const {
    return behavior_ == other.behavior_
        && *include_ == *other.include_
        && *exclude_ == *other.exclude_;
}

} // namespace tessera
