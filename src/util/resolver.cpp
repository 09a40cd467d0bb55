#include <tessera/resolver.hpp>
#include <tessera/glob.hpp>
#include <tessera/log.hpp>

#include <algorithm>
#include <queue>

namespace tessera {

namespace {

struct WalkedEntry {
    std::string path;
    DirEntry entry;
};

std::string join_quoted(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += "'" + items[i] + "'";
    }
    return out;
}

bool any_reaches_below(const std::vector<std::string>& patterns, const std::string& dir) {
    for (const auto& p : patterns) {
        if (glob_could_match_below(p, dir)) return true;
    }
    return false;
}

// Breadth-first walk of every directory an include could reach.
Result<std::vector<WalkedEntry>> walk(const std::vector<std::string>& includes,
                                      const Vfs& vfs,
                                      const CancelToken* cancel) {
    std::vector<WalkedEntry> walked;
    std::queue<std::string> pending;
    pending.push("");

    while (!pending.empty()) {
        TESSERA_TRY(check_cancelled(cancel, "path resolution under " + vfs.root_name()));

        std::string dir = std::move(pending.front());
        pending.pop();

        TESSERA_TRY_ASSIGN(auto entries, vfs.list_dir(dir).with_file(vfs.root_name()));

        for (auto& entry : entries) {
            std::string path = dir.empty() ? entry.name : dir + "/" + entry.name;
            if (entry.kind == EntryKind::Dir && any_reaches_below(includes, path)) {
                pending.push(path);
            }
            walked.push_back(WalkedEntry{std::move(path), std::move(entry)});
        }
    }

    log::trace("walked %zu entries under %s", walked.size(), vfs.root_name().c_str());
    return Result<std::vector<WalkedEntry>>::ok(std::move(walked));
}

Stat stat_of(const DirEntry& entry) {
    if (entry.kind == EntryKind::Dir) return DirStat{};
    return FileStat{entry.size, entry.executable};
}

} // namespace

// ---------------------------------------------------------------------------
// resolve()
// ---------------------------------------------------------------------------

Result<Resolution> PathStatResolver::resolve(const PathGlobs& globs,
                                             const Vfs& vfs,
                                             const CancelToken* cancel)
{
    for (const auto& spec : globs.include()) TESSERA_TRY(glob_validate(spec));
    for (const auto& spec : globs.exclude()) TESSERA_TRY(glob_validate(spec));

    TESSERA_TRY_ASSIGN(auto walked, walk(globs.include(), vfs, cancel));

    // Include matches, with every unmatched filespec remembered
    std::vector<bool> selected(walked.size(), false);
    std::vector<std::string> unmatched;
    for (const auto& spec : globs.include()) {
        bool matched = false;
        for (size_t i = 0; i < walked.size(); ++i) {
            if (glob_match(spec, walked[i].path)) {
                selected[i] = true;
                matched = true;
            }
        }
        if (!matched) unmatched.push_back(spec);
    }

    Resolution resolution;
    if (!unmatched.empty()) {
        switch (globs.match_error_behavior()) {
            case GlobMatchErrorBehavior::Ignore:
                break;
            case GlobMatchErrorBehavior::Warn:
                for (const auto& spec : unmatched) {
                    std::string msg = "filespec '" + spec + "' matched no paths under "
                        + vfs.root_name();
                    log::warn("%s", msg.c_str());
                    resolution.warnings.push_back(std::move(msg));
                }
                break;
            case GlobMatchErrorBehavior::Error: {
                std::string hint = globs.exclude().empty()
                    ? std::string("check the filespec against the files under the root")
                    : "excludes were: " + join_quoted(globs.exclude());
                return TesseraError(TesseraError::GlobMatch,
                    "filespecs matched no paths: " + join_quoted(unmatched),
                    std::move(hint), vfs.root_name());
            }
        }
    }

    // Excludes only remove; matching nothing is fine under any policy
    for (size_t i = 0; i < walked.size(); ++i) {
        if (!selected[i]) continue;
        for (const auto& spec : globs.exclude()) {
            if (glob_match(spec, walked[i].path)) {
                selected[i] = false;
                break;
            }
        }
    }

    for (size_t i = 0; i < walked.size(); ++i) {
        if (!selected[i]) continue;
        resolution.path_stats.push_back(PathStat{walked[i].path, stat_of(walked[i].entry)});
    }
    std::sort(resolution.path_stats.begin(), resolution.path_stats.end(),
              [](const PathStat& a, const PathStat& b) { return a.path < b.path; });

    log::debug("resolved %zu paths under %s",
               resolution.path_stats.size(), vfs.root_name().c_str());
    return Result<Resolution>::ok(std::move(resolution));
}

Result<Resolution> PathStatResolver::resolve(const PathGlobsAndRoot& request,
                                             const CancelToken* cancel)
{
    DiskVfs vfs(request.root);
    return resolve(request.path_globs, vfs, cancel);
}

} // namespace tessera
