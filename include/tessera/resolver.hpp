#pragma once

#include <tessera/cancel.hpp>
#include <tessera/path_globs.hpp>
#include <tessera/result.hpp>
#include <tessera/snapshot.hpp>
#include <tessera/vfs.hpp>

#include <string>
#include <vector>

namespace tessera {

struct Resolution {
    std::vector<PathStat> path_stats;   // sorted by path, unique
    std::vector<std::string> warnings;  // zero-match diagnostics under Warn
};

// Expands PathGlobs against a tree: union of include matches, minus
// anything an exclude matches, sorted by path and tagged with its stat.
class PathStatResolver {
public:
    // Resolve against an arbitrary tree.
    static Result<Resolution> resolve(const PathGlobs& globs,
                                      const Vfs& vfs,
                                      const CancelToken* cancel = nullptr);

    // Resolve against the directory named by `request.root`.
    static Result<Resolution> resolve(const PathGlobsAndRoot& request,
                                      const CancelToken* cancel = nullptr);
};

} // namespace tessera
