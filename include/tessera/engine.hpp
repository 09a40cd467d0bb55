#pragma once

#include <tessera/cancel.hpp>
#include <tessera/content_store.hpp>
#include <tessera/path_globs.hpp>
#include <tessera/result.hpp>
#include <tessera/snapshot.hpp>
#include <tessera/vfs.hpp>

namespace tessera {

// Entry points for callers that stage sandboxes or export trees.
// Holds no mutable state of its own; concurrent calls are safe as long
// as the store is.
class SnapshotEngine {
public:
    explicit SnapshotEngine(ContentStore& store);

    // Resolve globs under `request.root`, digest the result and store its
    // content. Zero-match warnings go to the log.
    Result<Snapshot> snapshot(const PathGlobsAndRoot& request,
                              const CancelToken* cancel = nullptr) const;

    Result<Snapshot> snapshot(const PathGlobs& globs, const Vfs& vfs,
                              const CancelToken* cancel = nullptr) const;

    Result<DirectoryDigest> digest(const PathGlobsAndRoot& request,
                                   const CancelToken* cancel = nullptr) const;

    Result<FilesContent> files_content(const DirectoryDigest& digest,
                                       const CancelToken* cancel = nullptr) const;
    Result<FilesContent> files_content(const Snapshot& snapshot,
                                       const CancelToken* cancel = nullptr) const;

    Result<Snapshot> snapshot_for_digest(const DirectoryDigest& digest) const;

private:
    ContentStore& store_;
};

} // namespace tessera
