#include <tessera/engine.hpp>
#include <tessera/digest.hpp>
#include <tessera/files_content.hpp>
#include <tessera/resolver.hpp>

namespace tessera {

SnapshotEngine::SnapshotEngine(ContentStore& store) : store_(store) {}

Result<Snapshot> SnapshotEngine::snapshot(const PathGlobs& globs, const Vfs& vfs,
                                          const CancelToken* cancel) const {
    TESSERA_TRY_ASSIGN(auto resolution, PathStatResolver::resolve(globs, vfs, cancel));
    DigestEngine engine(&store_);
    return engine.snapshot(std::move(resolution.path_stats), vfs, cancel);
}

Result<Snapshot> SnapshotEngine::snapshot(const PathGlobsAndRoot& request,
                                          const CancelToken* cancel) const {
    DiskVfs vfs(request.root);
    return snapshot(request.path_globs, vfs, cancel);
}

Result<DirectoryDigest> SnapshotEngine::digest(const PathGlobsAndRoot& request,
                                               const CancelToken* cancel) const {
    return snapshot(request, cancel).map([](Snapshot& s) { return s.digest(); });
}

Result<FilesContent> SnapshotEngine::files_content(const DirectoryDigest& digest,
                                                   const CancelToken* cancel) const {
    return read_files_content(digest, store_, cancel);
}

Result<FilesContent> SnapshotEngine::files_content(const Snapshot& snapshot,
                                                   const CancelToken* cancel) const {
    return read_files_content(snapshot, store_, cancel);
}

Result<Snapshot> SnapshotEngine::snapshot_for_digest(const DirectoryDigest& digest) const {
    return tessera::snapshot_for_digest(digest, store_);
}

} // namespace tessera
