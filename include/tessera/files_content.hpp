#pragma once

#include <tessera/cancel.hpp>
#include <tessera/content_store.hpp>
#include <tessera/result.hpp>
#include <tessera/snapshot.hpp>

namespace tessera {

// Literal bytes of every file in a tree, ordered like Snapshot::files().
// Any blob missing from the store fails the whole call with
// ContentUnavailable, naming each missing path.
Result<FilesContent> read_files_content(const DirectoryDigest& digest,
                                        const ContentStore& store,
                                        const CancelToken* cancel = nullptr);

Result<FilesContent> read_files_content(const Snapshot& snapshot,
                                        const ContentStore& store,
                                        const CancelToken* cancel = nullptr);

// The Snapshot a stored digest was computed from.
Result<Snapshot> snapshot_for_digest(const DirectoryDigest& digest,
                                     const ContentStore& store);

} // namespace tessera
