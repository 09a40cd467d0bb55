#pragma once

#include <tessera/cancel.hpp>
#include <tessera/content_store.hpp>
#include <tessera/result.hpp>
#include <tessera/snapshot.hpp>
#include <tessera/vfs.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace tessera {

// Files up to this size are serialized inline in the tree record; larger
// files are referenced by their own fingerprint and stored as separate
// blobs. Changing it changes every fingerprint.
constexpr size_t kInlineContentLimit = 64;

// One decoded record of a canonical tree serialization.
struct TreeRecord {
    PathStat path_stat;
    bool inlined = false;
    std::string inline_content;     // when inlined
    Fingerprint content_fingerprint; // when referenced
};

// Canonical serialization, one record per path in path order:
//
//   'd' <path>
//   'f' <path> <executable:u8> 0x00 <content>
//   'f' <path> <executable:u8> 0x01 <fingerprint:32 bytes> <length:varint>
//
// Strings are varint length-prefixed. No header is written, so the empty
// tree serializes to zero bytes and hashes to the empty digest.
class DigestEngine {
public:
    // With a store attached, referenced file blobs and the tree
    // serialization itself are written to it.
    explicit DigestEngine(ContentStore* store = nullptr) : store_(store) {}

    // Digest a set of path stats, reading file content from `vfs`. Input
    // order does not matter; duplicate paths are rejected.
    Result<DirectoryDigest> digest(std::vector<PathStat> path_stats,
                                   const Vfs& vfs,
                                   const CancelToken* cancel = nullptr) const;

    // As digest(), returning the Snapshot that binds the result to the
    // path stats, with file sizes taken from the content actually read.
    Result<Snapshot> snapshot(std::vector<PathStat> path_stats,
                              const Vfs& vfs,
                              const CancelToken* cancel = nullptr) const;

    // Decode a stored tree serialization after checking it against `digest`.
    static Result<std::vector<TreeRecord>> read_tree(const DirectoryDigest& digest,
                                                     const ContentStore& store);

    // Rebuild the Snapshot a digest was computed from.
    static Result<Snapshot> decode(const DirectoryDigest& digest,
                                   const ContentStore& store);

private:
    ContentStore* store_;
};

} // namespace tessera
