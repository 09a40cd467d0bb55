#pragma once

#include <tessera/hash.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tessera {

struct FileStat {
    uint64_t size = 0;
    bool is_executable = false;

    bool operator==(const FileStat& o) const {
        return size == o.size && is_executable == o.is_executable;
    }
    bool operator!=(const FileStat& o) const { return !(*this == o); }
};

struct DirStat {
    bool operator==(const DirStat&) const { return true; }
    bool operator!=(const DirStat&) const { return false; }
};

using Stat = std::variant<FileStat, DirStat>;

// A path relative to the snapshot root together with what it is.
struct PathStat {
    std::string path;
    Stat stat;

    bool is_file() const { return std::holds_alternative<FileStat>(stat); }
    bool is_dir() const { return std::holds_alternative<DirStat>(stat); }

    bool operator==(const PathStat& o) const { return path == o.path && stat == o.stat; }
    bool operator!=(const PathStat& o) const { return !(*this == o); }
};

// Identity of a tree: the hash of its canonical serialization and the
// length of that serialization.
struct DirectoryDigest {
    Fingerprint fingerprint;
    uint64_t serialized_bytes_length = 0;

    // "DirectoryDigest(fingerprint=e3b0c442, serialized_bytes_length=0)"
    std::string to_string() const;

    bool operator==(const DirectoryDigest& o) const {
        return fingerprint == o.fingerprint
            && serialized_bytes_length == o.serialized_bytes_length;
    }
    bool operator!=(const DirectoryDigest& o) const { return !(*this == o); }
};

// The digest of the tree with no entries: the hash of zero bytes.
const DirectoryDigest& empty_directory_digest();

class DigestEngine;

// A digest bound to the path stats it was computed from. Only the digest
// engine pairs the two, so a Snapshot is always self-consistent.
class Snapshot {
public:
    const DirectoryDigest& digest() const { return digest_; }
    const std::vector<PathStat>& path_stats() const { return path_stats_; }

    std::vector<PathStat> files() const;
    std::vector<PathStat> dirs() const;
    std::vector<FileStat> file_stats() const;
    std::vector<DirStat> dir_stats() const;

    bool empty() const { return path_stats_.empty(); }

    bool operator==(const Snapshot& o) const {
        return digest_ == o.digest_ && path_stats_ == o.path_stats_;
    }
    bool operator!=(const Snapshot& o) const { return !(*this == o); }

    // No paths, empty digest.
    static const Snapshot& empty_snapshot();

private:
    friend class DigestEngine;

    Snapshot(DirectoryDigest digest, std::vector<PathStat> path_stats)
        : digest_(std::move(digest)), path_stats_(std::move(path_stats)) {}

    DirectoryDigest digest_;
    std::vector<PathStat> path_stats_;
};

struct FileContent {
    std::string path;
    std::string content;

    // Renders the path and content length, never the bytes.
    std::string to_string() const;

    bool operator==(const FileContent& o) const {
        return path == o.path && content == o.content;
    }
};

using FilesContent = std::vector<FileContent>;

} // namespace tessera
