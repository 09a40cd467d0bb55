#pragma once

#include <tessera/result.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace tessera {

enum class EntryKind { File, Dir };

struct DirEntry {
    std::string name;       // single path segment
    EntryKind kind = EntryKind::File;
    uint64_t size = 0;      // files only
    bool executable = false;
};

// Read-only view of a directory tree. Paths are relative to the tree's
// root, '/'-separated; "" names the root. Implementations must be safe to
// call from several threads at once.
class Vfs {
public:
    virtual ~Vfs() = default;

    // Immediate children of `dir`, sorted by name. IO error when `dir` is
    // missing or unreadable.
    virtual Result<std::vector<DirEntry>> list_dir(const std::string& dir) const = 0;

    // Full content of a file. IO error when it cannot be read.
    virtual Result<std::string> read_file(const std::string& path) const = 0;

    // Human-readable root, for messages.
    virtual std::string root_name() const = 0;
};

// A real directory on disk. Symlinks are followed; broken links, special
// files and links back into an ancestor directory are skipped.
class DiskVfs : public Vfs {
public:
    explicit DiskVfs(std::filesystem::path root);

    Result<std::vector<DirEntry>> list_dir(const std::string& dir) const override;
    Result<std::string> read_file(const std::string& path) const override;
    std::string root_name() const override { return root_.string(); }

private:
    std::filesystem::path root_;
};

// An in-memory tree. Populate it first, then share it read-only.
class MemoryVfs : public Vfs {
public:
    MemoryVfs() = default;

    // Adds a file, creating any missing parent directories.
    void add_file(const std::string& path, std::string content, bool executable = false);

    // Adds an (empty) directory and its parents.
    void add_dir(const std::string& path);

    // Subsequent reads of `path` fail with an IO error.
    void set_unreadable(const std::string& path);

    Result<std::vector<DirEntry>> list_dir(const std::string& dir) const override;
    Result<std::string> read_file(const std::string& path) const override;
    std::string root_name() const override { return "<memory>"; }

private:
    struct Node {
        EntryKind kind = EntryKind::Dir;
        std::string content;
        bool executable = false;
        bool readable = true;
    };

    std::map<std::string, Node> nodes_;
};

} // namespace tessera
