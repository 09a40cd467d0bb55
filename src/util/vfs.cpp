#include <tessera/vfs.hpp>
#include <tessera/glob.hpp>
#include <tessera/log.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace tessera {

// ---------------------------------------------------------------------------
// DiskVfs
// ---------------------------------------------------------------------------

DiskVfs::DiskVfs(fs::path root) : root_(std::move(root)) {}

// True when `target` is `dir` itself or one of its ancestors.
static bool is_ancestor_or_self(const fs::path& target, const fs::path& dir) {
    auto t = target.begin();
    auto d = dir.begin();
    for (; t != target.end(); ++t, ++d) {
        if (d == dir.end() || *t != *d) return false;
    }
    return true;
}

Result<std::vector<DirEntry>> DiskVfs::list_dir(const std::string& dir) const {
    fs::path abs = dir.empty() ? root_ : root_ / dir;
    std::error_code ec;
    if (!fs::is_directory(abs, ec)) {
        return TesseraError(TesseraError::IO,
            "not a directory: " + abs.string(), "", root_.string());
    }

    fs::path canonical_dir = fs::weakly_canonical(abs, ec);
    if (ec) canonical_dir = abs;

    std::vector<DirEntry> entries;
    fs::directory_iterator it(abs, ec);
    if (ec) {
        return TesseraError(TesseraError::IO,
            "cannot list directory " + abs.string() + ": " + ec.message(),
            "", root_.string());
    }
    for (const auto& entry : it) {
        std::error_code sec;
        fs::file_status st = entry.status(sec);
        std::string name = entry.path().filename().string();
        if (sec) {
            log::debug("skipping unresolvable entry: %s", entry.path().string().c_str());
            continue;
        }

        DirEntry de;
        de.name = name;
        if (fs::is_regular_file(st)) {
            de.kind = EntryKind::File;
            de.size = entry.file_size(sec);
            if (sec) de.size = 0;
            de.executable = (st.permissions() & fs::perms::owner_exec) != fs::perms::none;
        } else if (fs::is_directory(st)) {
            if (entry.is_symlink(sec)) {
                fs::path target = fs::canonical(entry.path(), sec);
                if (sec || is_ancestor_or_self(target, canonical_dir)) {
                    log::debug("skipping symlink loop: %s", entry.path().string().c_str());
                    continue;
                }
            }
            de.kind = EntryKind::Dir;
        } else {
            log::debug("skipping special file: %s", entry.path().string().c_str());
            continue;
        }
        entries.push_back(std::move(de));
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    return Result<std::vector<DirEntry>>::ok(std::move(entries));
}

Result<std::string> DiskVfs::read_file(const std::string& path) const {
    fs::path abs = root_ / path;
    std::ifstream in(abs, std::ios::binary);
    if (!in.is_open()) {
        return TesseraError(TesseraError::IO,
            "cannot open file: " + abs.string(), "", root_.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return TesseraError(TesseraError::IO,
            "error reading file: " + abs.string(), "", root_.string());
    }
    return Result<std::string>::ok(ss.str());
}

// ---------------------------------------------------------------------------
// MemoryVfs
// ---------------------------------------------------------------------------

static std::string parent_of(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

void MemoryVfs::add_dir(const std::string& path) {
    std::string norm = glob_normalize(path);
    while (!norm.empty()) {
        nodes_[norm].kind = EntryKind::Dir;
        norm = parent_of(norm);
    }
}

void MemoryVfs::add_file(const std::string& path, std::string content, bool executable) {
    std::string norm = glob_normalize(path);
    add_dir(parent_of(norm));
    Node& node = nodes_[norm];
    node.kind = EntryKind::File;
    node.content = std::move(content);
    node.executable = executable;
}

void MemoryVfs::set_unreadable(const std::string& path) {
    auto it = nodes_.find(glob_normalize(path));
    if (it != nodes_.end()) it->second.readable = false;
}

Result<std::vector<DirEntry>> MemoryVfs::list_dir(const std::string& dir) const {
    if (!dir.empty()) {
        auto it = nodes_.find(dir);
        if (it == nodes_.end() || it->second.kind != EntryKind::Dir) {
            return TesseraError(TesseraError::IO, "not a directory: " + dir);
        }
        if (!it->second.readable) {
            return TesseraError(TesseraError::IO, "permission denied: " + dir);
        }
    }

    std::vector<DirEntry> entries;
    for (const auto& [path, node] : nodes_) {
        if (parent_of(path) != dir) continue;
        DirEntry de;
        de.name = dir.empty() ? path : path.substr(dir.size() + 1);
        de.kind = node.kind;
        de.size = node.kind == EntryKind::File ? node.content.size() : 0;
        de.executable = node.executable;
        entries.push_back(std::move(de));
    }
    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    return Result<std::vector<DirEntry>>::ok(std::move(entries));
}

Result<std::string> MemoryVfs::read_file(const std::string& path) const {
    auto it = nodes_.find(path);
    if (it == nodes_.end() || it->second.kind != EntryKind::File) {
        return TesseraError(TesseraError::IO, "no such file: " + path);
    }
    if (!it->second.readable) {
        return TesseraError(TesseraError::IO, "permission denied: " + path);
    }
    return Result<std::string>::ok(it->second.content);
}

} // namespace tessera
