#include <tessera/snapshot.hpp>

namespace tessera {

const DirectoryDigest& empty_directory_digest() {
    static const DirectoryDigest digest{Fingerprint::of(std::string_view()), 0};
    return digest;
}

std::string DirectoryDigest::to_string() const {
    return "DirectoryDigest(fingerprint=" + fingerprint.hex().substr(0, 8)
        + ", serialized_bytes_length=" + std::to_string(serialized_bytes_length) + ")";
}

const Snapshot& Snapshot::empty_snapshot() {
    static const Snapshot snapshot(empty_directory_digest(), {});
    return snapshot;
}

std::vector<PathStat> Snapshot::files() const {
    std::vector<PathStat> out;
    for (const auto& ps : path_stats_) {
        if (ps.is_file()) out.push_back(ps);
    }
    return out;
}

std::vector<PathStat> Snapshot::dirs() const {
    std::vector<PathStat> out;
    for (const auto& ps : path_stats_) {
        if (ps.is_dir()) out.push_back(ps);
    }
    return out;
}

std::vector<FileStat> Snapshot::file_stats() const {
    std::vector<FileStat> out;
    for (const auto& ps : path_stats_) {
        if (auto* fs = std::get_if<FileStat>(&ps.stat)) out.push_back(*fs);
    }
    return out;
}

std::vector<DirStat> Snapshot::dir_stats() const {
    std::vector<DirStat> out;
    for (const auto& ps : path_stats_) {
        if (auto* ds = std::get_if<DirStat>(&ps.stat)) out.push_back(*ds);
    }
    return out;
}

std::string FileContent::to_string() const {
    return "FileContent(path=" + path + ", content=(len:" + std::to_string(content.size()) + "))";
}

} // namespace tessera
