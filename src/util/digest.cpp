#include <tessera/digest.hpp>
#include <tessera/log.hpp>

#include <algorithm>

namespace tessera {

static constexpr uint8_t KIND_DIR = 'd';
static constexpr uint8_t KIND_FILE = 'f';
static constexpr uint8_t CONTENT_INLINE = 0x00;
static constexpr uint8_t CONTENT_REF = 0x01;

// ---------------------------------------------------------------------------
// Binary serialization helpers (varint + length-prefixed strings)
// ---------------------------------------------------------------------------

namespace ser {

static void write_varint(std::string& buf, uint64_t val) {
    while (val >= 0x80) {
        buf.push_back(static_cast<char>((val & 0x7F) | 0x80));
        val >>= 7;
    }
    buf.push_back(static_cast<char>(val));
}

static bool read_varint(const uint8_t*& p, const uint8_t* end, uint64_t& val) {
    val = 0;
    unsigned shift = 0;
    while (p < end) {
        uint8_t b = *p++;
        val |= static_cast<uint64_t>(b & 0x7F) << shift;
        if (!(b & 0x80)) return true;
        shift += 7;
        if (shift >= 64) return false;
    }
    return false;
}

static void write_string(std::string& buf, const std::string& s) {
    write_varint(buf, s.size());
    buf.append(s);
}

static bool read_string(const uint8_t*& p, const uint8_t* end, std::string& s) {
    uint64_t len;
    if (!read_varint(p, end, len)) return false;
    if (len > static_cast<uint64_t>(end - p)) return false;
    s.assign(reinterpret_cast<const char*>(p), static_cast<size_t>(len));
    p += len;
    return true;
}

static void write_byte(std::string& buf, uint8_t v) {
    buf.push_back(static_cast<char>(v));
}

static bool read_byte(const uint8_t*& p, const uint8_t* end, uint8_t& v) {
    if (p >= end) return false;
    v = *p++;
    return true;
}

static void write_fingerprint(std::string& buf, const Fingerprint& fp) {
    buf.append(reinterpret_cast<const char*>(fp.bytes.data()), Fingerprint::kSize);
}

static bool read_fingerprint(const uint8_t*& p, const uint8_t* end, Fingerprint& fp) {
    if (static_cast<size_t>(end - p) < Fingerprint::kSize) return false;
    fp = Fingerprint::from_raw(p);
    p += Fingerprint::kSize;
    return true;
}

} // namespace ser

// ---------------------------------------------------------------------------
// Serialization of a tree
// ---------------------------------------------------------------------------

namespace {

struct Serialized {
    std::vector<PathStat> path_stats;
    std::string bytes;
};

TesseraError corrupt(const DirectoryDigest& digest, const std::string& what) {
    return TesseraError(TesseraError::Corrupt,
        "corrupted tree " + digest.fingerprint.hex() + ": " + what);
}

} // namespace

static Result<Serialized> serialize_tree(std::vector<PathStat> path_stats,
                                         const Vfs& vfs,
                                         ContentStore* store,
                                         const CancelToken* cancel) {
    std::sort(path_stats.begin(), path_stats.end(),
              [](const PathStat& a, const PathStat& b) { return a.path < b.path; });
    for (size_t i = 1; i < path_stats.size(); ++i) {
        if (path_stats[i].path == path_stats[i - 1].path) {
            return TesseraError(TesseraError::InvalidArg,
                "duplicate path in tree: " + path_stats[i].path);
        }
    }

    Serialized out;
    for (auto& ps : path_stats) {
        if (ps.is_dir()) {
            ser::write_byte(out.bytes, KIND_DIR);
            ser::write_string(out.bytes, ps.path);
            continue;
        }

        TESSERA_TRY(check_cancelled(cancel, "digest of " + vfs.root_name()));

        auto content = vfs.read_file(ps.path);
        if (content.is_err()) {
            return TesseraError(TesseraError::ContentUnavailable,
                "content unavailable for '" + ps.path + "'",
                content.error().message, vfs.root_name());
        }
        const std::string& bytes = content.value();

        auto& file = std::get<FileStat>(ps.stat);
        file.size = bytes.size();

        ser::write_byte(out.bytes, KIND_FILE);
        ser::write_string(out.bytes, ps.path);
        ser::write_byte(out.bytes, file.is_executable ? 1 : 0);
        if (bytes.size() <= kInlineContentLimit) {
            ser::write_byte(out.bytes, CONTENT_INLINE);
            ser::write_string(out.bytes, bytes);
        } else {
            Fingerprint fp = Fingerprint::of(bytes);
            if (store) {
                TESSERA_TRY(store->store(bytes));
            }
            ser::write_byte(out.bytes, CONTENT_REF);
            ser::write_fingerprint(out.bytes, fp);
            ser::write_varint(out.bytes, bytes.size());
        }
    }

    out.path_stats = std::move(path_stats);
    return Result<Serialized>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// DigestEngine
// ---------------------------------------------------------------------------

Result<Snapshot> DigestEngine::snapshot(std::vector<PathStat> path_stats,
                                        const Vfs& vfs,
                                        const CancelToken* cancel) const {
    if (path_stats.empty()) {
        return Result<Snapshot>::ok(Snapshot::empty_snapshot());
    }

    TESSERA_TRY_ASSIGN(auto serialized,
                       serialize_tree(std::move(path_stats), vfs, store_, cancel));

    DirectoryDigest digest{Fingerprint::of(serialized.bytes), serialized.bytes.size()};
    if (store_) {
        TESSERA_TRY(store_->store(serialized.bytes));
    }

    log::debug("digested %zu paths: %s", serialized.path_stats.size(),
               digest.to_string().c_str());
    return Result<Snapshot>::ok(Snapshot(digest, std::move(serialized.path_stats)));
}

Result<DirectoryDigest> DigestEngine::digest(std::vector<PathStat> path_stats,
                                             const Vfs& vfs,
                                             const CancelToken* cancel) const {
    return snapshot(std::move(path_stats), vfs, cancel)
        .map([](Snapshot& s) { return s.digest(); });
}

Result<std::vector<TreeRecord>> DigestEngine::read_tree(const DirectoryDigest& digest,
                                                        const ContentStore& store) {
    std::vector<TreeRecord> records;
    if (digest == empty_directory_digest()) {
        return Result<std::vector<TreeRecord>>::ok(std::move(records));
    }

    TESSERA_TRY_ASSIGN(std::string bytes, store.load(digest.fingerprint));
    if (bytes.size() != digest.serialized_bytes_length) {
        return corrupt(digest, "expected " + std::to_string(digest.serialized_bytes_length)
            + " bytes, found " + std::to_string(bytes.size()));
    }

    const uint8_t* p = reinterpret_cast<const uint8_t*>(bytes.data());
    const uint8_t* end = p + bytes.size();
    while (p < end) {
        TreeRecord rec;
        uint8_t kind;
        if (!ser::read_byte(p, end, kind) || !ser::read_string(p, end, rec.path_stat.path)) {
            return corrupt(digest, "truncated record header");
        }

        if (kind == KIND_DIR) {
            rec.path_stat.stat = DirStat{};
        } else if (kind == KIND_FILE) {
            uint8_t exec;
            uint8_t storage;
            if (!ser::read_byte(p, end, exec) || !ser::read_byte(p, end, storage)) {
                return corrupt(digest, "truncated file record for " + rec.path_stat.path);
            }
            FileStat file;
            file.is_executable = exec != 0;
            if (storage == CONTENT_INLINE) {
                if (!ser::read_string(p, end, rec.inline_content)) {
                    return corrupt(digest, "truncated inline content for " + rec.path_stat.path);
                }
                rec.inlined = true;
                file.size = rec.inline_content.size();
            } else if (storage == CONTENT_REF) {
                uint64_t len;
                if (!ser::read_fingerprint(p, end, rec.content_fingerprint) ||
                    !ser::read_varint(p, end, len)) {
                    return corrupt(digest, "truncated content reference for " + rec.path_stat.path);
                }
                file.size = len;
            } else {
                return corrupt(digest, "unknown content storage tag for " + rec.path_stat.path);
            }
            rec.path_stat.stat = file;
        } else {
            return corrupt(digest, "unknown record kind " + std::to_string(kind));
        }

        if (!records.empty() && !(records.back().path_stat.path < rec.path_stat.path)) {
            return corrupt(digest, "records out of order at " + rec.path_stat.path);
        }
        records.push_back(std::move(rec));
    }

    return Result<std::vector<TreeRecord>>::ok(std::move(records));
}

Result<Snapshot> DigestEngine::decode(const DirectoryDigest& digest,
                                      const ContentStore& store) {
    TESSERA_TRY_ASSIGN(auto records, read_tree(digest, store));
    if (records.empty()) {
        return Result<Snapshot>::ok(Snapshot::empty_snapshot());
    }

    std::vector<PathStat> path_stats;
    path_stats.reserve(records.size());
    for (auto& rec : records) {
        path_stats.push_back(std::move(rec.path_stat));
    }
    return Result<Snapshot>::ok(Snapshot(digest, std::move(path_stats)));
}

} // namespace tessera
