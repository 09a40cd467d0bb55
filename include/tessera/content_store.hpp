#pragma once

#include <tessera/hash.hpp>
#include <tessera/result.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace tessera {

// Content-addressed blob storage keyed by Fingerprint::of(bytes).
// Writes are idempotent: storing bytes that are already present is a no-op.
// Implementations are safe for concurrent use.
class ContentStore {
public:
    virtual ~ContentStore() = default;

    // Store `bytes`, returning their fingerprint.
    virtual Result<Fingerprint> store(const std::string& bytes) = 0;

    // Fetch the bytes for `fp`. ContentUnavailable when absent, Corrupt
    // when the stored bytes no longer hash to `fp`.
    virtual Result<std::string> load(const Fingerprint& fp) const = 0;

    virtual Result<bool> contains(const Fingerprint& fp) const = 0;

    // Drop a blob. Evicting an absent blob succeeds.
    virtual Status evict(const Fingerprint& fp) = 0;

    virtual Result<uint64_t> blob_count() const = 0;
};

class MemoryContentStore : public ContentStore {
public:
    Result<Fingerprint> store(const std::string& bytes) override;
    Result<std::string> load(const Fingerprint& fp) const override;
    Result<bool> contains(const Fingerprint& fp) const override;
    Status evict(const Fingerprint& fp) override;
    Result<uint64_t> blob_count() const override;

private:
    mutable std::mutex mutex_;
    std::map<Fingerprint, std::string> blobs_;
};

// Blobs in a single SQLite database (WAL mode).
//
// Schema:
//   schema_info(key TEXT PRIMARY KEY, value TEXT)
//   blob(fingerprint TEXT PRIMARY KEY, size INTEGER, data BLOB, created_at INTEGER)
class SqliteContentStore : public ContentStore {
public:
    SqliteContentStore();
    ~SqliteContentStore() override;
    SqliteContentStore(SqliteContentStore&&) noexcept;
    SqliteContentStore& operator=(SqliteContentStore&&) noexcept;

    // Database lifecycle
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Default: ~/.tessera/store/blobs.db
    static std::string default_store_path();

    // Cap the size of a single blob on the open connection. Larger blobs
    // fail to store with an IO error. Returns the previous cap.
    Result<uint64_t> set_max_blob_size(uint64_t bytes);

    Result<Fingerprint> store(const std::string& bytes) override;
    Result<std::string> load(const Fingerprint& fp) const override;
    Result<bool> contains(const Fingerprint& fp) const override;
    Status evict(const Fingerprint& fp) override;
    Result<uint64_t> blob_count() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tessera
