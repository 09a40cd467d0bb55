#include <catch2/catch.hpp>
#include <tessera/content_store.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <atomic>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace tessera;

static std::string test_db_path() {
    static int counter = 0;
    return "/tmp/tessera_test_store_" + std::to_string(getpid())
           + "_" + std::to_string(counter++) + ".db";
}

static void remove_db(const std::string& path) {
    fs::remove(path);
    fs::remove(path + "-wal");
    fs::remove(path + "-shm");
}

// Exercises the ContentStore contract shared by every implementation.
static void check_store_contract(ContentStore& store) {
    auto fp = store.store("hello world");
    REQUIRE(fp.is_ok());
    REQUIRE(fp.value() == Fingerprint::of("hello world"));

    auto loaded = store.load(fp.value());
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value() == "hello world");
    REQUIRE(store.contains(fp.value()).value());

    // Idempotent
    REQUIRE(store.store("hello world").value() == fp.value());
    REQUIRE(store.blob_count().value() == 1);

    // Empty and binary blobs
    std::string binary("\0\xff\0", 3);
    REQUIRE(store.load(store.store(binary).value()).value() == binary);
    REQUIRE(store.load(store.store("").value()).value().empty());
    REQUIRE(store.blob_count().value() == 3);

    auto missing = store.load(Fingerprint::of("absent"));
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == TesseraError::ContentUnavailable);
    REQUIRE_FALSE(store.contains(Fingerprint::of("absent")).value());

    REQUIRE(store.evict(fp.value()).is_ok());
    REQUIRE_FALSE(store.contains(fp.value()).value());
    REQUIRE(store.load(fp.value()).error().code == TesseraError::ContentUnavailable);
    REQUIRE(store.evict(fp.value()).is_ok());
    REQUIRE(store.blob_count().value() == 2);
}

// ---------------------------------------------------------------------------
// MemoryContentStore
// ---------------------------------------------------------------------------

TEST_CASE("MemoryContentStore store and load", "[content_store]") {
    MemoryContentStore store;
    check_store_contract(store);
}

TEST_CASE("MemoryContentStore concurrent writers", "[content_store]") {
    MemoryContentStore store;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, &failures] {
            for (int i = 0; i < 50; ++i) {
                if (store.store("blob " + std::to_string(i)).is_err()) failures++;
            }
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(failures == 0);
    REQUIRE(store.blob_count().value() == 50);
}

// ---------------------------------------------------------------------------
// SqliteContentStore
// ---------------------------------------------------------------------------

TEST_CASE("SqliteContentStore open creates database file", "[content_store]") {
    auto path = test_db_path();
    SqliteContentStore store;
    REQUIRE_FALSE(store.is_open());
    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.is_open());
    REQUIRE(fs::exists(path));
    store.close();
    REQUIRE_FALSE(store.is_open());
    remove_db(path);
}

TEST_CASE("SqliteContentStore open creates parent directories", "[content_store]") {
    fs::path dir = "/tmp/tessera_test_store_dir_" + std::to_string(getpid());
    fs::remove_all(dir);
    std::string path = (dir / "nested" / "blobs.db").string();

    SqliteContentStore store;
    REQUIRE(store.open(path).is_ok());
    REQUIRE(fs::exists(path));
    store.close();
    fs::remove_all(dir);
}

TEST_CASE("SqliteContentStore store and load", "[content_store]") {
    auto path = test_db_path();
    SqliteContentStore store;
    REQUIRE(store.open(path).is_ok());
    check_store_contract(store);
    store.close();
    remove_db(path);
}

TEST_CASE("SqliteContentStore operations require an open database", "[content_store]") {
    SqliteContentStore store;
    auto r = store.store("x");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TesseraError::IO);
    REQUIRE(store.load(Fingerprint::of("x")).is_err());
    REQUIRE(store.blob_count().is_err());
}

TEST_CASE("SqliteContentStore persists across reopen", "[content_store]") {
    auto path = test_db_path();
    std::string big(10000, 'q');
    Fingerprint fp;
    {
        SqliteContentStore store;
        REQUIRE(store.open(path).is_ok());
        fp = store.store(big).value();
    }
    {
        SqliteContentStore store;
        REQUIRE(store.open(path).is_ok());
        auto loaded = store.load(fp);
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.value() == big);
    }
    remove_db(path);
}

TEST_CASE("SqliteContentStore detects tampered blobs", "[content_store]") {
    auto path = test_db_path();
    SqliteContentStore store;
    REQUIRE(store.open(path).is_ok());
    auto fp = store.store("original").value();
    store.close();

    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    std::string sql = "UPDATE blob SET data = x'00ff' WHERE fingerprint = '" + fp.hex() + "'";
    REQUIRE(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);

    REQUIRE(store.open(path).is_ok());
    auto r = store.load(fp);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TesseraError::Corrupt);

    // The bad row is gone, so storing the content again repairs it.
    REQUIRE_FALSE(store.contains(fp).value());
    REQUIRE(store.store("original").value() == fp);
    REQUIRE(store.load(fp).value() == "original");
    store.close();
    remove_db(path);
}

TEST_CASE("SqliteContentStore repairs a blob row without data", "[content_store]") {
    auto path = test_db_path();
    SqliteContentStore store;
    REQUIRE(store.open(path).is_ok());
    store.close();

    Fingerprint fp = Fingerprint::of("payload");
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    std::string sql = "INSERT INTO blob (fingerprint, size, data, created_at) VALUES ('"
                      + fp.hex() + "', 7, NULL, 0)";
    REQUIRE(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);

    REQUIRE(store.open(path).is_ok());
    auto r = store.load(fp);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TesseraError::Corrupt);

    REQUIRE(store.store("payload").is_ok());
    auto loaded = store.load(fp);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value() == "payload");
    store.close();
    remove_db(path);
}

TEST_CASE("SqliteContentStore rejects blobs over the size limit", "[content_store]") {
    auto path = test_db_path();
    SqliteContentStore store;
    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.set_max_blob_size(1024).is_ok());

    std::string big(4096, 'z');
    auto r = store.store(big);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TesseraError::IO);
    REQUIRE_FALSE(store.contains(Fingerprint::of(big)).value());
    REQUIRE(store.blob_count().value() == 0);

    // Nothing was recorded under the fingerprint, so it stores once allowed.
    REQUIRE(store.set_max_blob_size(1 << 20).is_ok());
    REQUIRE(store.store(big).is_ok());
    REQUIRE(store.load(Fingerprint::of(big)).value() == big);

    // Small blobs are unaffected by a lowered cap.
    REQUIRE(store.set_max_blob_size(1024).is_ok());
    REQUIRE(store.load(store.store("small").value()).value() == "small");
    store.close();
    remove_db(path);
}

TEST_CASE("SqliteContentStore open while locked keeps blobs", "[content_store]") {
    auto path = test_db_path();
    Fingerprint fp;
    {
        SqliteContentStore store;
        REQUIRE(store.open(path).is_ok());
        fp = store.store("kept").value();
    }

    sqlite3* holder = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &holder) == SQLITE_OK);
    REQUIRE(sqlite3_exec(holder, "PRAGMA locking_mode=EXCLUSIVE; BEGIN EXCLUSIVE;",
                         nullptr, nullptr, nullptr) == SQLITE_OK);

    {
        SqliteContentStore store;
        auto r = store.open(path);
        if (r.is_err()) {
            REQUIRE(r.error().code == TesseraError::IO);
            REQUIRE(r.error().file == path);
            REQUIRE_FALSE(store.is_open());
        }
    }

    REQUIRE(sqlite3_exec(holder, "COMMIT;", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(holder);

    SqliteContentStore store;
    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.blob_count().value() == 1);
    REQUIRE(store.load(fp).value() == "kept");
    store.close();
    remove_db(path);
}

TEST_CASE("SqliteContentStore recreates an unreadable database", "[content_store]") {
    auto path = test_db_path();
    {
        std::ofstream f(path, std::ios::binary);
        f << std::string(4096, 'G');
    }

    SqliteContentStore store;
    REQUIRE(store.open(path).is_ok());
    REQUIRE(store.blob_count().value() == 0);
    REQUIRE(store.store("fresh").is_ok());
    store.close();
    remove_db(path);
}

TEST_CASE("SqliteContentStore move keeps the connection", "[content_store]") {
    auto path = test_db_path();
    SqliteContentStore a;
    REQUIRE(a.open(path).is_ok());
    auto fp = a.store("moved").value();

    SqliteContentStore b(std::move(a));
    REQUIRE(b.is_open());
    REQUIRE(b.load(fp).value() == "moved");
    b.close();
    remove_db(path);
}

TEST_CASE("SqliteContentStore default path is under the home directory", "[content_store]") {
    auto p = SqliteContentStore::default_store_path();
    REQUIRE(p.find(".tessera/store/blobs.db") != std::string::npos);
}
