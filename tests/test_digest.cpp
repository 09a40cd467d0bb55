#include <catch2/catch.hpp>
#include <tessera/digest.hpp>

using namespace tessera;

static PathStat file_stat(const std::string& path, bool exec = false) {
    return PathStat{path, FileStat{0, exec}};
}

static PathStat dir_stat(const std::string& path) {
    return PathStat{path, DirStat{}};
}

static DirectoryDigest digest_of(const MemoryVfs& vfs, std::vector<PathStat> stats) {
    DigestEngine engine;
    auto r = engine.digest(std::move(stats), vfs);
    REQUIRE(r.is_ok());
    return r.value();
}

TEST_CASE("Digest of no paths is the empty digest", "[digest]") {
    MemoryVfs vfs;
    REQUIRE(digest_of(vfs, {}) == empty_directory_digest());

    DigestEngine engine;
    auto snap = engine.snapshot({}, vfs);
    REQUIRE(snap.is_ok());
    REQUIRE(snap.value() == Snapshot::empty_snapshot());
}

TEST_CASE("Digest is deterministic and ignores input order", "[digest]") {
    MemoryVfs vfs;
    vfs.add_file("a/1.txt", "x");
    vfs.add_file("a/2.txt", "y");
    vfs.add_dir("b");

    auto d1 = digest_of(vfs, {file_stat("a/1.txt"), file_stat("a/2.txt"), dir_stat("b")});
    auto d2 = digest_of(vfs, {dir_stat("b"), file_stat("a/2.txt"), file_stat("a/1.txt")});
    auto d3 = digest_of(vfs, {file_stat("a/1.txt"), file_stat("a/2.txt"), dir_stat("b")});
    REQUIRE(d1 == d2);
    REQUIRE(d1 == d3);
    REQUIRE(d1.serialized_bytes_length > 0);
}

TEST_CASE("Digest binds file content", "[digest]") {
    MemoryVfs before;
    before.add_file("a.txt", "one");
    MemoryVfs after;
    after.add_file("a.txt", "two");

    REQUIRE(digest_of(before, {file_stat("a.txt")}) != digest_of(after, {file_stat("a.txt")}));
}

TEST_CASE("Digest binds paths and kinds", "[digest]") {
    MemoryVfs vfs;
    vfs.add_file("a.txt", "same");
    vfs.add_file("b.txt", "same");
    vfs.add_dir("c");

    auto a = digest_of(vfs, {file_stat("a.txt")});
    auto b = digest_of(vfs, {file_stat("b.txt")});
    REQUIRE(a != b);

    // An empty directory still contributes to the digest
    auto with_dir = digest_of(vfs, {file_stat("a.txt"), dir_stat("c")});
    REQUIRE(with_dir != a);
}

TEST_CASE("Digest binds the executable bit", "[digest]") {
    MemoryVfs plain;
    plain.add_file("run.sh", "echo hi");
    MemoryVfs exec;
    exec.add_file("run.sh", "echo hi", true);

    REQUIRE(digest_of(plain, {file_stat("run.sh", false)}) !=
            digest_of(exec, {file_stat("run.sh", true)}));
}

TEST_CASE("Digest sizes come from the content read", "[digest]") {
    MemoryVfs vfs;
    vfs.add_file("a.txt", "hello");

    DigestEngine engine;
    auto snap = engine.snapshot({PathStat{"a.txt", FileStat{999, false}}}, vfs);
    REQUIRE(snap.is_ok());
    REQUIRE(snap.value().file_stats()[0].size == 5);
}

TEST_CASE("Digest rejects duplicate paths", "[digest]") {
    MemoryVfs vfs;
    vfs.add_file("a.txt", "x");

    DigestEngine engine;
    auto r = engine.digest({file_stat("a.txt"), file_stat("a.txt")}, vfs);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TesseraError::InvalidArg);
    REQUIRE(r.error().message.find("a.txt") != std::string::npos);
}

TEST_CASE("Digest of an unreadable file names the path", "[digest]") {
    MemoryVfs vfs;
    vfs.add_file("ok.txt", "x");
    vfs.add_file("locked.txt", "y");
    vfs.set_unreadable("locked.txt");

    DigestEngine engine;
    auto r = engine.digest({file_stat("ok.txt"), file_stat("locked.txt")}, vfs);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TesseraError::ContentUnavailable);
    REQUIRE(r.error().message.find("locked.txt") != std::string::npos);

    auto gone = engine.digest({file_stat("vanished.txt")}, vfs);
    REQUIRE(gone.is_err());
    REQUIRE(gone.error().code == TesseraError::ContentUnavailable);
}

TEST_CASE("Digest observes cancellation", "[digest]") {
    MemoryVfs vfs;
    vfs.add_file("a.txt", "x");
    CancelToken token;
    token.cancel();

    DigestEngine engine;
    auto r = engine.digest({file_stat("a.txt")}, vfs, &token);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TesseraError::Cancelled);
}

TEST_CASE("Small files are inlined, large files referenced", "[digest]") {
    MemoryVfs vfs;
    std::string small(kInlineContentLimit, 's');
    std::string large(kInlineContentLimit + 1, 'l');
    vfs.add_file("small.bin", small);
    vfs.add_file("large.bin", large);

    MemoryContentStore store;
    DigestEngine engine(&store);
    auto snap = engine.snapshot({file_stat("small.bin"), file_stat("large.bin")}, vfs);
    REQUIRE(snap.is_ok());

    // Tree serialization plus the one referenced blob
    REQUIRE(store.blob_count().value() == 2);
    REQUIRE(store.contains(Fingerprint::of(large)).value());
    REQUIRE_FALSE(store.contains(Fingerprint::of(small)).value());
    REQUIRE(store.contains(snap.value().digest().fingerprint).value());

    auto records = DigestEngine::read_tree(snap.value().digest(), store);
    REQUIRE(records.is_ok());
    REQUIRE(records.value().size() == 2);
    const auto& large_rec = records.value()[0];
    const auto& small_rec = records.value()[1];
    REQUIRE(large_rec.path_stat.path == "large.bin");
    REQUIRE_FALSE(large_rec.inlined);
    REQUIRE(large_rec.content_fingerprint == Fingerprint::of(large));
    REQUIRE(std::get<FileStat>(large_rec.path_stat.stat).size == large.size());
    REQUIRE(small_rec.inlined);
    REQUIRE(small_rec.inline_content == small);
}

TEST_CASE("Stored serialization hashes to the digest", "[digest]") {
    MemoryVfs vfs;
    vfs.add_file("a/1.txt", "x");
    vfs.add_dir("b");

    MemoryContentStore store;
    DigestEngine engine(&store);
    auto d = engine.digest({file_stat("a/1.txt"), dir_stat("b")}, vfs);
    REQUIRE(d.is_ok());

    auto bytes = store.load(d.value().fingerprint);
    REQUIRE(bytes.is_ok());
    REQUIRE(bytes.value().size() == d.value().serialized_bytes_length);
    REQUIRE(Fingerprint::of(bytes.value()) == d.value().fingerprint);

    // Same digest with or without a store attached
    REQUIRE(digest_of(vfs, {file_stat("a/1.txt"), dir_stat("b")}) == d.value());
}

TEST_CASE("Decode rebuilds the snapshot", "[digest]") {
    MemoryVfs vfs;
    vfs.add_file("bin/tool", std::string(200, 'x'), true);
    vfs.add_file("etc/conf", "k=v");
    vfs.add_dir("var");

    MemoryContentStore store;
    DigestEngine engine(&store);
    auto snap = engine.snapshot(
        {file_stat("bin/tool", true), file_stat("etc/conf"), dir_stat("var")}, vfs);
    REQUIRE(snap.is_ok());

    auto decoded = DigestEngine::decode(snap.value().digest(), store);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.value() == snap.value());
}

TEST_CASE("Decode of an unknown digest is ContentUnavailable", "[digest]") {
    MemoryContentStore store;
    DirectoryDigest unknown{Fingerprint::of("never stored"), 12};
    auto r = DigestEngine::decode(unknown, store);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TesseraError::ContentUnavailable);

    auto empty = DigestEngine::decode(empty_directory_digest(), store);
    REQUIRE(empty.is_ok());
    REQUIRE(empty.value().empty());
}

TEST_CASE("Decode detects malformed serializations", "[digest]") {
    MemoryContentStore store;

    SECTION("length mismatch") {
        auto fp = store.store(std::string("\x01" "d", 2)).value();
        auto r = DigestEngine::read_tree(DirectoryDigest{fp, 7}, store);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == TesseraError::Corrupt);
    }

    SECTION("unknown record kind") {
        std::string bytes("x\x01" "a", 3);
        auto fp = store.store(bytes).value();
        auto r = DigestEngine::read_tree(DirectoryDigest{fp, bytes.size()}, store);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == TesseraError::Corrupt);
    }

    SECTION("truncated path") {
        std::string bytes("d\x05" "ab", 4);
        auto fp = store.store(bytes).value();
        auto r = DigestEngine::read_tree(DirectoryDigest{fp, bytes.size()}, store);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == TesseraError::Corrupt);
    }

    SECTION("records out of order") {
        std::string bytes("d\x01" "b" "d\x01" "a", 6);
        auto fp = store.store(bytes).value();
        auto r = DigestEngine::read_tree(DirectoryDigest{fp, bytes.size()}, store);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == TesseraError::Corrupt);
    }
}
