#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <random>
#include <string>
#include <vector>
#include "chunkrelay/relay/protocol.h"
#include "chunkrelay/storage/chunk_store.h"

using namespace chunkrelay;

namespace fs = std::filesystem;

namespace {

// Scratch directory removed when the test case ends
struct ScratchDir {
    fs::path path;

    ScratchDir() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("chunkrelay_store_" + std::to_string(rd()));
        fs::create_directories(path);
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // anonymous namespace

TEST_CASE("DiskChunkStore Put And Get", "[storage][chunk]") {
    ScratchDir dir;
    DiskChunkStore store(dir.path.string());
    REQUIRE(store.initialize());

    auto ref = store.put("t1", 0, bytes("hello chunk"));
    REQUIRE(ref.has_value());
    REQUIRE(fs::exists(dir.path / *ref));

    auto data = store.get(*ref);
    REQUIRE(data.has_value());
    REQUIRE(*data == bytes("hello chunk"));
}

TEST_CASE("DiskChunkStore Empty Chunk", "[storage][chunk]") {
    ScratchDir dir;
    DiskChunkStore store(dir.path.string());
    REQUIRE(store.initialize());

    auto ref = store.put("t1", 3, {});
    REQUIRE(ref.has_value());

    auto data = store.get(*ref);
    REQUIRE(data.has_value());
    REQUIRE(data->empty());
}

TEST_CASE("DiskChunkStore Overwrite Same Index", "[storage][chunk]") {
    ScratchDir dir;
    DiskChunkStore store(dir.path.string());
    REQUIRE(store.initialize());

    auto first = store.put("t1", 1, bytes("first"));
    auto second = store.put("t1", 1, bytes("second write"));
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(*first == *second);

    auto data = store.get(*second);
    REQUIRE(data.has_value());
    REQUIRE(*data == bytes("second write"));
}

TEST_CASE("DiskChunkStore Remove", "[storage][chunk]") {
    ScratchDir dir;
    DiskChunkStore store(dir.path.string());
    REQUIRE(store.initialize());

    auto ref = store.put("t1", 0, bytes("data"));
    REQUIRE(ref.has_value());

    REQUIRE(store.remove(*ref));
    REQUIRE_FALSE(fs::exists(dir.path / *ref));
    REQUIRE_FALSE(store.get(*ref).has_value());

    // Second delete reports failure without throwing
    REQUIRE_FALSE(store.remove(*ref));
}

TEST_CASE("DiskChunkStore Rejects Escaping References", "[storage][chunk][security]") {
    ScratchDir dir;
    DiskChunkStore store(dir.path.string());
    REQUIRE(store.initialize());

    REQUIRE_FALSE(store.get("../outside").has_value());
    REQUIRE_FALSE(store.get("").has_value());
    REQUIRE_FALSE(store.remove(".."));
    REQUIRE_FALSE(store.remove("a/b"));
}

TEST_CASE("Chunk File Names Stay In Directory", "[storage][chunk][security]") {
    ScratchDir dir;
    DiskChunkStore store(dir.path.string());
    REQUIRE(store.initialize());

    auto ref = store.put("../../etc/passwd", 0, bytes("x"));
    REQUIRE(ref.has_value());
    REQUIRE(ref->find('/') == std::string::npos);
    REQUIRE(fs::exists(dir.path / *ref));

    REQUIRE(DiskChunkStore::chunk_file_name("", 0) != DiskChunkStore::chunk_file_name(".", 0));
    REQUIRE(DiskChunkStore::chunk_file_name(".hidden", 0)[0] != '.');
}

TEST_CASE("Chunk File Names Do Not Collide", "[storage][chunk]") {
    REQUIRE(DiskChunkStore::chunk_file_name("a_chunk_1", 2) !=
            DiskChunkStore::chunk_file_name("a", 12));
    REQUIRE(DiskChunkStore::chunk_file_name("a_chunk_1", 2) !=
            DiskChunkStore::chunk_file_name("a_chunk_12", 0));
    REQUIRE(DiskChunkStore::chunk_file_name("t1", 1) != DiskChunkStore::chunk_file_name("t1", 10));
    REQUIRE(DiskChunkStore::chunk_file_name("a b", 0) != DiskChunkStore::chunk_file_name("a%20b", 0));
    REQUIRE(DiskChunkStore::chunk_file_name("plain-id.v2", 7) == "plain-id.v2_chunk_7");
}

TEST_CASE("Longest Escaped Transfer Id Is Writable", "[storage][chunk]") {
    ScratchDir dir;
    DiskChunkStore store(dir.path.string());
    REQUIRE(store.initialize());

    // Every byte escapes to %XX
    std::string id(MAX_TRANSFER_ID_LENGTH, ' ');
    auto name = DiskChunkStore::chunk_file_name(id, 4294967295u);
    REQUIRE(name.size() < 256);

    auto ref = store.put(id, 4294967295u, bytes("tail"));
    REQUIRE(ref.has_value());
    REQUIRE(store.get(*ref) == bytes("tail"));
}

TEST_CASE("DiskChunkStore Write Failure", "[storage][chunk][error]") {
    ScratchDir dir;
    fs::path missing = dir.path / "does" / "not" / "exist";
    DiskChunkStore store(missing.string());

    // Not initialized: the directory is absent and writes fail
    auto ref = store.put("t1", 0, bytes("data"));
    REQUIRE_FALSE(ref.has_value());
    REQUIRE(store.temp_dir() == missing.string());
}
