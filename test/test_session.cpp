#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "chunkrelay/session/session.h"
#include "chunkrelay/session/session_registry.h"
#include "chunkrelay/session/connection_registry.h"

using namespace chunkrelay;

namespace {

Session make_session(const std::string& id, const std::string& sender) {
    Session session;
    session.transfer_id = id;
    session.sender = sender;
    session.start_time = now_millis();
    return session;
}

ChunkRecord make_chunk(uint32_t index, const std::string& ref) {
    ChunkRecord chunk;
    chunk.index = index;
    chunk.storage_ref = ref;
    chunk.size = 16;
    chunk.timestamp = now_millis();
    return chunk;
}

} // anonymous namespace

TEST_CASE("Session Status Names", "[session][enum]") {
    REQUIRE(to_string(SessionStatus::Waiting) == "waiting");
    REQUIRE(to_string(SessionStatus::Connected) == "connected");
    REQUIRE(to_string(SessionStatus::Uploading) == "uploading");
    REQUIRE(to_string(SessionStatus::Completed) == "completed");
    REQUIRE(to_string(PeerRole::Sender) == "sender");
    REQUIRE(to_string(PeerRole::Receiver) == "receiver");
}

TEST_CASE("Session Status Only Moves Forward", "[session][status]") {
    Session session = make_session("t1", "s");
    REQUIRE(session.status == SessionStatus::Waiting);

    REQUIRE(session.advance_status(SessionStatus::Uploading));
    REQUIRE(session.status == SessionStatus::Uploading);

    // Skipped state cannot be entered afterwards
    REQUIRE_FALSE(session.advance_status(SessionStatus::Connected));
    REQUIRE(session.status == SessionStatus::Uploading);

    REQUIRE(session.advance_status(SessionStatus::Completed));
    REQUIRE_FALSE(session.advance_status(SessionStatus::Uploading));
    REQUIRE_FALSE(session.advance_status(SessionStatus::Waiting));
    REQUIRE(session.status == SessionStatus::Completed);
}

TEST_CASE("Session Upsert Keeps One Entry Per Index", "[session][chunks]") {
    Session session = make_session("t1", "s");

    REQUIRE_FALSE(session.upsert_chunk(make_chunk(0, "ref0")).has_value());
    REQUIRE_FALSE(session.upsert_chunk(make_chunk(2, "ref2")).has_value());
    REQUIRE_FALSE(session.upsert_chunk(make_chunk(1, "ref1")).has_value());

    auto replaced = session.upsert_chunk(make_chunk(2, "ref2b"));
    REQUIRE(replaced.has_value());
    REQUIRE(*replaced == "ref2");

    REQUIRE(session.chunks.size() == 3);
    // Arrival order is kept for the replaced index
    REQUIRE(session.chunks[0].index == 0);
    REQUIRE(session.chunks[1].index == 2);
    REQUIRE(session.chunks[1].storage_ref == "ref2b");
    REQUIRE(session.chunks[2].index == 1);
}

TEST_CASE("Session Total Chunks Without File Info", "[session][chunks]") {
    Session session = make_session("t1", "s");
    REQUIRE(session.total_chunks() == 0);

    FileInfo info;
    info.total_chunks = 5;
    session.file_info = info;
    REQUIRE(session.total_chunks() == 5);
}

TEST_CASE("Session Registry Insert And Find", "[session][registry]") {
    SessionRegistry registry;

    auto entry = registry.insert(make_session("t1", "sender-a"));
    REQUIRE(entry != nullptr);
    REQUIRE(registry.contains("t1"));
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.find("t1") == entry);
    REQUIRE(registry.find("missing") == nullptr);

    // Duplicate id is rejected and the original is untouched
    REQUIRE(registry.insert(make_session("t1", "sender-b")) == nullptr);
    auto snapshot = registry.snapshot("t1");
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->sender == "sender-a");
}

TEST_CASE("Session Registry Erase", "[session][registry]") {
    SessionRegistry registry;
    auto first = registry.insert(make_session("t1", "a"));
    REQUIRE(first != nullptr);

    REQUIRE(registry.erase(first));
    REQUIRE_FALSE(registry.contains("t1"));
    REQUIRE_FALSE(registry.erase(first));

    // A stale entry never removes its successor
    auto second = registry.insert(make_session("t1", "b"));
    REQUIRE(second != nullptr);
    REQUIRE_FALSE(registry.erase(first));
    REQUIRE(registry.contains("t1"));
    REQUIRE_FALSE(registry.erase(nullptr));
}

TEST_CASE("Session Registry Snapshot Hides Closing Entries", "[session][registry]") {
    SessionRegistry registry;
    auto entry = registry.insert(make_session("t1", "a"));
    REQUIRE(registry.snapshot("t1").has_value());

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->closing = true;
    }
    REQUIRE_FALSE(registry.snapshot("t1").has_value());
    REQUIRE_FALSE(registry.snapshot("nope").has_value());
}

TEST_CASE("Session Registry Transfer Ids", "[session][registry]") {
    SessionRegistry registry;
    registry.insert(make_session("a", "x"));
    registry.insert(make_session("b", "y"));
    registry.insert(make_session("c", "z"));

    auto ids = registry.transfer_ids();
    std::sort(ids.begin(), ids.end());
    REQUIRE(ids == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Session Registry Concurrent Inserts", "[session][registry][concurrent]") {
    SessionRegistry registry;
    std::vector<std::thread> threads;
    std::atomic<int> winners{0};

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&registry, &winners, i]() {
            if (registry.insert(make_session("shared", "sender-" + std::to_string(i)))) {
                winners++;
            }
            registry.insert(make_session("own-" + std::to_string(i), "sender"));
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(winners.load() == 1);
    REQUIRE(registry.size() == 9);
}

TEST_CASE("Connection Registry Lifecycle", "[session][connections]") {
    ConnectionRegistry connections;

    connections.add("c1", 1000);
    auto record = connections.find("c1");
    REQUIRE(record.has_value());
    REQUIRE(record->connected_at == 1000);
    REQUIRE(record->role == PeerRole::None);
    REQUIRE_FALSE(record->transfer_id.has_value());

    // Re-adding keeps the original record
    connections.add("c1", 2000);
    REQUIRE(connections.find("c1")->connected_at == 1000);

    REQUIRE(connections.bind("c1", PeerRole::Sender, "t1"));
    record = connections.find("c1");
    REQUIRE(record->role == PeerRole::Sender);
    REQUIRE(record->transfer_id == std::optional<std::string>("t1"));

    auto removed = connections.remove("c1");
    REQUIRE(removed.has_value());
    REQUIRE(removed->transfer_id == std::optional<std::string>("t1"));
    REQUIRE_FALSE(connections.find("c1").has_value());
    REQUIRE_FALSE(connections.remove("c1").has_value());
    REQUIRE(connections.size() == 0);
}

TEST_CASE("Connection Registry Bind Needs Open Connection", "[session][connections]") {
    ConnectionRegistry connections;
    REQUIRE_FALSE(connections.bind("c2", PeerRole::Receiver, "t9"));
    REQUIRE_FALSE(connections.find("c2").has_value());

    // A removed connection is not brought back by a late bind
    connections.add("c1", 1);
    REQUIRE(connections.remove("c1").has_value());
    REQUIRE_FALSE(connections.bind("c1", PeerRole::Sender, "t1"));
    REQUIRE_FALSE(connections.find("c1").has_value());
    REQUIRE(connections.size() == 0);
}
