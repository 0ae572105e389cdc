#ifndef CHUNKRELAY_SESSION_SESSION_H
#define CHUNKRELAY_SESSION_SESSION_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkrelay {

// Session status. Transitions only move forward:
// Waiting -> Connected -> Uploading -> Completed (Connected may be skipped)
enum class SessionStatus {
    Waiting,
    Connected,
    Uploading,
    Completed
};

enum class PeerRole {
    None,
    Sender,
    Receiver
};

std::string to_string(SessionStatus status);
std::string to_string(PeerRole role);

// File description announced with chunk 0
struct FileInfo {
    std::string file_name;
    uint64_t file_size = 0;
    std::string file_type;
    uint32_t total_chunks = 0;
    uint64_t upload_start_time = 0;  // ms since epoch
};

// Metadata of one stored chunk; storage_ref points into the ChunkStore
struct ChunkRecord {
    uint32_t index = 0;
    std::string storage_ref;
    uint64_t size = 0;
    uint64_t timestamp = 0;  // ms since epoch
};

struct Session {
    std::string transfer_id;
    std::string sender;
    std::optional<std::string> receiver;
    SessionStatus status = SessionStatus::Waiting;
    std::optional<FileInfo> file_info;
    std::vector<ChunkRecord> chunks;  // arrival order, one entry per index
    uint64_t start_time = 0;
    std::optional<uint64_t> completed_at;

    // Move status forward; never regresses. Returns true if it changed.
    bool advance_status(SessionStatus next);

    // Insert or replace the record for chunk.index, keeping arrival position.
    // Returns the replaced storage reference if the index was already present.
    std::optional<std::string> upsert_chunk(const ChunkRecord& chunk);

    uint32_t total_chunks() const {
        return file_info ? file_info->total_chunks : 0;
    }
};

// Transport connection as seen by the protocol
struct ConnectionRecord {
    std::string connection_id;
    uint64_t connected_at = 0;
    PeerRole role = PeerRole::None;
    std::optional<std::string> transfer_id;
};

inline uint64_t now_millis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace chunkrelay

#endif // CHUNKRELAY_SESSION_SESSION_H
