#ifndef CHUNKRELAY_SESSION_PROTOCOL_ENGINE_H
#define CHUNKRELAY_SESSION_PROTOCOL_ENGINE_H

#include "chunkrelay/base/config.h"
#include "chunkrelay/base/error_code.h"
#include "chunkrelay/session/connection_registry.h"
#include "chunkrelay/session/session.h"
#include "chunkrelay/session/session_registry.h"
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace chunkrelay {

class ChunkStore;
class ActivityLog;
class CleanupScheduler;

// Inbound peer event kinds. Transport-level disconnect is not a message;
// the transport calls ProtocolEngine::disconnect directly.
enum class PeerEventType {
    CreateTransfer,
    JoinTransfer,
    UploadChunk,
    UploadComplete,
    GetStatus,
    Pong
};

enum class OutboundEventType {
    TransferCreated,
    Error,
    ReceiverConnected,
    JoinedTransfer,
    ReceiveChunk,
    ChunkUploaded,
    TransferComplete,
    StatusResponse,
    PeerDisconnected,
    Ping
};

// Wire event names, e.g. "create-transfer"
std::string to_string(PeerEventType type);
std::string to_string(OutboundEventType type);
std::optional<PeerEventType> parse_peer_event_type(const std::string& name);
std::optional<OutboundEventType> parse_outbound_event_type(const std::string& name);

// Fields of an upload-chunk event besides the transfer id
struct ChunkUpload {
    uint32_t chunk_index = 0;
    uint32_t total_chunks = 0;
    std::string file_name;
    uint64_t file_size = 0;
    std::string file_type;
    std::vector<uint8_t> data;
};

struct PeerMessage {
    PeerEventType type = PeerEventType::GetStatus;
    std::string transfer_id;
    ChunkUpload upload;  // UploadChunk only
};

struct OutboundEvent {
    std::string target;  // connection id
    OutboundEventType type = OutboundEventType::Error;
    nlohmann::json payload = nlohmann::json::object();
    std::vector<uint8_t> binary;  // chunk bytes for receive-chunk
};

// Outcome of one engine operation. events are in delivery order.
struct EngineResult {
    ErrorCode code = ErrorCode::Success;
    std::vector<OutboundEvent> events;

    bool ok() const { return code == ErrorCode::Success; }
};

// Read-only view of a session for the HTTP API
struct TransferSnapshot {
    std::string transfer_id;
    SessionStatus status = SessionStatus::Waiting;
    std::optional<FileInfo> file_info;
    size_t chunks_received = 0;
    uint32_t total_chunks = 0;
    bool has_receiver = false;
};

struct EngineStats {
    size_t active_sessions = 0;
    size_t active_connections = 0;
    uint64_t chunks_stored = 0;
    uint64_t chunks_relayed = 0;
    uint64_t sessions_cleaned = 0;
};

// {fileName, fileSize, fileType, totalChunks, uploadStartTime}, or null
nlohmann::json file_info_json(const std::optional<FileInfo>& info);
nlohmann::json snapshot_json(const TransferSnapshot& snapshot);

// Transfer session state machine. Owns the session and connection
// registries; every mutation of either goes through this class. Operations
// never emit directly, they return the events for the transport to deliver.
class ProtocolEngine {
public:
    ProtocolEngine(ChunkStore& store, const TransferConfig& config,
                   ActivityLog* activity_log = nullptr);
    ~ProtocolEngine();

    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    // Completed sessions are handed to the scheduler when auto cleanup is on
    void set_cleanup_scheduler(CleanupScheduler* scheduler);

    EngineResult connect(const std::string& connection_id);
    EngineResult create(const std::string& connection_id, const std::string& transfer_id);
    EngineResult join(const std::string& connection_id, const std::string& transfer_id);
    EngineResult upload_chunk(const std::string& connection_id, const std::string& transfer_id,
                              ChunkUpload upload);
    EngineResult upload_complete(const std::string& connection_id, const std::string& transfer_id);
    EngineResult get_status(const std::string& connection_id, const std::string& transfer_id);
    EngineResult disconnect(const std::string& connection_id);

    // Route a decoded message to its handler
    EngineResult dispatch(const std::string& connection_id, PeerMessage message);

    // Delete the session's blobs and unregister it. Returns false if absent.
    bool cleanup(const std::string& transfer_id);

    // Clean up every registered session. Returns how many were removed.
    size_t cleanup_all();

    std::optional<TransferSnapshot> snapshot(const std::string& transfer_id) const;
    EngineStats stats() const;

    const SessionRegistry& sessions() const { return sessions_; }
    const ConnectionRegistry& connections() const { return connections_; }

    // Error event addressed to one connection
    static OutboundEvent make_error(const std::string& target, ErrorCode code);

private:
    void log_activity(const std::string& action, const std::string& transfer_id,
                      const std::string& connection_id);
    EngineResult fail(const std::string& connection_id, ErrorCode code);

    ChunkStore& store_;
    TransferConfig config_;
    ActivityLog* activity_log_;
    CleanupScheduler* scheduler_ = nullptr;

    SessionRegistry sessions_;
    ConnectionRegistry connections_;

    std::atomic<uint64_t> chunks_stored_{0};
    std::atomic<uint64_t> chunks_relayed_{0};
    std::atomic<uint64_t> sessions_cleaned_{0};
};

} // namespace chunkrelay

#endif // CHUNKRELAY_SESSION_PROTOCOL_ENGINE_H
