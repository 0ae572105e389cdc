#include "chunkrelay/session/protocol_engine.h"
#include "chunkrelay/base/logger.h"
#include "chunkrelay/session/cleanup_scheduler.h"
#include "chunkrelay/storage/activity_log.h"
#include "chunkrelay/storage/chunk_store.h"
#include <mutex>
#include <utility>

using json = nlohmann::json;

namespace chunkrelay {

namespace {

struct EventName {
    const char* name;
    PeerEventType type;
};

const EventName kPeerEvents[] = {
    {"create-transfer", PeerEventType::CreateTransfer},
    {"join-transfer", PeerEventType::JoinTransfer},
    {"upload-chunk", PeerEventType::UploadChunk},
    {"upload-complete", PeerEventType::UploadComplete},
    {"get-status", PeerEventType::GetStatus},
    {"pong", PeerEventType::Pong},
};

struct OutboundName {
    const char* name;
    OutboundEventType type;
};

const OutboundName kOutboundEvents[] = {
    {"transfer-created", OutboundEventType::TransferCreated},
    {"error", OutboundEventType::Error},
    {"receiver-connected", OutboundEventType::ReceiverConnected},
    {"joined-transfer", OutboundEventType::JoinedTransfer},
    {"receive-chunk", OutboundEventType::ReceiveChunk},
    {"chunk-uploaded", OutboundEventType::ChunkUploaded},
    {"transfer-complete", OutboundEventType::TransferComplete},
    {"status-response", OutboundEventType::StatusResponse},
    {"peer-disconnected", OutboundEventType::PeerDisconnected},
    {"ping", OutboundEventType::Ping},
};

OutboundEvent make_event(const std::string& target, OutboundEventType type, json payload) {
    OutboundEvent event;
    event.target = target;
    event.type = type;
    event.payload = std::move(payload);
    return event;
}

OutboundEvent make_chunk_event(const std::string& target, uint32_t chunk_index,
                               uint32_t total_chunks, const std::optional<FileInfo>& info,
                               const ChunkUpload* upload, std::vector<uint8_t> bytes) {
    json payload = {
        {"chunkIndex", chunk_index},
        {"totalChunks", total_chunks},
        {"fileName", upload ? upload->file_name : (info ? info->file_name : "")},
        {"fileSize", upload ? upload->file_size : (info ? info->file_size : 0)},
        {"fileType", upload ? upload->file_type : (info ? info->file_type : "")}
    };
    OutboundEvent event = make_event(target, OutboundEventType::ReceiveChunk, std::move(payload));
    event.binary = std::move(bytes);
    return event;
}

} // anonymous namespace

std::string to_string(PeerEventType type) {
    for (const auto& entry : kPeerEvents) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

std::string to_string(OutboundEventType type) {
    for (const auto& entry : kOutboundEvents) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<PeerEventType> parse_peer_event_type(const std::string& name) {
    for (const auto& entry : kPeerEvents) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

std::optional<OutboundEventType> parse_outbound_event_type(const std::string& name) {
    for (const auto& entry : kOutboundEvents) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

json file_info_json(const std::optional<FileInfo>& info) {
    if (!info) {
        return nullptr;
    }
    return json{
        {"fileName", info->file_name},
        {"fileSize", info->file_size},
        {"fileType", info->file_type},
        {"totalChunks", info->total_chunks},
        {"uploadStartTime", info->upload_start_time}
    };
}

json snapshot_json(const TransferSnapshot& snapshot) {
    return json{
        {"transferId", snapshot.transfer_id},
        {"status", to_string(snapshot.status)},
        {"fileInfo", file_info_json(snapshot.file_info)},
        {"chunksReceived", snapshot.chunks_received},
        {"totalChunks", snapshot.total_chunks},
        {"hasReceiver", snapshot.has_receiver}
    };
}

ProtocolEngine::ProtocolEngine(ChunkStore& store, const TransferConfig& config,
                               ActivityLog* activity_log)
    : store_(store), config_(config), activity_log_(activity_log) {}

ProtocolEngine::~ProtocolEngine() = default;

void ProtocolEngine::set_cleanup_scheduler(CleanupScheduler* scheduler) {
    scheduler_ = scheduler;
}

OutboundEvent ProtocolEngine::make_error(const std::string& target, ErrorCode code) {
    return make_event(target, OutboundEventType::Error, json{
        {"message", to_string(code)},
        {"code", to_wire_code(code)}
    });
}

EngineResult ProtocolEngine::fail(const std::string& connection_id, ErrorCode code) {
    EngineResult result;
    result.code = code;
    result.events.push_back(make_error(connection_id, code));
    return result;
}

void ProtocolEngine::log_activity(const std::string& action, const std::string& transfer_id,
                                  const std::string& connection_id) {
    if (activity_log_) {
        activity_log_->record(action, transfer_id, connection_id);
    }
}

EngineResult ProtocolEngine::connect(const std::string& connection_id) {
    connections_.add(connection_id, now_millis());
    Logger::instance().info("Client connected: {}", connection_id);
    return {};
}

EngineResult ProtocolEngine::create(const std::string& connection_id,
                                    const std::string& transfer_id) {
    if (!connections_.find(connection_id)) {
        return fail(connection_id, ErrorCode::ConnectionClosed);
    }

    Session session;
    session.transfer_id = transfer_id;
    session.sender = connection_id;
    session.status = SessionStatus::Waiting;
    session.start_time = now_millis();

    auto entry = sessions_.insert(std::move(session));
    if (!entry) {
        Logger::instance().warning("Rejected duplicate transfer {} from {}",
                                   transfer_id, connection_id);
        return fail(connection_id, ErrorCode::SessionExists);
    }

    if (!connections_.bind(connection_id, PeerRole::Sender, transfer_id)) {
        // Sender went away while the session was being created
        sessions_.erase(entry);
        return fail(connection_id, ErrorCode::ConnectionClosed);
    }
    log_activity("CREATE", transfer_id, connection_id);
    Logger::instance().info("Transfer session created: {}", transfer_id);

    EngineResult result;
    result.events.push_back(make_event(connection_id, OutboundEventType::TransferCreated, json{
        {"transferId", transfer_id},
        {"message", "Transfer session created successfully"}
    }));
    return result;
}

EngineResult ProtocolEngine::join(const std::string& connection_id,
                                  const std::string& transfer_id) {
    if (!connections_.find(connection_id)) {
        return fail(connection_id, ErrorCode::ConnectionClosed);
    }
    auto entry = sessions_.find(transfer_id);
    if (!entry) {
        return fail(connection_id, ErrorCode::SessionNotFound);
    }

    std::string sender;
    std::optional<FileInfo> file_info;
    std::vector<ChunkRecord> stored;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->closing) {
            return fail(connection_id, ErrorCode::SessionNotFound);
        }
        if (entry->session.receiver) {
            Logger::instance().warning("Transfer {} already has a receiver, rejecting {}",
                                       transfer_id, connection_id);
            return fail(connection_id, ErrorCode::ReceiverExists);
        }
        entry->session.receiver = connection_id;
        entry->session.advance_status(SessionStatus::Connected);
        sender = entry->session.sender;
        if (config_.replay_on_join) {
            file_info = entry->session.file_info;
            stored = entry->session.chunks;
        }
    }

    if (!connections_.bind(connection_id, PeerRole::Receiver, transfer_id)) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->session.receiver == connection_id) {
            entry->session.receiver.reset();
        }
        return fail(connection_id, ErrorCode::ConnectionClosed);
    }
    log_activity("JOIN", transfer_id, connection_id);
    Logger::instance().info("Receiver {} joined transfer {}", connection_id, transfer_id);

    EngineResult result;
    result.events.push_back(make_event(sender, OutboundEventType::ReceiverConnected, json{
        {"transferId", transfer_id},
        {"receiverId", connection_id},
        {"message", "Receiver connected successfully"}
    }));
    result.events.push_back(make_event(connection_id, OutboundEventType::JoinedTransfer, json{
        {"transferId", transfer_id},
        {"message", "Connected to transfer session"}
    }));

    uint32_t total = file_info ? file_info->total_chunks : 0;
    for (const auto& chunk : stored) {
        auto bytes = store_.get(chunk.storage_ref);
        if (!bytes) {
            Logger::instance().warning("Replay of chunk {} for {} skipped: blob unavailable",
                                       chunk.index, transfer_id);
            continue;
        }
        result.events.push_back(make_chunk_event(connection_id, chunk.index, total, file_info,
                                                 nullptr, std::move(*bytes)));
        chunks_relayed_++;
    }
    if (!stored.empty()) {
        Logger::instance().debug("Replayed {} stored chunk(s) of {} to {}",
                                 stored.size(), transfer_id, connection_id);
    }
    return result;
}

EngineResult ProtocolEngine::upload_chunk(const std::string& connection_id,
                                          const std::string& transfer_id,
                                          ChunkUpload upload) {
    auto entry = sessions_.find(transfer_id);
    if (!entry) {
        return fail(connection_id, ErrorCode::SessionNotFound);
    }

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->closing) {
            return fail(connection_id, ErrorCode::SessionNotFound);
        }
        if (entry->session.sender != connection_id) {
            Logger::instance().warning("Unauthorized upload to {} from {}",
                                       transfer_id, connection_id);
            return fail(connection_id, ErrorCode::Unauthorized);
        }
        if (upload.chunk_index == 0 && !entry->session.file_info &&
            upload.file_size > config_.max_file_size) {
            Logger::instance().warning("Transfer {} announced {} bytes, limit is {}",
                                       transfer_id, upload.file_size, config_.max_file_size);
            return fail(connection_id, ErrorCode::FileTooLarge);
        }
    }

    // Blob write runs without holding the session lock
    auto storage_ref = store_.put(transfer_id, upload.chunk_index, upload.data);
    if (!storage_ref) {
        Logger::instance().error("Error saving chunk {} of {}", upload.chunk_index, transfer_id);
        EngineResult result;
        result.code = ErrorCode::ChunkSaveError;
        OutboundEvent error = make_error(connection_id, ErrorCode::ChunkSaveError);
        error.payload["chunkIndex"] = upload.chunk_index;
        result.events.push_back(std::move(error));
        return result;
    }

    std::optional<std::string> receiver;
    std::optional<std::string> replaced;
    uint32_t total_chunks = upload.total_chunks;
    bool superseded = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        Session& session = entry->session;
        if (entry->closing) {
            // Cleanup already collected the blob list; this one is ours to drop
            superseded = true;
        } else {
            uint64_t now = now_millis();
            if (upload.chunk_index == 0 && !session.file_info) {
                FileInfo info;
                info.file_name = upload.file_name;
                info.file_size = upload.file_size;
                info.file_type = upload.file_type;
                info.total_chunks = upload.total_chunks;
                info.upload_start_time = now;
                session.file_info = std::move(info);
                session.advance_status(SessionStatus::Uploading);
            }

            ChunkRecord record;
            record.index = upload.chunk_index;
            record.storage_ref = *storage_ref;
            record.size = upload.data.size();
            record.timestamp = now;
            replaced = session.upsert_chunk(record);
            receiver = session.receiver;
        }
    }

    if (superseded) {
        store_.remove(*storage_ref);
        return fail(connection_id, ErrorCode::SessionNotFound);
    }
    if (replaced && *replaced != *storage_ref) {
        store_.remove(*replaced);
    }
    chunks_stored_++;

    Logger::instance().debug("Chunk {}/{} of {} stored ({} bytes)",
                             upload.chunk_index + 1, total_chunks, transfer_id,
                             upload.data.size());

    EngineResult result;
    if (receiver) {
        uint32_t chunk_index = upload.chunk_index;
        std::vector<uint8_t> bytes = std::move(upload.data);
        result.events.push_back(make_chunk_event(*receiver, chunk_index, total_chunks,
                                                 std::nullopt, &upload, std::move(bytes)));
        chunks_relayed_++;
    }
    result.events.push_back(make_event(connection_id, OutboundEventType::ChunkUploaded, json{
        {"chunkIndex", upload.chunk_index},
        {"message", "Chunk " + std::to_string(upload.chunk_index + 1) + "/" +
                        std::to_string(total_chunks) + " uploaded successfully"}
    }));
    return result;
}

EngineResult ProtocolEngine::upload_complete(const std::string& connection_id,
                                             const std::string& transfer_id) {
    auto entry = sessions_.find(transfer_id);
    if (!entry) {
        return fail(connection_id, ErrorCode::SessionNotFound);
    }

    std::optional<std::string> receiver;
    std::optional<FileInfo> file_info;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->closing) {
            return fail(connection_id, ErrorCode::SessionNotFound);
        }
        entry->session.advance_status(SessionStatus::Completed);
        if (!entry->session.completed_at) {
            entry->session.completed_at = now_millis();
        }
        receiver = entry->session.receiver;
        file_info = entry->session.file_info;
    }

    log_activity("COMPLETE", transfer_id, connection_id);
    Logger::instance().info("Transfer completed: {}", transfer_id);

    EngineResult result;
    if (receiver) {
        result.events.push_back(make_event(*receiver, OutboundEventType::TransferComplete, json{
            {"transferId", transfer_id},
            {"fileInfo", file_info_json(file_info)},
            {"message", "File transfer completed successfully"}
        }));
    }

    if (config_.auto_cleanup && scheduler_) {
        scheduler_->schedule(transfer_id);
    }
    return result;
}

EngineResult ProtocolEngine::get_status(const std::string& connection_id,
                                        const std::string& transfer_id) {
    EngineResult result;
    auto view = snapshot(transfer_id);
    if (!view) {
        result.events.push_back(make_event(connection_id, OutboundEventType::StatusResponse, json{
            {"found", false},
            {"message", "Transfer not found"}
        }));
        return result;
    }

    result.events.push_back(make_event(connection_id, OutboundEventType::StatusResponse, json{
        {"found", true},
        {"status", to_string(view->status)},
        {"fileInfo", file_info_json(view->file_info)},
        {"chunksReceived", view->chunks_received},
        {"totalChunks", view->total_chunks}
    }));
    return result;
}

EngineResult ProtocolEngine::disconnect(const std::string& connection_id) {
    Logger::instance().info("Client disconnected: {}", connection_id);

    auto record = connections_.remove(connection_id);
    if (!record || !record->transfer_id) {
        return {};
    }

    const std::string& transfer_id = *record->transfer_id;
    auto entry = sessions_.find(transfer_id);
    if (!entry) {
        return {};
    }

    std::optional<std::string> other;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->closing) {
            return {};
        }
        if (record->role == PeerRole::Sender) {
            other = entry->session.receiver;
        } else {
            other = entry->session.sender;
        }
    }

    log_activity("DISCONNECT", transfer_id, connection_id);

    EngineResult result;
    if (other && *other != connection_id) {
        std::string role = to_string(record->role);
        result.events.push_back(make_event(*other, OutboundEventType::PeerDisconnected, json{
            {"transferId", transfer_id},
            {"role", role},
            {"message", role + " disconnected"}
        }));
    }
    return result;
}

EngineResult ProtocolEngine::dispatch(const std::string& connection_id, PeerMessage message) {
    switch (message.type) {
        case PeerEventType::CreateTransfer:
            return create(connection_id, message.transfer_id);
        case PeerEventType::JoinTransfer:
            return join(connection_id, message.transfer_id);
        case PeerEventType::UploadChunk:
            return upload_chunk(connection_id, message.transfer_id, std::move(message.upload));
        case PeerEventType::UploadComplete:
            return upload_complete(connection_id, message.transfer_id);
        case PeerEventType::GetStatus:
            return get_status(connection_id, message.transfer_id);
        case PeerEventType::Pong:
            // Liveness is tracked by the transport
            return {};
    }
    return fail(connection_id, ErrorCode::InvalidMessage);
}

bool ProtocolEngine::cleanup(const std::string& transfer_id) {
    auto entry = sessions_.find(transfer_id);
    if (!entry) {
        return false;
    }

    std::vector<std::string> refs;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->closing) {
            return false;
        }
        entry->closing = true;
        refs.reserve(entry->session.chunks.size());
        for (const auto& chunk : entry->session.chunks) {
            refs.push_back(chunk.storage_ref);
        }
    }

    size_t failed = 0;
    for (const auto& ref : refs) {
        if (!store_.remove(ref)) {
            failed++;
        }
    }

    sessions_.erase(entry);
    sessions_cleaned_++;

    if (failed > 0) {
        Logger::instance().warning("Cleaned up transfer {} ({} of {} chunk(s) not deleted)",
                                   transfer_id, failed, refs.size());
    } else {
        Logger::instance().info("Cleaned up transfer: {}", transfer_id);
    }
    return true;
}

size_t ProtocolEngine::cleanup_all() {
    size_t removed = 0;
    for (const auto& transfer_id : sessions_.transfer_ids()) {
        if (cleanup(transfer_id)) {
            removed++;
        }
    }
    return removed;
}

std::optional<TransferSnapshot> ProtocolEngine::snapshot(const std::string& transfer_id) const {
    auto session = sessions_.snapshot(transfer_id);
    if (!session) {
        return std::nullopt;
    }

    TransferSnapshot view;
    view.transfer_id = session->transfer_id;
    view.status = session->status;
    view.file_info = session->file_info;
    view.chunks_received = session->chunks.size();
    view.total_chunks = session->total_chunks();
    view.has_receiver = session->receiver.has_value();
    return view;
}

EngineStats ProtocolEngine::stats() const {
    EngineStats stats;
    stats.active_sessions = sessions_.size();
    stats.active_connections = connections_.size();
    stats.chunks_stored = chunks_stored_.load();
    stats.chunks_relayed = chunks_relayed_.load();
    stats.sessions_cleaned = sessions_cleaned_.load();
    return stats;
}

} // namespace chunkrelay
