#include "chunkrelay/session/session.h"

namespace chunkrelay {

std::string to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Waiting: return "waiting";
        case SessionStatus::Connected: return "connected";
        case SessionStatus::Uploading: return "uploading";
        case SessionStatus::Completed: return "completed";
    }
    return "waiting";
}

std::string to_string(PeerRole role) {
    switch (role) {
        case PeerRole::None: return "none";
        case PeerRole::Sender: return "sender";
        case PeerRole::Receiver: return "receiver";
    }
    return "none";
}

bool Session::advance_status(SessionStatus next) {
    if (static_cast<int>(next) <= static_cast<int>(status)) {
        return false;
    }
    status = next;
    return true;
}

std::optional<std::string> Session::upsert_chunk(const ChunkRecord& chunk) {
    for (auto& existing : chunks) {
        if (existing.index == chunk.index) {
            std::string replaced = existing.storage_ref;
            existing = chunk;
            return replaced;
        }
    }
    chunks.push_back(chunk);
    return std::nullopt;
}

} // namespace chunkrelay
