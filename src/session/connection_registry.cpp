#include "chunkrelay/session/connection_registry.h"

namespace chunkrelay {

void ConnectionRegistry::add(const std::string& connection_id, uint64_t connected_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connections_.count(connection_id)) {
        return;
    }

    ConnectionRecord record;
    record.connection_id = connection_id;
    record.connected_at = connected_at;
    connections_.emplace(connection_id, std::move(record));
}

bool ConnectionRegistry::bind(const std::string& connection_id, PeerRole role,
                              const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return false;
    }
    it->second.role = role;
    it->second.transfer_id = transfer_id;
    return true;
}

std::optional<ConnectionRecord> ConnectionRegistry::find(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ConnectionRecord> ConnectionRegistry::remove(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    ConnectionRecord record = std::move(it->second);
    connections_.erase(it);
    return record;
}

size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

} // namespace chunkrelay
