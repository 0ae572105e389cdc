#ifndef CHUNKRELAY_SESSION_CONNECTION_REGISTRY_H
#define CHUNKRELAY_SESSION_CONNECTION_REGISTRY_H

#include "chunkrelay/session/session.h"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chunkrelay {

// connection_id -> {connected_at, role, transfer_id}. Used to resolve a
// disconnect back to the session the connection was bound to.
class ConnectionRegistry {
public:
    ConnectionRegistry() = default;
    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Register an open connection; an existing record is left untouched
    void add(const std::string& connection_id, uint64_t connected_at);

    // Bind an open connection to a transfer with a role. Returns false, and
    // records nothing, once the connection has been removed.
    bool bind(const std::string& connection_id, PeerRole role, const std::string& transfer_id);

    std::optional<ConnectionRecord> find(const std::string& connection_id) const;

    // Remove and return the record
    std::optional<ConnectionRecord> remove(const std::string& connection_id);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConnectionRecord> connections_;
};

} // namespace chunkrelay

#endif // CHUNKRELAY_SESSION_CONNECTION_REGISTRY_H
