#ifndef CHUNKRELAY_SESSION_SESSION_REGISTRY_H
#define CHUNKRELAY_SESSION_SESSION_REGISTRY_H

#include "chunkrelay/session/session.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkrelay {

// A registered session plus the lock that serializes its mutation.
// closing is set by cleanup before blobs are deleted; handlers treat a
// closing session as absent.
struct SessionEntry {
    explicit SessionEntry(Session s) : session(std::move(s)) {}

    std::mutex mutex;
    Session session;
    bool closing = false;
};

using SessionEntryPtr = std::shared_ptr<SessionEntry>;

// transfer_id -> session. The map lock is held only for lookups and
// insert/erase; field access goes through the per-entry mutex.
class SessionRegistry {
public:
    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Insert a new session. Returns nullptr if the transfer id is taken.
    SessionEntryPtr insert(Session session);

    SessionEntryPtr find(const std::string& transfer_id);

    // Remove the entry if it is still the one registered under its id
    bool erase(const SessionEntryPtr& entry);

    // Copy of the session state, nullopt if absent or closing
    std::optional<Session> snapshot(const std::string& transfer_id) const;

    bool contains(const std::string& transfer_id) const;
    std::vector<std::string> transfer_ids() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionEntryPtr> sessions_;
};

} // namespace chunkrelay

#endif // CHUNKRELAY_SESSION_SESSION_REGISTRY_H
