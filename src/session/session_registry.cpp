#include "chunkrelay/session/session_registry.h"

namespace chunkrelay {

SessionEntryPtr SessionRegistry::insert(Session session) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session.transfer_id);
    if (it != sessions_.end()) {
        return nullptr;
    }

    std::string transfer_id = session.transfer_id;
    auto entry = std::make_shared<SessionEntry>(std::move(session));
    sessions_.emplace(std::move(transfer_id), entry);
    return entry;
}

SessionEntryPtr SessionRegistry::find(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(transfer_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

bool SessionRegistry::erase(const SessionEntryPtr& entry) {
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // transfer_id is immutable after insert
    auto it = sessions_.find(entry->session.transfer_id);
    if (it == sessions_.end() || it->second != entry) {
        return false;
    }
    sessions_.erase(it);
    return true;
}

std::optional<Session> SessionRegistry::snapshot(const std::string& transfer_id) const {
    SessionEntryPtr entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(transfer_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        entry = it->second;
    }

    std::lock_guard<std::mutex> entry_lock(entry->mutex);
    if (entry->closing) {
        return std::nullopt;
    }
    return entry->session;
}

bool SessionRegistry::contains(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(transfer_id) > 0;
}

std::vector<std::string> SessionRegistry::transfer_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(sessions_.size());
    for (const auto& [transfer_id, entry] : sessions_) {
        result.push_back(transfer_id);
    }
    return result;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace chunkrelay
