#ifndef CHUNKRELAY_STORAGE_ACTIVITY_LOG_H
#define CHUNKRELAY_STORAGE_ACTIVITY_LOG_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace chunkrelay {

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);

// Append-only activity sink. Each record becomes one JSON line
// {timestamp, action, transferId, socketId} in <log_dir>/YYYY-MM-DD.log
// (UTC day). Write failures are logged and counted, never thrown.
class ActivityLog {
public:
    explicit ActivityLog(const std::string& log_dir, bool enabled = true);

    void record(const std::string& action,
                const std::string& transfer_id,
                const std::string& connection_id);

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool enabled() const { return enabled_; }

    const std::string& log_dir() const { return log_dir_; }
    uint64_t failures() const { return failures_.load(); }

    // File name for the day containing tp: YYYY-MM-DD.log
    static std::string day_file_name(std::chrono::system_clock::time_point tp);

private:
    std::string log_dir_;
    std::atomic<bool> enabled_;
    std::atomic<uint64_t> failures_{0};
    std::mutex mutex_;
};

} // namespace chunkrelay

#endif // CHUNKRELAY_STORAGE_ACTIVITY_LOG_H
