#include "chunkrelay/storage/activity_log.h"
#include "chunkrelay/base/logger.h"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chunkrelay {

namespace {

std::tm to_utc(std::chrono::system_clock::time_point tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&time, &tm_buf);
    return tm_buf;
}

} // anonymous namespace

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    std::tm tm_buf = to_utc(tp);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string ActivityLog::day_file_name(std::chrono::system_clock::time_point tp) {
    std::tm tm_buf = to_utc(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d") << ".log";
    return oss.str();
}

ActivityLog::ActivityLog(const std::string& log_dir, bool enabled)
    : log_dir_(log_dir), enabled_(enabled) {}

void ActivityLog::record(const std::string& action,
                         const std::string& transfer_id,
                         const std::string& connection_id) {
    if (!enabled_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    json entry = {
        {"timestamp", format_iso8601(now)},
        {"action", action},
        {"transferId", transfer_id},
        {"socketId", connection_id}
    };

    std::filesystem::path path = std::filesystem::path(log_dir_) / day_file_name(now);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream file(path, std::ios::app);
    if (!file) {
        failures_++;
        Logger::instance().error("Error writing activity log: cannot open " + path.string());
        return;
    }
    // Transfer ids are peer supplied and may not be valid UTF-8
    file << entry.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    if (!file) {
        failures_++;
        Logger::instance().error("Error writing activity log: " + path.string());
    }
}

} // namespace chunkrelay
