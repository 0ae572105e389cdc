#include "chunkrelay/base/logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace chunkrelay {

namespace {

const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info: return "INFO";
        case LogLevel::warning: return "WARN";
        case LogLevel::error: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& level) {
    if (level == "debug" || level == "DEBUG") return LogLevel::debug;
    if (level == "info" || level == "INFO") return LogLevel::info;
    if (level == "warning" || level == "WARNING" || level == "warn") return LogLevel::warning;
    if (level == "error" || level == "ERROR") return LogLevel::error;
    return LogLevel::info;
}

Logger::~Logger() {
    close_file_output();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_;
}

void Logger::set_output(LogOutput output) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_ = output;
}

bool Logger::set_file_output(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_ = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        file_stream_.reset();
        return false;
    }
    output_ = LogOutput::File;
    return true;
}

void Logger::close_file_output() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();
    if (output_ == LogOutput::File) {
        output_ = LogOutput::Stdout;
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    LogOutput output;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;
        output = output_;
    }

    switch (output) {
        case LogOutput::Stdout:
            logger_.log(level, "", 0, "{}", message);
            break;
        case LogOutput::Stderr: {
            std::lock_guard<std::mutex> lock(mutex_);
            std::cerr << "[" << get_timestamp() << "] [" << level_to_string(level) << "] "
                      << message << std::endl;
            break;
        }
        case LogOutput::File:
            write_file_line(level, message);
            break;
    }
}

void Logger::write_file_line(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_stream_ || !file_stream_->is_open()) {
        return;
    }
    *file_stream_ << "[" << get_timestamp() << "] [" << level_to_string(level) << "] "
                  << message << std::endl;
}

} // namespace chunkrelay
