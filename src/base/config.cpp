#include "chunkrelay/base/config.h"
#include "chunkrelay/base/logger.h"
#include "CLI/CLI.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace chunkrelay {

namespace {

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

// Numeric fields keep their previous value when the text does not parse
// or does not fit the field
template<typename T>
void assign_number(const std::string& key, const std::string& value, T& target) {
    std::string text = trim(value);
    try {
        if (text.empty() || text[0] == '-' || text[0] == '+') {
            throw std::invalid_argument(key);
        }
        size_t consumed = 0;
        unsigned long long parsed = std::stoull(text, &consumed);
        if (consumed != text.size() || parsed > std::numeric_limits<T>::max()) {
            throw std::out_of_range(key);
        }
        target = static_cast<T>(parsed);
    } catch (const std::exception&) {
        Logger::instance().warning("Ignoring invalid numeric value for {}: '{}'", key, value);
    }
}

} // anonymous namespace

bool parse_ini_file(const std::string& path, IniSections& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section];
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
    return true;
}

void apply_ini_sections(const IniSections& sections, GlobalConfig& config) {
    auto section = [&sections](const char* name) -> const std::map<std::string, std::string>* {
        auto it = sections.find(name);
        return it == sections.end() ? nullptr : &it->second;
    };

    if (auto* s = section("log")) {
        for (const auto& [key, value] : *s) {
            if (key == "level") config.log.level = value;
            else if (key == "output") config.log.output = value;
            else if (key == "file_path") config.log.file_path = value;
            else if (key == "activity_log") config.log.activity_log = parse_bool(value);
        }
    }

    if (auto* s = section("server")) {
        for (const auto& [key, value] : *s) {
            if (key == "bind_address") config.server.bind_address = value;
            else if (key == "peer_port") assign_number(key, value, config.server.peer_port);
            else if (key == "http_port") assign_number(key, value, config.server.http_port);
            else if (key == "cors_origin") config.server.cors_origin = value;
            else if (key == "ping_interval_ms") assign_number(key, value, config.server.ping_interval_ms);
            else if (key == "ping_timeout_ms") assign_number(key, value, config.server.ping_timeout_ms);
        }
    }

    if (auto* s = section("transfer")) {
        for (const auto& [key, value] : *s) {
            if (key == "chunk_size") assign_number(key, value, config.transfer.chunk_size);
            else if (key == "max_file_size") assign_number(key, value, config.transfer.max_file_size);
            else if (key == "max_buffer_size") assign_number(key, value, config.transfer.max_buffer_size);
            else if (key == "cleanup_interval_ms") assign_number(key, value, config.transfer.cleanup_interval_ms);
            else if (key == "auto_cleanup") config.transfer.auto_cleanup = parse_bool(value);
            else if (key == "replay_on_join") config.transfer.replay_on_join = parse_bool(value);
        }
    }

    if (auto* s = section("paths")) {
        for (const auto& [key, value] : *s) {
            if (key == "temp_dir") config.paths.temp_dir = value;
            else if (key == "upload_dir") config.paths.upload_dir = value;
            else if (key == "log_dir") config.paths.log_dir = value;
        }
    }
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    IniSections sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Failed to read config file: " + path);
        return false;
    }

    apply_ini_sections(sections, config_);
    config_file_ = path;

    Logger::instance().info("Config loaded successfully from: " + path);
    return true;
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");

    override_from_env();
    return true;
}

void Config::override_from_env() {
    // Server
    if (const char* val = std::getenv("CHUNKRELAY_BIND_ADDRESS")) {
        config_.server.bind_address = val;
    }
    if (const char* val = std::getenv("CHUNKRELAY_PORT")) {
        assign_number("CHUNKRELAY_PORT", val, config_.server.peer_port);
    }
    if (const char* val = std::getenv("CHUNKRELAY_HTTP_PORT")) {
        assign_number("CHUNKRELAY_HTTP_PORT", val, config_.server.http_port);
    }
    if (const char* val = std::getenv("CHUNKRELAY_CORS_ORIGIN")) {
        config_.server.cors_origin = val;
    }
    if (const char* val = std::getenv("CHUNKRELAY_PING_INTERVAL_MS")) {
        assign_number("CHUNKRELAY_PING_INTERVAL_MS", val, config_.server.ping_interval_ms);
    }
    if (const char* val = std::getenv("CHUNKRELAY_PING_TIMEOUT_MS")) {
        assign_number("CHUNKRELAY_PING_TIMEOUT_MS", val, config_.server.ping_timeout_ms);
    }

    // Transfer
    if (const char* val = std::getenv("CHUNKRELAY_CHUNK_SIZE")) {
        assign_number("CHUNKRELAY_CHUNK_SIZE", val, config_.transfer.chunk_size);
    }
    if (const char* val = std::getenv("CHUNKRELAY_MAX_FILE_SIZE")) {
        assign_number("CHUNKRELAY_MAX_FILE_SIZE", val, config_.transfer.max_file_size);
    }
    if (const char* val = std::getenv("CHUNKRELAY_MAX_BUFFER_SIZE")) {
        assign_number("CHUNKRELAY_MAX_BUFFER_SIZE", val, config_.transfer.max_buffer_size);
    }
    if (const char* val = std::getenv("CHUNKRELAY_CLEANUP_INTERVAL_MS")) {
        assign_number("CHUNKRELAY_CLEANUP_INTERVAL_MS", val, config_.transfer.cleanup_interval_ms);
    }

    // Paths
    if (const char* val = std::getenv("CHUNKRELAY_TEMP_DIR")) {
        config_.paths.temp_dir = val;
    }
    if (const char* val = std::getenv("CHUNKRELAY_UPLOAD_DIR")) {
        config_.paths.upload_dir = val;
    }
    if (const char* val = std::getenv("CHUNKRELAY_LOG_DIR")) {
        config_.paths.log_dir = val;
    }

    // Log
    if (const char* val = std::getenv("CHUNKRELAY_LOG_LEVEL")) {
        config_.log.level = val;
    }
}

bool Config::parse_command_line(int argc, char* argv[]) {
    CLI::App app{"ChunkRelay - Real-time chunked file relay server"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to INI configuration file");

    // Server options
    app.add_option("--bind-address", config_.server.bind_address, "Bind address");
    app.add_option("-p,--port", config_.server.peer_port, "Peer transport listen port");
    app.add_option("--http-port", config_.server.http_port, "HTTP status listen port");
    app.add_option("--cors-origin", config_.server.cors_origin, "Access-Control-Allow-Origin value");
    app.add_option("--ping-interval", config_.server.ping_interval_ms, "Keep-alive ping interval (ms)");
    app.add_option("--ping-timeout", config_.server.ping_timeout_ms, "Keep-alive timeout (ms)");

    // Transfer options
    app.add_option("--max-file-size", config_.transfer.max_file_size, "Maximum announced file size (bytes)");
    app.add_option("--max-buffer-size", config_.transfer.max_buffer_size, "Maximum frame payload size (bytes)");
    app.add_option("--cleanup-interval", config_.transfer.cleanup_interval_ms, "Delay before completed transfers are cleaned up (ms)");
    app.add_option("--auto-cleanup", config_.transfer.auto_cleanup, "Schedule cleanup on completion (true/false)");
    app.add_flag("--replay-on-join", config_.transfer.replay_on_join, "Replay stored chunks to late receivers");

    // Path options
    app.add_option("--temp-dir", config_.paths.temp_dir, "Temporary chunk directory");
    app.add_option("--upload-dir", config_.paths.upload_dir, "Upload directory");
    app.add_option("--log-dir", config_.paths.log_dir, "Activity log directory");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");
    app.add_option("--activity-log", config_.log.activity_log, "Write the daily activity log (true/false)");

    app.set_version_flag("-v,--version", "0.1.0");

    // Pre-scan for the config file. Order: defaults, INI, environment, flags.
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            load_from_file(argv[i + 1]);
            break;
        }
        if (arg.rfind("--config=", 0) == 0) {
            load_from_file(arg.substr(9));
            break;
        }
    }
    override_from_env();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        if (e.get_exit_code() == 0) {
            // Help or version was printed
            app.exit(e);
            exit_requested_ = true;
            return false;
        }
        std::cerr << "Command line parse error: " << e.what() << std::endl;
        return false;
    }

    if (!config_.log.level.empty()) {
        Logger::instance().set_level(parse_log_level(config_.log.level));
    }

    return true;
}

bool Config::validate() const {
    if (config_.server.peer_port == 0) {
        Logger::instance().error("server.peer_port must be set");
        return false;
    }
    if (config_.server.http_port == 0) {
        Logger::instance().error("server.http_port must be set");
        return false;
    }
    if (config_.server.peer_port == config_.server.http_port) {
        Logger::instance().error("server.peer_port and server.http_port must differ");
        return false;
    }
    if (config_.paths.temp_dir.empty()) {
        Logger::instance().error("paths.temp_dir is required");
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Peer Port: {}", config_.server.peer_port);
    Logger::instance().info("HTTP Port: {}", config_.server.http_port);
    Logger::instance().info("Bind Address: " + config_.server.bind_address);
    Logger::instance().info("Log Level: " + config_.log.level);
    Logger::instance().info("Temp Directory: " + config_.paths.temp_dir);
    Logger::instance().info("Upload Directory: " + config_.paths.upload_dir);
    Logger::instance().info("Log Directory: " + config_.paths.log_dir);
    Logger::instance().info("Max File Size: {} bytes", config_.transfer.max_file_size);
    Logger::instance().info("Chunk Size: {} bytes", config_.transfer.chunk_size);
    Logger::instance().info("Cleanup Interval: {} ms", config_.transfer.cleanup_interval_ms);
}

} // namespace chunkrelay
