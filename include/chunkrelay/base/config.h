#ifndef CHUNKRELAY_BASE_CONFIG_H
#define CHUNKRELAY_BASE_CONFIG_H

#include <cstdint>
#include <map>
#include <string>

namespace chunkrelay {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
    bool activity_log = true;       // Day-bucketed CREATE/JOIN/COMPLETE/DISCONNECT records
};

// Listener configuration
struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t peer_port = 3000;      // Framed TCP peer transport
    uint16_t http_port = 3001;      // /health and /api/transfer
    std::string cors_origin = "*";
    uint32_t ping_interval_ms = 25000;
    uint32_t ping_timeout_ms = 60000;
};

// Transfer configuration
struct TransferConfig {
    uint64_t chunk_size = 10ull * 1024 * 1024;             // Informational, not enforced
    uint64_t max_file_size = 2ull * 1024 * 1024 * 1024;
    uint64_t max_buffer_size = 100ull * 1024 * 1024;       // Largest accepted frame section
    uint64_t cleanup_interval_ms = 3600000;                // Delay between completion and cleanup
    bool auto_cleanup = true;
    bool replay_on_join = false;    // Replay stored chunks to a late receiver
};

// Directory configuration
struct PathsConfig {
    std::string temp_dir = "./temp";
    std::string upload_dir = "./uploads";
    std::string log_dir = "./logs";
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    ServerConfig server;
    TransferConfig transfer;
    PathsConfig paths;
};

using IniSections = std::map<std::string, std::map<std::string, std::string>>;

// Parse an INI-style file into sections. Returns false if the file cannot be read.
bool parse_ini_file(const std::string& path, IniSections& sections);

// Apply parsed INI sections on top of an existing configuration
void apply_ini_sections(const IniSections& sections, GlobalConfig& config);

class Config {
public:
    static Config& instance();

    // Load configuration from INI file
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Apply the -c INI file, then environment variables, then the remaining
    // flags on top of the current values. Returns false on parse errors and on --help/--version; exit_requested()
    // tells the two apart.
    bool parse_command_line(int argc, char* argv[]);
    bool exit_requested() const { return exit_requested_; }

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Check if required fields are set
    bool validate() const;

    // Print configuration
    void print() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void override_from_env();

    GlobalConfig config_;
    std::string config_file_;
    bool exit_requested_ = false;
};

} // namespace chunkrelay

#endif // CHUNKRELAY_BASE_CONFIG_H
