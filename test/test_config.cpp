#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include "chunkrelay/base/config.h"

using namespace chunkrelay;

namespace fs = std::filesystem;

namespace {

// INI file written to the temp directory and removed afterwards
struct TempIni {
    fs::path path;

    explicit TempIni(const std::string& content) {
        std::random_device rd;
        path = fs::temp_directory_path() / ("chunkrelay_config_" + std::to_string(rd()) + ".ini");
        std::ofstream out(path);
        out << content;
    }

    ~TempIni() {
        std::error_code ec;
        fs::remove(path, ec);
    }
};

} // anonymous namespace

TEST_CASE("Config Defaults", "[config]") {
    GlobalConfig config;

    REQUIRE(config.server.bind_address == "0.0.0.0");
    REQUIRE(config.server.peer_port == 3000);
    REQUIRE(config.server.http_port == 3001);
    REQUIRE(config.server.cors_origin == "*");
    REQUIRE(config.server.ping_interval_ms == 25000);
    REQUIRE(config.server.ping_timeout_ms == 60000);

    REQUIRE(config.transfer.chunk_size == 10ull * 1024 * 1024);
    REQUIRE(config.transfer.max_file_size == 2ull * 1024 * 1024 * 1024);
    REQUIRE(config.transfer.max_buffer_size == 100ull * 1024 * 1024);
    REQUIRE(config.transfer.cleanup_interval_ms == 3600000);
    REQUIRE(config.transfer.auto_cleanup);
    REQUIRE_FALSE(config.transfer.replay_on_join);

    REQUIRE(config.paths.temp_dir == "./temp");
    REQUIRE(config.paths.upload_dir == "./uploads");
    REQUIRE(config.paths.log_dir == "./logs");

    REQUIRE(config.log.level == "info");
    REQUIRE(config.log.output == "stdout");
    REQUIRE(config.log.activity_log);
}

TEST_CASE("INI File Parsing", "[config][ini]") {
    TempIni ini(
        "# comment line\n"
        "; another comment\n"
        "[server]\n"
        "peer_port = 4000\n"
        "cors_origin = \"https://example.com\"\n"
        "\n"
        "[transfer]\n"
        "cleanup_interval_ms=1000\n"
        "auto_cleanup = false\n"
        "replay_on_join = yes\n"
        "\n"
        "[paths]\n"
        "temp_dir = '/tmp/chunks'\n");

    IniSections sections;
    REQUIRE(parse_ini_file(ini.path.string(), sections));
    REQUIRE(sections["server"]["peer_port"] == "4000");
    REQUIRE(sections["server"]["cors_origin"] == "https://example.com");
    REQUIRE(sections["paths"]["temp_dir"] == "/tmp/chunks");

    GlobalConfig config;
    apply_ini_sections(sections, config);
    REQUIRE(config.server.peer_port == 4000);
    REQUIRE(config.server.http_port == 3001);
    REQUIRE(config.server.cors_origin == "https://example.com");
    REQUIRE(config.transfer.cleanup_interval_ms == 1000);
    REQUIRE_FALSE(config.transfer.auto_cleanup);
    REQUIRE(config.transfer.replay_on_join);
    REQUIRE(config.paths.temp_dir == "/tmp/chunks");
}

TEST_CASE("INI Invalid Numbers Keep Defaults", "[config][ini]") {
    IniSections sections;
    sections["server"]["http_port"] = "not-a-port";
    sections["transfer"]["max_file_size"] = "1024";
    sections["unknown"]["key"] = "value";

    GlobalConfig config;
    apply_ini_sections(sections, config);
    REQUIRE(config.server.http_port == 3001);
    REQUIRE(config.transfer.max_file_size == 1024);
}

TEST_CASE("Numbers Out Of Range Keep Defaults", "[config][ini]") {
    IniSections sections;
    sections["server"]["peer_port"] = "70000";
    sections["server"]["http_port"] = "-1";
    sections["server"]["ping_timeout_ms"] = "4294967296";
    sections["transfer"]["max_file_size"] = "-5";
    sections["transfer"]["cleanup_interval_ms"] = "12ms";
    sections["transfer"]["max_buffer_size"] = " 2048 ";

    GlobalConfig config;
    apply_ini_sections(sections, config);
    REQUIRE(config.server.peer_port == 3000);
    REQUIRE(config.server.http_port == 3001);
    REQUIRE(config.server.ping_timeout_ms == 60000);
    REQUIRE(config.transfer.max_file_size == 2ull * 1024 * 1024 * 1024);
    REQUIRE(config.transfer.cleanup_interval_ms == 3600000);
    REQUIRE(config.transfer.max_buffer_size == 2048);

    sections.clear();
    sections["server"]["peer_port"] = "65535";
    apply_ini_sections(sections, config);
    REQUIRE(config.server.peer_port == 65535);
}

TEST_CASE("INI Missing File", "[config][ini]") {
    IniSections sections;
    REQUIRE_FALSE(parse_ini_file("/nonexistent/chunkrelay.ini", sections));
    REQUIRE(sections.empty());
}

TEST_CASE("Config Validation", "[config][validate]") {
    auto& config = Config::instance().get();
    GlobalConfig saved = config;

    REQUIRE(Config::instance().validate());

    config.server.peer_port = 0;
    REQUIRE_FALSE(Config::instance().validate());
    config = saved;

    config.server.http_port = config.server.peer_port;
    REQUIRE_FALSE(Config::instance().validate());
    config = saved;

    config.paths.temp_dir.clear();
    REQUIRE_FALSE(Config::instance().validate());
    config = saved;

    REQUIRE(Config::instance().validate());
}

TEST_CASE("Config Environment Overrides", "[config][env]") {
    auto& config = Config::instance().get();
    GlobalConfig saved = config;

    setenv("CHUNKRELAY_PORT", "5100", 1);
    setenv("CHUNKRELAY_CLEANUP_INTERVAL_MS", "250", 1);
    setenv("CHUNKRELAY_MAX_FILE_SIZE", "4096", 1);
    setenv("CHUNKRELAY_TEMP_DIR", "/var/tmp/relay", 1);
    setenv("CHUNKRELAY_HTTP_PORT", "bogus", 1);

    REQUIRE(Config::instance().load_from_env());
    REQUIRE(config.server.peer_port == 5100);
    REQUIRE(config.server.http_port == saved.server.http_port);
    REQUIRE(config.transfer.cleanup_interval_ms == 250);
    REQUIRE(config.transfer.max_file_size == 4096);
    REQUIRE(config.paths.temp_dir == "/var/tmp/relay");

    unsetenv("CHUNKRELAY_PORT");
    unsetenv("CHUNKRELAY_CLEANUP_INTERVAL_MS");
    unsetenv("CHUNKRELAY_MAX_FILE_SIZE");
    unsetenv("CHUNKRELAY_TEMP_DIR");
    unsetenv("CHUNKRELAY_HTTP_PORT");
    config = saved;
}

TEST_CASE("Environment Overrides Config File", "[config][env][cli]") {
    auto& config = Config::instance().get();
    GlobalConfig saved = config;

    TempIni ini("[server]\npeer_port = 6100\nhttp_port = 6101\n[paths]\ntemp_dir = /ini\n");
    std::string ini_path = ini.path.string();

    setenv("CHUNKRELAY_TEMP_DIR", "/env", 1);
    setenv("CHUNKRELAY_PORT", "6200", 1);
    setenv("CHUNKRELAY_PING_TIMEOUT_MS", "70000", 1);

    std::string prog = "chunkrelay_server";
    std::string c = "-c";
    std::string port = "--port";
    std::string port_value = "6300";
    char* argv[] = {prog.data(), c.data(), ini_path.data(), port.data(), port_value.data()};

    REQUIRE(Config::instance().parse_command_line(5, argv));
    REQUIRE(config.paths.temp_dir == "/env");
    REQUIRE(config.server.http_port == 6101);
    REQUIRE(config.server.ping_timeout_ms == 70000);
    // Flags still win over the environment
    REQUIRE(config.server.peer_port == 6300);

    unsetenv("CHUNKRELAY_TEMP_DIR");
    unsetenv("CHUNKRELAY_PORT");
    unsetenv("CHUNKRELAY_PING_TIMEOUT_MS");
    config = saved;
}

TEST_CASE("Environment Rejects Out Of Range Numbers", "[config][env]") {
    auto& config = Config::instance().get();
    GlobalConfig saved = config;

    setenv("CHUNKRELAY_PORT", "70000", 1);
    setenv("CHUNKRELAY_MAX_FILE_SIZE", "-1", 1);

    REQUIRE(Config::instance().load_from_env());
    REQUIRE(config.server.peer_port == saved.server.peer_port);
    REQUIRE(config.transfer.max_file_size == saved.transfer.max_file_size);

    unsetenv("CHUNKRELAY_PORT");
    unsetenv("CHUNKRELAY_MAX_FILE_SIZE");
    config = saved;
}

TEST_CASE("Config Command Line", "[config][cli]") {
    auto& config = Config::instance().get();
    GlobalConfig saved = config;

    TempIni ini("[server]\nhttp_port = 7001\ncors_origin = https://ini.example\n");
    std::string ini_path = ini.path.string();

    std::string prog = "chunkrelay_server";
    std::string c = "-c";
    std::string port = "--port";
    std::string port_value = "7000";
    std::string cors = "--cors-origin";
    std::string cors_value = "https://cli.example";
    std::string replay = "--replay-on-join";
    char* argv[] = {prog.data(), c.data(), ini_path.data(), port.data(), port_value.data(),
                    cors.data(), cors_value.data(), replay.data()};

    REQUIRE(Config::instance().parse_command_line(8, argv));
    REQUIRE_FALSE(Config::instance().exit_requested());
    REQUIRE(config.server.peer_port == 7000);
    REQUIRE(config.server.http_port == 7001);
    // Flags win over the INI file
    REQUIRE(config.server.cors_origin == "https://cli.example");
    REQUIRE(config.transfer.replay_on_join);
    REQUIRE(Config::instance().get_config_file() == ini_path);

    config = saved;
}

TEST_CASE("Config Command Line Errors", "[config][cli]") {
    auto& config = Config::instance().get();
    GlobalConfig saved = config;

    std::string prog = "chunkrelay_server";
    std::string bad = "--no-such-flag";
    char* argv[] = {prog.data(), bad.data()};

    REQUIRE_FALSE(Config::instance().parse_command_line(2, argv));
    REQUIRE_FALSE(Config::instance().exit_requested());

    config = saved;
}
