#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <thread>
#include <chrono>
#include <filesystem>
#include <system_error>

#include "chunkrelay/base/config.h"
#include "chunkrelay/base/error_code.h"
#include "chunkrelay/base/logger.h"
#include "chunkrelay/control/server.h"
#include "chunkrelay/relay/peer_server.h"
#include "chunkrelay/session/cleanup_scheduler.h"
#include "chunkrelay/session/protocol_engine.h"
#include "chunkrelay/storage/activity_log.h"
#include "chunkrelay/storage/chunk_store.h"

using namespace chunkrelay;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

// Create a directory tree; failures are logged and startup continues
static void ensure_directory(const std::string& label, const std::string& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        Logger::instance().error("Failed to create " + label + " directory " + path + ": " +
                                 ec.message());
        return;
    }
    Logger::instance().debug("Using {} directory {}", label, path);
}

class ChunkRelayApplication {
public:
    ChunkRelayApplication() = default;
    ~ChunkRelayApplication() {
        if (peer_server_) {
            peer_server_->stop();
        }
        if (http_server_) {
            http_server_->stop();
        }
        if (scheduler_) {
            scheduler_->stop();
        }
    }

    bool initialize(int argc, char* argv[]) {
        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }

        if (!Config::instance().validate()) {
            throw ChunkRelayError(ErrorCode::ConfigError, "invalid configuration");
        }

        const auto& config = Config::instance().get();
        configure_logging(config.log);
        Config::instance().print();

        ensure_directory("temp", config.paths.temp_dir);
        ensure_directory("upload", config.paths.upload_dir);
        ensure_directory("log", config.paths.log_dir);

        chunk_store_ = std::make_unique<DiskChunkStore>(config.paths.temp_dir);
        if (!chunk_store_->initialize()) {
            Logger::instance().warning("Chunk uploads will fail until " + config.paths.temp_dir +
                                       " is writable");
        }

        activity_log_ = std::make_unique<ActivityLog>(config.paths.log_dir, config.log.activity_log);
        engine_ = std::make_unique<ProtocolEngine>(*chunk_store_, config.transfer, activity_log_.get());

        ProtocolEngine* engine = engine_.get();
        scheduler_ = std::make_unique<CleanupScheduler>(
            std::chrono::milliseconds(config.transfer.cleanup_interval_ms),
            [engine](const std::string& transfer_id) { engine->cleanup(transfer_id); });
        engine_->set_cleanup_scheduler(scheduler_.get());

        peer_server_ = std::make_unique<PeerServer>(*engine_, PeerServerConfig::from(config));
        http_server_ = std::make_unique<HttpServer>(*engine_, HttpServerConfig::from(config));

        Logger::instance().info("ChunkRelay initialized successfully");
        return true;
    }

    bool start() {
        Logger::instance().info("Starting ChunkRelay...");

        if (!scheduler_->start()) {
            Logger::instance().error("Failed to start cleanup scheduler");
            return false;
        }

        const auto& config = Config::instance().get();
        if (!peer_server_->start()) {
            throw ChunkRelayError(ErrorCode::BindFailed,
                                  "peer transport port " + std::to_string(config.server.peer_port));
        }

        if (!http_server_->start()) {
            throw ChunkRelayError(ErrorCode::BindFailed,
                                  "HTTP port " + std::to_string(config.server.http_port));
        }

        Logger::instance().info("Peer transport listening on port {}", peer_server_->get_listen_port());
        Logger::instance().info("Health check: http://localhost:{}/health", config.server.http_port);
        Logger::instance().info("Temp directory: {}", config.paths.temp_dir);
        return true;
    }

    void stop() {
        Logger::instance().info("Shutting down gracefully...");

        peer_server_->stop();
        scheduler_->stop();

        size_t removed = engine_->cleanup_all();
        Logger::instance().info("Cleaned up {} transfer session(s)", removed);

        http_server_->stop();
        Logger::instance().info("ChunkRelay stopped");
    }

    void run() {
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        stop();
    }

private:
    static void configure_logging(const LogConfig& log) {
        auto& logger = Logger::instance();
        logger.set_level(parse_log_level(log.level));
        if (log.output == "stderr") {
            logger.set_output(LogOutput::Stderr);
        } else if (log.output == "file") {
            if (!logger.set_file_output(log.file_path)) {
                logger.warning("Falling back to stdout logging");
            }
        } else {
            logger.set_output(LogOutput::Stdout);
        }
    }

    std::unique_ptr<DiskChunkStore> chunk_store_;
    std::unique_ptr<ActivityLog> activity_log_;
    std::unique_ptr<ProtocolEngine> engine_;
    std::unique_ptr<CleanupScheduler> scheduler_;
    std::unique_ptr<PeerServer> peer_server_;
    std::unique_ptr<HttpServer> http_server_;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        ChunkRelayApplication app;

        if (!app.initialize(argc, argv)) {
            return Config::instance().exit_requested() ? 0 : 1;
        }

        if (!app.start()) {
            std::cerr << "Failed to start ChunkRelay" << std::endl;
            return 1;
        }

        app.run();

    } catch (const ChunkRelayError& e) {
        std::cerr << "Startup error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
