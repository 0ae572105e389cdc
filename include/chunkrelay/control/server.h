#ifndef CHUNKRELAY_CONTROL_SERVER_H
#define CHUNKRELAY_CONTROL_SERVER_H

#include "chunkrelay/base/config.h"
#include "chunkrelay/session/protocol_engine.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace chunkrelay {

struct HttpServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 3001;
    std::string cors_origin = "*";

    static HttpServerConfig from(const GlobalConfig& config);
};

struct HttpServerMetrics {
    uint64_t total_requests = 0;
    uint64_t health_requests = 0;
    uint64_t transfer_requests = 0;
    uint64_t not_found = 0;
};

// Status code and JSON body of one API answer, independent of the transport
struct ApiReply {
    int status = 200;
    nlohmann::json body;
};

// GET /health
ApiReply health_reply(const EngineStats& stats, double uptime_seconds);

// GET /api/transfer/:transferId
ApiReply transfer_reply(const ProtocolEngine& engine, const std::string& transfer_id);

// Transfer id from a /api/transfer/<id> path, percent-decoded
std::optional<std::string> extract_transfer_id(const std::string& path);

// Auxiliary HTTP surface: health and transfer snapshots
class HttpServer {
public:
    HttpServer(const ProtocolEngine& engine, const HttpServerConfig& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    void stop();
    bool is_running() const;

    uint16_t get_listen_port() const;
    HttpServerMetrics get_metrics() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace chunkrelay

#endif // CHUNKRELAY_CONTROL_SERVER_H
