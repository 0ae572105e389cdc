#ifndef CHUNKRELAY_RELAY_PEER_SERVER_H
#define CHUNKRELAY_RELAY_PEER_SERVER_H

#include "chunkrelay/base/config.h"
#include "chunkrelay/session/protocol_engine.h"
#include <cstdint>
#include <memory>
#include <string>

namespace chunkrelay {

struct PeerServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 3000;
    uint32_t ping_interval_ms = 25000;
    uint32_t ping_timeout_ms = 60000;
    uint64_t max_buffer_size = 100ULL * 1024 * 1024;
    uint32_t worker_threads = 2;

    static PeerServerConfig from(const GlobalConfig& config);
};

struct PeerServerMetrics {
    uint64_t total_connections = 0;
    uint64_t active_connections = 0;
    uint64_t frames_received = 0;
    uint64_t frames_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t bytes_sent = 0;
    uint64_t protocol_errors = 0;
    uint64_t timed_out = 0;
};

// Framed TCP endpoint for peers. Each accepted connection gets a reader
// coroutine that decodes frames, dispatches them to the engine and delivers
// the resulting events. A watchdog pings every connection and disconnects
// those that stay silent past the timeout.
class PeerServer {
public:
    PeerServer(ProtocolEngine& engine, const PeerServerConfig& config);
    ~PeerServer();

    PeerServer(const PeerServer&) = delete;
    PeerServer& operator=(const PeerServer&) = delete;

    // Bind and start serving. Returns false if the listener cannot be bound.
    bool start();

    void stop();

    bool is_running() const;

    // Bound port (resolves port 0 to the ephemeral port)
    uint16_t get_listen_port() const;

    size_t connection_count() const;

    PeerServerMetrics get_metrics() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace chunkrelay

#endif // CHUNKRELAY_RELAY_PEER_SERVER_H
