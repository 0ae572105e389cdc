#include "chunkrelay/relay/peer_server.h"
#include "chunkrelay/relay/protocol.h"
#include "chunkrelay/base/logger.h"
#include <elio/elio.hpp>
#include <elio/net/tcp.hpp>
#include <elio/time/timer.hpp>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <iomanip>
#include <sys/socket.h>

namespace chunkrelay {

PeerServerConfig PeerServerConfig::from(const GlobalConfig& config) {
    PeerServerConfig out;
    out.bind_address = config.server.bind_address;
    out.port = config.server.peer_port;
    out.ping_interval_ms = config.server.ping_interval_ms;
    out.ping_timeout_ms = config.server.ping_timeout_ms;
    out.max_buffer_size = config.transfer.max_buffer_size;
    return out;
}

namespace {

// One accepted peer. The stream is read only by its reader coroutine and
// written only by whichever coroutine currently owns the outbox drain.
struct PeerConnection {
    PeerConnection(std::string connection_id, elio::net::tcp_stream s)
        : id(std::move(connection_id)), stream(std::move(s)) {}

    std::string id;
    elio::net::tcp_stream stream;

    std::mutex outbox_mutex;
    std::deque<std::vector<uint8_t>> outbox;
    bool draining = false;

    std::atomic<bool> disconnected{false};
    std::atomic<uint64_t> last_seen{0};  // ms since epoch
};

using PeerConnectionPtr = std::shared_ptr<PeerConnection>;

// Every partial read counts as liveness, so a peer streaming one large frame
// is not timed out halfway through it
elio::coro::task<bool> read_exact(PeerConnection& conn, uint8_t* data, size_t size) {
    size_t total_read = 0;
    while (total_read < size) {
        if (conn.disconnected) {
            co_return false;
        }
        auto result = co_await conn.stream.read(data + total_read, size - total_read);
        if (result.result <= 0) {
            co_return false;
        }
        total_read += static_cast<size_t>(result.result);
        conn.last_seen = now_millis();
    }
    co_return true;
}

// Body buffer grows with the bytes that actually arrive rather than with the
// lengths the header claims
elio::coro::task<bool> read_body(PeerConnection& conn, size_t size, std::vector<uint8_t>& body) {
    constexpr size_t kReadPiece = 64 * 1024;
    body.clear();
    while (body.size() < size) {
        size_t offset = body.size();
        size_t piece = std::min(kReadPiece, size - offset);
        body.resize(offset + piece);
        if (!co_await read_exact(conn, body.data() + offset, piece)) {
            co_return false;
        }
    }
    co_return true;
}

elio::coro::task<bool> write_all(elio::net::tcp_stream& stream, const uint8_t* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        auto result = co_await stream.write(data + written, size - written);
        if (result.result <= 0) {
            co_return false;
        }
        written += static_cast<size_t>(result.result);
    }
    co_return true;
}

} // anonymous namespace

struct PeerServer::Impl {
    ProtocolEngine& engine;
    PeerServerConfig config;

    std::atomic<bool> running{false};
    std::atomic<bool> server_stopped{true};
    std::thread server_thread;
    std::shared_ptr<elio::runtime::scheduler> scheduler;
    std::optional<elio::net::tcp_listener> tcp_listener;
    std::atomic<uint16_t> listen_port{0};

    mutable std::mutex connections_mutex;
    std::unordered_map<std::string, PeerConnectionPtr> connections;

    std::mutex id_mutex;
    std::mt19937_64 rng{std::random_device{}()};

    std::atomic<uint64_t> total_connections{0};
    std::atomic<uint64_t> frames_received{0};
    std::atomic<uint64_t> frames_sent{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> bytes_sent{0};
    std::atomic<uint64_t> protocol_errors{0};
    std::atomic<uint64_t> timed_out{0};

    Impl(ProtocolEngine& e, const PeerServerConfig& cfg) : engine(e), config(cfg) {}

    std::string generate_connection_id() {
        std::lock_guard<std::mutex> lock(id_mutex);
        std::ostringstream oss;
        oss << std::hex << std::setfill('0') << std::setw(16) << rng();
        return oss.str();
    }

    PeerConnectionPtr find_connection(const std::string& id) const {
        std::lock_guard<std::mutex> lock(connections_mutex);
        auto it = connections.find(id);
        if (it == connections.end()) {
            return nullptr;
        }
        return it->second;
    }

    // Write queued frames until the outbox is empty. Only one drain runs per
    // connection at a time; the lock is never held across a write.
    elio::coro::task<void> drain(PeerConnectionPtr conn) {
        while (true) {
            std::vector<uint8_t> frame;
            {
                std::lock_guard<std::mutex> lock(conn->outbox_mutex);
                if (conn->outbox.empty() || conn->disconnected) {
                    conn->outbox.clear();
                    conn->draining = false;
                    break;
                }
                frame = std::move(conn->outbox.front());
                conn->outbox.pop_front();
            }

            bool ok = co_await write_all(conn->stream, frame.data(), frame.size());
            if (!ok) {
                Logger::instance().warning("Failed to send frame to {}", conn->id);
                std::lock_guard<std::mutex> lock(conn->outbox_mutex);
                conn->outbox.clear();
                conn->draining = false;
                break;
            }
            frames_sent++;
            bytes_sent += frame.size();
        }
        co_return;
    }

    // Queue an encoded frame; returns true if the caller must run the drain
    bool enqueue(const PeerConnectionPtr& conn, std::vector<uint8_t> bytes) {
        std::lock_guard<std::mutex> lock(conn->outbox_mutex);
        if (conn->disconnected) {
            return false;
        }
        conn->outbox.push_back(std::move(bytes));
        if (conn->draining) {
            return false;
        }
        conn->draining = true;
        return true;
    }

    // Frames for `self` are written before returning. Other targets get their
    // own drain task so a peer that stops reading never stalls the caller.
    elio::coro::task<void> deliver(std::vector<OutboundEvent> events,
                                   PeerConnectionPtr self = nullptr) {
        for (auto& event : events) {
            auto conn = find_connection(event.target);
            if (!conn) {
                Logger::instance().debug("Dropping {} for closed connection {}",
                                         to_string(event.type), event.target);
                continue;
            }
            if (!enqueue(conn, encode_frame(make_outbound_frame(std::move(event))))) {
                continue;
            }
            if (conn == self) {
                co_await drain(conn);
            } else {
                auto writer = drain(conn);
                scheduler->spawn(writer.release());
            }
        }
        co_return;
    }

    // Logical disconnect; runs once per connection whichever side notices first
    elio::coro::task<void> disconnect(PeerConnectionPtr conn) {
        if (conn->disconnected.exchange(true)) {
            co_return;
        }
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            connections.erase(conn->id);
        }
        auto result = engine.disconnect(conn->id);
        co_await deliver(std::move(result.events));
        co_return;
    }

    elio::coro::task<void> send_error(PeerConnectionPtr conn, ErrorCode code) {
        protocol_errors++;
        std::vector<OutboundEvent> events;
        events.push_back(ProtocolEngine::make_error(conn->id, code));
        co_await deliver(std::move(events), conn);
        co_return;
    }

    // Wake the reader of a timed-out peer; it closes the stream itself
    static void shutdown_stream(const PeerConnectionPtr& conn) {
        if (::shutdown(conn->stream.fd(), SHUT_RDWR) != 0 && errno != ENOTCONN) {
            Logger::instance().debug("shutdown of {} failed: {}", conn->id, strerror(errno));
        }
    }

    elio::coro::task<void> handle_connection(elio::net::tcp_stream stream) {
        auto peer = stream.peer_address();
        auto conn = std::make_shared<PeerConnection>(generate_connection_id(), std::move(stream));
        conn->last_seen = now_millis();
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            connections[conn->id] = conn;
        }
        total_connections++;
        engine.connect(conn->id);
        Logger::instance().debug("Peer {} connected from {}", conn->id,
                                 peer ? peer->to_string() : "unknown");

        try {
            while (running && !conn->disconnected) {
                uint8_t raw_header[FRAME_HEADER_SIZE];
                if (!co_await read_exact(*conn, raw_header, FRAME_HEADER_SIZE)) {
                    break;
                }
                if (conn->disconnected) {
                    break;
                }

                FrameHeader header{};
                auto code = decode_header(raw_header, FRAME_HEADER_SIZE,
                                          config.max_buffer_size, header);
                if (code != ErrorCode::Success) {
                    Logger::instance().warning("Rejecting frame from {}: {}",
                                               conn->id, to_string(code));
                    co_await send_error(conn, code);
                    break;
                }

                size_t body_size = static_cast<size_t>(header.event_length) +
                                   header.json_length + header.binary_length;
                std::vector<uint8_t> body;
                if (!co_await read_body(*conn, body_size, body)) {
                    break;
                }
                // Timed out while the body was still arriving
                if (conn->disconnected) {
                    break;
                }

                frames_received++;
                bytes_received += FRAME_HEADER_SIZE + body_size;

                auto parsed = parse_peer_message(split_body(header, std::move(body)));
                if (!parsed.ok()) {
                    Logger::instance().warning("Invalid message from {}: {}",
                                               conn->id, parsed.detail);
                    co_await send_error(conn, parsed.code);
                    continue;
                }

                auto result = engine.dispatch(conn->id, std::move(parsed.message));
                co_await deliver(std::move(result.events), conn);
            }
        } catch (const std::exception& e) {
            Logger::instance().error("Peer connection " + conn->id + " error: " + e.what());
        }

        co_await disconnect(conn);
        co_await conn->stream.close();
        co_return;
    }

    elio::coro::task<void> accept_loop() {
        Logger::instance().info("Peer server accept loop started");

        while (running.load()) {
            auto stream_result = co_await tcp_listener->accept();
            if (!stream_result) {
                if (running.load()) {
                    Logger::instance().error("Accept error: " + std::string(strerror(errno)));
                }
                continue;
            }

            auto handler = handle_connection(std::move(*stream_result));
            scheduler->spawn(handler.release());
        }

        Logger::instance().info("Peer server accept loop stopped");
    }

    // Ping every connection each interval; disconnect the silent ones
    elio::coro::task<void> keepalive_loop() {
        auto last_ping = std::chrono::steady_clock::now();
        const auto interval = std::chrono::milliseconds(config.ping_interval_ms);

        while (running.load()) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(100));
            auto now = std::chrono::steady_clock::now();
            if (now - last_ping < interval) {
                continue;
            }
            last_ping = now;

            std::vector<PeerConnectionPtr> snapshot;
            {
                std::lock_guard<std::mutex> lock(connections_mutex);
                snapshot.reserve(connections.size());
                for (const auto& [id, conn] : connections) {
                    snapshot.push_back(conn);
                }
            }

            // The watchdog never awaits a peer's socket
            uint64_t now_ms = now_millis();
            for (auto& conn : snapshot) {
                if (conn->disconnected) {
                    continue;
                }
                uint64_t seen = conn->last_seen.load();
                if (now_ms > seen && now_ms - seen > config.ping_timeout_ms) {
                    Logger::instance().info("Peer {} timed out", conn->id);
                    timed_out++;
                    shutdown_stream(conn);
                    auto closer = disconnect(conn);
                    scheduler->spawn(closer.release());
                    continue;
                }
                if (enqueue(conn, encode_frame(make_ping_frame()))) {
                    auto writer = drain(conn);
                    scheduler->spawn(writer.release());
                }
            }
        }
    }
};

PeerServer::PeerServer(ProtocolEngine& engine, const PeerServerConfig& config)
    : impl_(std::make_unique<Impl>(engine, config)) {}

PeerServer::~PeerServer() {
    stop();
}

bool PeerServer::start() {
    if (impl_->running.load()) {
        Logger::instance().warning("Peer server already running");
        return true;
    }

    Logger::instance().info("Starting peer server on " + impl_->config.bind_address + ":" +
                            std::to_string(impl_->config.port));

    impl_->running = true;
    impl_->server_stopped = false;

    std::promise<bool> bound;
    auto bound_future = bound.get_future();

    impl_->server_thread = std::thread([this, bound = std::move(bound)]() mutable {
        impl_->scheduler = std::make_shared<elio::runtime::scheduler>(impl_->config.worker_threads);
        impl_->scheduler->start();

        elio::net::tcp_options opts;
        opts.reuse_addr = true;
        opts.no_delay = true;
        opts.backlog = 128;

        elio::net::socket_address bind_addr;
        if (impl_->config.bind_address == "0.0.0.0") {
            bind_addr = elio::net::socket_address(elio::net::ipv6_address(impl_->config.port));
        } else {
            bind_addr = elio::net::socket_address(impl_->config.bind_address, impl_->config.port);
            opts.ipv6_only = true;
        }

        auto listener_result = elio::net::tcp_listener::bind(bind_addr, opts);
        if (!listener_result) {
            Logger::instance().error("Failed to bind peer listener: " + std::string(strerror(errno)));
            impl_->running = false;
            impl_->server_stopped = true;
            impl_->scheduler->shutdown();
            bound.set_value(false);
            return;
        }

        impl_->tcp_listener = std::move(*listener_result);
        impl_->listen_port = impl_->tcp_listener->local_address().port();
        Logger::instance().info("Peer server listening on port {}", impl_->listen_port.load());
        bound.set_value(true);

        auto accept_loop = impl_->accept_loop();
        impl_->scheduler->spawn(accept_loop.release());
        auto keepalive = impl_->keepalive_loop();
        impl_->scheduler->spawn(keepalive.release());

        while (impl_->running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (impl_->tcp_listener) {
            impl_->tcp_listener->close();
        }
        impl_->scheduler->shutdown();

        {
            std::lock_guard<std::mutex> lock(impl_->connections_mutex);
            impl_->connections.clear();
        }

        impl_->server_stopped = true;
        Logger::instance().info("Peer server thread exiting");
    });

    if (!bound_future.get()) {
        if (impl_->server_thread.joinable()) {
            impl_->server_thread.join();
        }
        return false;
    }

    Logger::instance().info("Peer server started successfully");
    return true;
}

void PeerServer::stop() {
    if (!impl_->running.load() && !impl_->server_thread.joinable()) {
        return;
    }

    Logger::instance().info("Stopping peer server");
    impl_->running = false;

    if (impl_->server_thread.joinable()) {
        constexpr auto timeout = std::chrono::seconds(1);
        auto start = std::chrono::steady_clock::now();
        while (!impl_->server_stopped.load()) {
            if (std::chrono::steady_clock::now() - start >= timeout) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        if (impl_->server_stopped.load()) {
            impl_->server_thread.join();
        } else {
            Logger::instance().warning("Peer server thread join timeout, detaching");
            impl_->server_thread.detach();
        }
    }

    Logger::instance().info("Peer server stopped");
}

bool PeerServer::is_running() const {
    return impl_->running.load();
}

uint16_t PeerServer::get_listen_port() const {
    return impl_->listen_port.load();
}

size_t PeerServer::connection_count() const {
    std::lock_guard<std::mutex> lock(impl_->connections_mutex);
    return impl_->connections.size();
}

PeerServerMetrics PeerServer::get_metrics() const {
    PeerServerMetrics metrics;
    metrics.total_connections = impl_->total_connections.load();
    metrics.active_connections = connection_count();
    metrics.frames_received = impl_->frames_received.load();
    metrics.frames_sent = impl_->frames_sent.load();
    metrics.bytes_received = impl_->bytes_received.load();
    metrics.bytes_sent = impl_->bytes_sent.load();
    metrics.protocol_errors = impl_->protocol_errors.load();
    metrics.timed_out = impl_->timed_out.load();
    return metrics;
}

} // namespace chunkrelay
