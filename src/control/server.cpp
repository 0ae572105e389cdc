#include "chunkrelay/control/server.h"
#include "chunkrelay/base/logger.h"
#include "chunkrelay/storage/activity_log.h"
#include <elio/elio.hpp>
#include <elio/http/http.hpp>
#include <elio/net/tcp.hpp>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

using json = nlohmann::json;

namespace chunkrelay {

namespace {

constexpr const char* kTransferPrefix = "/api/transfer/";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> percent_decode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out += in[i];
            continue;
        }
        if (i + 2 >= in.size()) {
            return std::nullopt;
        }
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

} // anonymous namespace

HttpServerConfig HttpServerConfig::from(const GlobalConfig& config) {
    HttpServerConfig out;
    out.bind_address = config.server.bind_address;
    out.port = config.server.http_port;
    out.cors_origin = config.server.cors_origin;
    return out;
}

ApiReply health_reply(const EngineStats& stats, double uptime_seconds) {
    ApiReply reply;
    reply.status = 200;
    reply.body = {
        {"status", "OK"},
        {"uptime", uptime_seconds},
        {"activeSessions", stats.active_sessions},
        {"activeConnections", stats.active_connections},
        {"timestamp", format_iso8601(std::chrono::system_clock::now())}
    };
    return reply;
}

ApiReply transfer_reply(const ProtocolEngine& engine, const std::string& transfer_id) {
    ApiReply reply;
    auto snapshot = engine.snapshot(transfer_id);
    if (!snapshot) {
        reply.status = 404;
        reply.body = {
            {"error", "Transfer not found"},
            {"code", to_wire_code(ErrorCode::SessionNotFound)}
        };
        return reply;
    }
    reply.status = 200;
    reply.body = snapshot_json(*snapshot);
    return reply;
}

std::optional<std::string> extract_transfer_id(const std::string& path) {
    std::string req_path = path;
    size_t query = req_path.find('?');
    if (query != std::string::npos) {
        req_path.resize(query);
    }

    const std::string prefix = kTransferPrefix;
    if (req_path.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string raw = req_path.substr(prefix.size());
    if (raw.empty() || raw.find('/') != std::string::npos) {
        return std::nullopt;
    }
    auto decoded = percent_decode(raw);
    if (!decoded || decoded->empty()) {
        return std::nullopt;
    }
    return decoded;
}

struct HttpServer::Impl {
    const ProtocolEngine& engine;
    HttpServerConfig config;
    std::atomic<bool> running{false};
    std::atomic<bool> server_stopped{true};
    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();

    HttpServerMetrics metrics;
    mutable std::mutex metrics_mutex;

    std::thread server_thread;
    std::unique_ptr<elio::http::server> http_server;

    Impl(const ProtocolEngine& e, const HttpServerConfig& cfg) : engine(e), config(cfg) {}

    double uptime_seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at).count();
    }

    // JSON response carrying the CORS header
    elio::http::response to_response(const ApiReply& reply) const {
        elio::http::response resp;
        resp.set_status(elio::http::status(reply.status));
        resp.set_header("Content-Type", elio::http::mime::application_json);
        resp.set_header("Access-Control-Allow-Origin", config.cors_origin);
        resp.set_body(reply.body.dump(-1, ' ', false, json::error_handler_t::replace));
        return resp;
    }

    void count(uint64_t HttpServerMetrics::*field) {
        std::lock_guard<std::mutex> lock(metrics_mutex);
        metrics.total_requests++;
        metrics.*field += 1;
    }
};

HttpServer::HttpServer(const ProtocolEngine& engine, const HttpServerConfig& config)
    : impl_(std::make_unique<Impl>(engine, config)) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (impl_->running.load()) {
        Logger::instance().warning("HTTP server already running");
        return true;
    }

    Logger::instance().info("Starting HTTP server on " + impl_->config.bind_address + ":" +
                            std::to_string(impl_->config.port));

    elio::net::socket_address bind_addr;
    if (impl_->config.bind_address == "0.0.0.0") {
        bind_addr = elio::net::socket_address(elio::net::ipv6_address(impl_->config.port));
    } else {
        bind_addr = elio::net::socket_address(impl_->config.bind_address, impl_->config.port);
    }

    elio::net::tcp_options opts;
    opts.reuse_addr = true;
    opts.ipv6_only = (impl_->config.bind_address != "0.0.0.0");

    // listen() reports bind failures only on the server thread; check it here
    {
        auto claimed = elio::net::tcp_listener::bind(bind_addr, opts);
        if (!claimed) {
            Logger::instance().error("Failed to bind HTTP listener: " + std::string(strerror(errno)));
            return false;
        }
        claimed->close();
    }

    impl_->running = true;
    impl_->server_stopped = false;
    impl_->started_at = std::chrono::steady_clock::now();

    Impl* self = impl_.get();

    elio::http::router r;

    r.get("/health", [self](elio::http::context&)
          -> elio::coro::task<elio::http::response> {
        self->count(&HttpServerMetrics::health_requests);
        co_return self->to_response(health_reply(self->engine.stats(), self->uptime_seconds()));
    });

    r.get("/api/transfer/:transferId", [self](elio::http::context& ctx)
          -> elio::coro::task<elio::http::response> {
        self->count(&HttpServerMetrics::transfer_requests);
        auto transfer_id = extract_transfer_id(std::string(ctx.req().path()));
        if (!transfer_id) {
            ApiReply reply;
            reply.status = 400;
            reply.body = {{"error", "Invalid path"}};
            co_return self->to_response(reply);
        }
        co_return self->to_response(transfer_reply(self->engine, *transfer_id));
    });

    impl_->http_server = std::make_unique<elio::http::server>(std::move(r));

    impl_->http_server->set_not_found_handler([self](elio::http::context& ctx)
        -> elio::coro::task<elio::http::response> {
        self->count(&HttpServerMetrics::not_found);
        ApiReply reply;
        reply.status = 404;
        reply.body = {{"error", "Not Found"}, {"path", std::string(ctx.req().path())}};
        co_return self->to_response(reply);
    });

    impl_->server_thread = std::thread([this, bind_addr, opts]() {
        Logger::instance().info("HTTP server thread started");

        elio::run([this, bind_addr, opts]() -> elio::coro::task<void> {
            auto listen_task = impl_->http_server->listen(bind_addr, opts);
            auto listen_handle = std::move(listen_task).spawn();

            while (impl_->running) {
                co_await elio::time::sleep_for(std::chrono::milliseconds(100));
            }

            Logger::instance().info("Stopping HTTP listener");
            impl_->http_server->stop();
            co_await listen_handle;
            co_return;
        }());

        impl_->server_stopped = true;
        Logger::instance().info("HTTP server thread exiting");
    });

    // Give the server thread time to start
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    Logger::instance().info("HTTP server started successfully");
    return true;
}

void HttpServer::stop() {
    if (!impl_->running.load() && !impl_->server_thread.joinable()) {
        return;
    }

    Logger::instance().info("Stopping HTTP server");
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
            Logger::instance().warning("HTTP server thread join timeout, detaching");
            impl_->server_thread.detach();
        }
    }

    Logger::instance().info("HTTP server stopped");
}

bool HttpServer::is_running() const {
    return impl_->running.load();
}

uint16_t HttpServer::get_listen_port() const {
    return impl_->config.port;
}

HttpServerMetrics HttpServer::get_metrics() const {
    std::lock_guard<std::mutex> lock(impl_->metrics_mutex);
    return impl_->metrics;
}

} // namespace chunkrelay
