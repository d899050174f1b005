#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "server_config.hpp"
#include "connection_manager.hpp"
#include "presence_registry.hpp"
#include "message_relay.hpp"
#include "redis_manager.hpp"
#include "http_session.hpp"
#include "logger.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace tether {

// Accepts sockets and starts an HttpSession on each, within max_global_connections.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, ssl::context& ssl_ctx, const tcp::endpoint& endpoint, HttpServices services)
        : ioc_(ioc), ssl_ctx_(ssl_ctx), acceptor_(net::make_strand(ioc)), services_(services) {
        auto fail = [](const char* what, beast::error_code ec) {
            throw std::runtime_error(std::string(what) + ": " + ec.message());
        };
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) fail("open", ec);
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) fail("SO_REUSEADDR", ec);
        acceptor_.bind(endpoint, ec);
        if (ec) fail("bind", ec);
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) fail("listen", ec);
    }

    void run() { accept_next(); }

    void stop() {
        beast::error_code ignored;
        acceptor_.close(ignored);
    }

private:
    void accept_next() {
        acceptor_.async_accept(net::make_strand(ioc_),
                               [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                                   self->on_accept(ec, std::move(socket));
                               });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;

        if (ec) {
            Logger::log(Logger::Level::ERROR, Logger::EventType::CONNECTION, "listener", "Accept failed: " + ec.message());
        } else if (open_ >= services_.config.max_global_connections) {
            MetricsRegistry::instance().increment_counter("tether_connection_rejected_global_total");
            beast::error_code ep_ec;
            auto ep = socket.remote_endpoint(ep_ec);
            Logger::log(Logger::Level::WARNING, Logger::EventType::CONNECTION,
                        ep_ec ? "unknown" : ep.address().to_string(), "Global connection limit reached");
        } else {
            start_session(std::move(socket));
        }
        accept_next();
    }

    void start_session(tcp::socket socket) {
        // The slot follows the socket into a WebSocketSession after an upgrade.
        ++open_;
        std::shared_ptr<void> slot(nullptr, [self = shared_from_this()](void*) { --self->open_; });

        beast::tcp_stream stream(std::move(socket));
        if (services_.config.enable_tls) {
            std::make_shared<HttpSession>(HttpSession::TlsSocket(std::move(stream), ssl_ctx_), services_,
                                          std::move(slot))->run();
        } else {
            std::make_shared<HttpSession>(std::move(stream), services_, std::move(slot))->run();
        }
    }

    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;
    HttpServices services_;
    std::atomic<size_t> open_{0};
};

// Periodic presence eviction; reschedules itself until cancelled.
class IdleSweeper : public std::enable_shared_from_this<IdleSweeper> {
public:
    IdleSweeper(net::io_context& ioc, const ServerConfig& config, MessageRelay& relay, ConnectionManager& connections)
        : timer_(ioc), interval_(std::max(1, config.idle_sweep_interval_sec)), relay_(relay), connections_(connections) {}

    void start() {
        timer_.expires_after(interval_);
        timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
            if (ec) return;
            self->sweep();
            self->start();
        });
    }

    void stop() { timer_.cancel(); }

private:
    void sweep() {
        try {
            size_t evicted = relay_.evict_idle(std::chrono::steady_clock::now());
            connections_.cleanup_dead_connections();
            if (evicted > 0) {
                Logger::log(Logger::Level::INFO, Logger::EventType::PRESENCE, "sweeper",
                            "Evicted " + std::to_string(evicted) + " idle device(s)");
            }
        } catch (const std::exception& e) {
            Logger::log(Logger::Level::ERROR, Logger::EventType::SYSTEM, "sweeper",
                        std::string("Idle sweep failed: ") + e.what());
        }
    }

    net::steady_timer timer_;
    std::chrono::seconds interval_;
    MessageRelay& relay_;
    ConnectionManager& connections_;
};

// TLS 1.2+ with forward-secret AEAD suites only.
void load_server_certificate(ssl::context& ctx, const ServerConfig& config) {
    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                    ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::single_dh_use);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);
    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_cipher_list(ctx.native_handle(),
                            "ECDHE-ECDSA-AES256-GCM-SHA384:ECDHE-RSA-AES256-GCM-SHA384:"
                            "ECDHE-ECDSA-CHACHA20-POLY1305:ECDHE-RSA-CHACHA20-POLY1305:"
                            "ECDHE-ECDSA-AES128-GCM-SHA256:ECDHE-RSA-AES128-GCM-SHA256");
    ctx.use_certificate_chain_file(config.cert_path);
    ctx.use_private_key_file(config.key_path, ssl::context::pem);
}

void describe_metrics() {
    auto& m = MetricsRegistry::instance();
    m.describe("tether_active_connections", "Authenticated device connections");
    m.describe("tether_session_members", "Devices joined to sessions across all sessions");
    m.describe("tether_frames_total", "Relay frames handled");
    m.describe("tether_delivery_failed_total", "Targeted envelopes whose recipient was offline");
    m.describe("tether_idle_evictions_total", "Devices evicted for inactivity");
    m.describe("tether_cloud_envelopes_total", "Envelopes stored through /v1/messages/batch");
}

}

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [port] [--tls | --no-tls]\n"
              << "  --tls          Serve wss:// and https:// (TETHER_CERT, TETHER_KEY)\n"
              << "  --no-tls, -n   Plaintext listener, for a TLS-terminating proxy or development\n"
              << "Environment: TETHER_ADDR, TETHER_PORT, TETHER_REDIS_URL, TETHER_SECRET_SALT, TETHER_ADMIN_TOKEN,\n"
              << "  TETHER_IDLE_TIMEOUT, TETHER_IDLE_SWEEP, TETHER_MAX_CONNS_PER_IP, TETHER_PRESENCE_SHARDS,\n"
              << "  TETHER_ALLOW_VIEW_ONLY_INPUT, TETHER_ALLOWED_ORIGINS, TETHER_LOG_LEVEL\n";
}

// Relative certificate paths are resolved next to the executable.
bool resolve_certificates(tether::ServerConfig& config) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path base = fs::canonical("/proc/self/exe", ec).parent_path();
    if (ec) base = fs::current_path();

    if (fs::path(config.cert_path).is_relative()) config.cert_path = (base / config.cert_path).string();
    if (fs::path(config.key_path).is_relative()) config.key_path = (base / config.key_path).string();
    return fs::exists(config.cert_path) && fs::exists(config.key_path);
}

}

int main(int argc, char* argv[]) {
    using tether::Logger;
    try {
        tether::ServerConfig config;
        tether::apply_env_overrides(config);

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--tls") {
                config.enable_tls = true;
            } else if (arg == "--no-tls" || arg == "-n") {
                config.enable_tls = false;
            } else {
                try {
                    config.port = static_cast<uint16_t>(std::stoi(arg));
                } catch (const std::exception&) {
                    std::cerr << "Invalid port: " << arg << "\n";
                    return 1;
                }
            }
        }

        if (config.secret_salt == "tether_default_deployment_salt") {
            Logger::log(Logger::Level::WARNING, Logger::EventType::SYSTEM, "relay",
                        "Default TETHER_SECRET_SALT in use; device id blinding is predictable");
        }
        if (config.thread_count <= 0) {
            config.thread_count = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
        }
        if (config.enable_tls && !resolve_certificates(config)) {
            std::cerr << "TLS certificate or key not found: " << config.cert_path << ", " << config.key_path
                      << "\nSet TETHER_CERT and TETHER_KEY, or run with --no-tls.\n";
            return 1;
        }

        net::io_context ioc{config.thread_count};
        ssl::context ssl_ctx{ssl::context::tls_server};
        if (config.enable_tls) tether::load_server_certificate(ssl_ctx, config);

        tether::describe_metrics();
        tether::ConnectionManager connections(config.secret_salt);
        tether::PresenceRegistry presence(config.presence_shards);
        tether::RedisManager redis(config);
        tether::MessageRelay relay(config, connections, presence, redis);

        auto sweeper = std::make_shared<tether::IdleSweeper>(ioc, config, relay, connections);
        sweeper->start();

        tether::HttpServices services{config, connections, presence, relay, redis};
        auto listener = std::make_shared<tether::Listener>(
            ioc, ssl_ctx, tcp::endpoint{net::ip::make_address(config.address), config.port}, services);
        listener->run();

        Logger::log(Logger::Level::INFO, Logger::EventType::SYSTEM, "relay",
                    "Listening on " + config.address + ":" + std::to_string(config.port) +
                        (config.enable_tls ? " (TLS)" : " (plaintext)") + ", " +
                        std::to_string(config.thread_count) + " thread(s)");

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&connections, listener, sweeper](const beast::error_code&, int signal) {
            Logger::log(Logger::Level::INFO, Logger::EventType::SYSTEM, "relay",
                        "Signal " + std::to_string(signal) + ", shutting down");
            sweeper->stop();
            listener->stop();
            connections.close_all_connections();
        });

        std::vector<std::thread> workers;
        for (int i = 1; i < config.thread_count; ++i) {
            workers.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();
        for (auto& t : workers) t.join();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
