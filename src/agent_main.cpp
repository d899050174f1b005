#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

#include "api_client.hpp"
#include "channel_router.hpp"
#include "crypto.hpp"
#include "envelope.hpp"
#include "input_validator.hpp"
#include "key_cache.hpp"
#include "line_reader.hpp"
#include "logger.hpp"
#include "message_sync_worker.hpp"
#include "relay_client.hpp"
#include "secret_distributor.hpp"
#include "server_config.hpp"
#include "sqlite_outbox_store.hpp"

namespace net = boost::asio;
namespace json = boost::json;

namespace {

using tether::Logger;

struct AgentOptions {
    std::string session_id;
    bool new_session = false;
    bool register_device = false;
    std::string retry_event_id;
    std::string name = "tether-agent";
    tether::DeviceRole role = tether::DeviceRole::Viewer;
    std::optional<tether::Permission> permission;
};

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " (--session <id> | --new-session) [options]\n"
              << "       " << argv0 << " --register [--name <name>] [--role <role>]\n"
              << "       " << argv0 << " --retry <eventId>\n"
              << "Options:\n"
              << "  --role <controller|executor|viewer>          Role in the session (default viewer)\n"
              << "  --permission <view_only|interact|full_control>\n"
              << "  --help, -h                                    Show this help\n"
              << "Environment: TETHER_DEVICE_ID, TETHER_DEVICE_TOKEN, TETHER_USER_ID, TETHER_DEVICE_KEY,\n"
              << "  TETHER_ADMIN_TOKEN (register), TETHER_RELAY_HOST, TETHER_RELAY_PORT, TETHER_API_HOST,\n"
              << "  TETHER_API_PORT, TETHER_OUTBOX_PATH, TETHER_LOG_LEVEL\n"
              << "Lines read from stdin are sealed and sent to the session. A controller may send\n"
              << "/pause, /resume, /stop or /input <text> as remote control actions.\n";
}

// Event for one line of input, shaped by the sender's role.
json::object event_for_line(tether::DeviceRole role, const std::string& line) {
    json::object event;
    event["plane"] = "SESSION";
    switch (role) {
        case tether::DeviceRole::Executor:
            event["sessionEventType"] = "EXECUTOR_UPDATE";
            event["type"] = "OUTPUT_CHUNK";
            break;
        case tether::DeviceRole::Controller:
            event["sessionEventType"] = "REMOTE_COMMAND";
            event["type"] = "USER_MESSAGE";
            break;
        case tether::DeviceRole::Viewer:
            event["type"] = "COMMENT";
            break;
    }
    event["text"] = line;
    event["ts"] = now_ms();
    return event;
}

int register_device(const AgentOptions& options, tether::ApiClient& api) {
    std::string admin_token = env_or_empty("TETHER_ADMIN_TOKEN");
    std::string user_id = env_or_empty("TETHER_USER_ID");
    if (admin_token.empty() || user_id.empty()) {
        std::cerr << "[!] --register needs TETHER_ADMIN_TOKEN and TETHER_USER_ID\n";
        return 1;
    }

    tether::X25519KeyPair keys = tether::Crypto::generate_x25519_keypair();
    std::string device_token = tether::Crypto::base64_encode(tether::Crypto::random_bytes(32));

    tether::DeviceRecord device;
    device.device_id = env_or_empty("TETHER_DEVICE_ID");
    if (device.device_id.empty()) device.device_id = tether::Crypto::uuid_v7();
    device.user_id = user_id;
    device.name = options.name;
    device.role = options.role;
    device.public_key = tether::Crypto::base64_encode(keys.public_key);

    tether::DeviceRecord stored = api.register_device(device, device_token, admin_token);
    Logger::log(Logger::Level::INFO, Logger::EventType::AUTH_SUCCESS, stored.device_id, "Device registered");

    // Credentials for the environment of later runs.
    std::cout << "TETHER_DEVICE_ID=" << stored.device_id << "\n"
              << "TETHER_USER_ID=" << stored.user_id << "\n"
              << "TETHER_DEVICE_TOKEN=" << device_token << "\n"
              << "TETHER_DEVICE_KEY=" << tether::Crypto::base64_encode(keys.private_key.data(), keys.private_key.size())
              << "\n";
    return 0;
}

}

int main(int argc, char* argv[]) {
    try {
        AgentOptions options;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
                return argv[++i];
            };

            if (arg == "--session") {
                options.session_id = next();
            } else if (arg == "--new-session") {
                options.new_session = true;
            } else if (arg == "--register") {
                options.register_device = true;
            } else if (arg == "--retry") {
                options.retry_event_id = next();
            } else if (arg == "--name") {
                options.name = next();
            } else if (arg == "--role") {
                std::string value = next();
                auto role = tether::parse_role(value);
                if (!role) throw std::invalid_argument("unknown role " + value);
                options.role = *role;
            } else if (arg == "--permission") {
                std::string value = next();
                options.permission = tether::parse_permission(value);
                if (!options.permission) throw std::invalid_argument("unknown permission " + value);
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        tether::RelayClientConfig relay_config;
        tether::ApiClientConfig api_config;
        tether::SyncWorkerConfig sync_config;
        tether::apply_env_overrides(relay_config);
        tether::apply_env_overrides(api_config);
        tether::apply_env_overrides(sync_config);

        tether::ApiClient api(api_config);
        if (options.register_device) {
            return register_device(options, api);
        }

        const std::string device_id = env_or_empty("TETHER_DEVICE_ID");
        const std::string device_token = env_or_empty("TETHER_DEVICE_TOKEN");
        const std::string user_id = env_or_empty("TETHER_USER_ID");
        const std::string device_key = env_or_empty("TETHER_DEVICE_KEY");
        if (device_id.empty() || device_token.empty() || user_id.empty() || device_key.empty()) {
            std::cerr << "[!] TETHER_DEVICE_ID, TETHER_DEVICE_TOKEN, TETHER_USER_ID and TETHER_DEVICE_KEY are required\n"
                      << "[*] Run with --register to provision this device.\n";
            return 1;
        }
        api.set_credentials(device_id, device_token);

        tether::SqliteOutboxStore outbox(sync_config.outbox_path);
        tether::KeyCache cache;
        tether::SecretDistributor secrets(api, api, cache);
        secrets.set_user(user_id);
        secrets.set_device_identity(device_id, tether::SecureBytes(tether::Crypto::base64_decode(device_key)));

        tether::MessageSyncWorker worker(sync_config, outbox, api, secrets);
        worker.set_context({user_id, device_id});

        if (!options.retry_event_id.empty()) {
            if (!worker.retry_failed(options.retry_event_id)) {
                std::cerr << "[!] " << options.retry_event_id << " is not a failed outbox entry\n";
                return 1;
            }
            auto report = worker.flush_now();
            std::cout << "sent=" << report.sent << " retrying=" << report.network_failures << "\n";
            return 0;
        }

        if (options.new_session == !options.session_id.empty()) {
            std::cerr << "[!] Pass exactly one of --session <id> or --new-session\n";
            return 1;
        }

        std::string session_id = options.session_id;
        if (options.new_session) {
            session_id = tether::Crypto::uuid_v7();
            secrets.distribute_secret(session_id, tether::Crypto::random_key());
            std::cout << "session " << session_id << "\n";
        } else {
            // Fails early when no grant exists for this device.
            secrets.session_key(session_id);
        }

        worker.start();

        net::io_context ioc;
        auto work = net::make_work_guard(ioc);
        auto relay = std::make_shared<tether::RelayClient>(ioc, relay_config);
        std::atomic<bool> stopping{false};
        net::signal_set signals(ioc, SIGINT, SIGTERM);

        auto shutdown = [&] {
            if (stopping.exchange(true)) return;
            Logger::log(Logger::Level::INFO, Logger::EventType::SYSTEM, "internal", "Shutting down agent");
            relay->leave_session(session_id);
            signals.cancel();
            work.reset();
        };

        relay->on_envelope([&](const tether::EncryptedEnvelope& envelope) {
            try {
                std::string body = tether::open_envelope(envelope, secrets.session_key(envelope.session_id));
                auto event = tether::InputValidator::safe_parse_json(body);
                std::string_view text = event.is_object()
                                            ? tether::InputValidator::string_field(event.as_object(), "text")
                                            : std::string_view();
                std::cout << "[" << envelope.sender_device_id << "] " << text << std::endl;
            } catch (const std::exception& e) {
                Logger::log(Logger::Level::WARNING, Logger::EventType::CRYPTO, envelope.event_id,
                            std::string("Cannot open envelope: ") + e.what());
            }
        });

        relay->on_presence([&](const tether::PresenceEvent& event) {
            using Kind = tether::PresenceEvent::Kind;
            switch (event.kind) {
                case Kind::Subscribed:
                    std::cout << "* joined " << event.session_id << " with " << event.participants.size()
                              << " participant(s)" << std::endl;
                    break;
                case Kind::MemberJoined:
                    std::cout << "* " << event.participant.device_id << " joined as "
                              << tether::role_name(event.participant.role) << std::endl;
                    break;
                case Kind::MemberLeft:
                    std::cout << "* " << event.participant.device_id << " left (" << event.reason << ")"
                              << (event.session_ended ? ", session ended" : "") << std::endl;
                    break;
                case Kind::Unsubscribed:
                    std::cout << "* left " << event.session_id << std::endl;
                    break;
            }
        });

        relay->on_control([&](tether::FrameType type, const std::string& sid, const json::object& payload) {
            auto action = tether::parse_action(tether::InputValidator::string_field(payload, "action"));
            if (type == tether::FrameType::RemoteControlAck) {
                std::cout << "* " << tether::action_name(action) << " acknowledged" << std::endl;
                return;
            }
            std::cout << "* remote " << tether::action_name(action) << std::endl;
            if (options.role == tether::DeviceRole::Executor) {
                try {
                    relay->send_remote_control_ack(sid, action);
                } catch (const tether::RelayError& e) {
                    Logger::log(Logger::Level::WARNING, Logger::EventType::DELIVERY, sid, e.what());
                }
            }
        });

        relay->on_error([&](const tether::RelayError& error) {
            std::cerr << "[!] " << tether::relay_error_name(error.code()) << ": " << error.what() << std::endl;
            if (error.terminal()) shutdown();
        });

        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (!ec) shutdown();
        });

        // Lines are handed to the io_context. The reader polls so it notices
        // shutdown and is joined before the locals it uses go away.
        std::thread reader([&] {
            tether::LineReader input(STDIN_FILENO);
            std::string line;
            while (input.next(line, stopping)) {
                net::post(ioc, [&, line] {
                    if (stopping || line.empty()) return;

                    if (options.role == tether::DeviceRole::Controller && line[0] == '/') {
                        std::string command = line.substr(1);
                        json::object extra;
                        auto space = command.find(' ');
                        if (space != std::string::npos) {
                            extra["text"] = command.substr(space + 1);
                            command = command.substr(0, space);
                        }
                        try {
                            relay->send_remote_control(session_id, tether::parse_action(command), extra);
                        } catch (const tether::RelayError& e) {
                            std::cerr << "[!] " << e.what() << std::endl;
                        }
                        return;
                    }

                    json::object event = event_for_line(options.role, line);
                    auto channel = tether::route(tether::routable_event_from_json(event));
                    if (!channel) return;

                    tether::SyncMessage message;
                    message.event_id = tether::Crypto::uuid_v7();
                    message.session_id = session_id;
                    message.channel = *channel;
                    message.sender_device_id = device_id;
                    message.sequence_number = worker.next_sequence(session_id, device_id);
                    message.created_at = now_ms();
                    message.body = json::serialize(event);

                    if (relay->state() == tether::ConnectionState::Connected) {
                        try {
                            tether::EncryptedEnvelope header;
                            header.session_id = message.session_id;
                            header.channel = message.channel;
                            header.event_id = message.event_id;
                            header.sequence_number = message.sequence_number;
                            header.sender_device_id = message.sender_device_id;
                            header.created_at = message.created_at;
                            relay->send_envelope(
                                tether::seal_envelope(header, message.body, secrets.session_key(session_id)));
                        } catch (const std::exception& e) {
                            Logger::log(Logger::Level::WARNING, Logger::EventType::DELIVERY, session_id,
                                        std::string("Live delivery skipped: ") + e.what());
                        }
                    }
                    worker.enqueue(std::move(message));
                });
            }
            if (!stopping) net::post(ioc, shutdown);
        });

        relay->connect(device_id, device_token);
        relay->join_session(session_id, options.role, options.permission);

        ioc.run();
        stopping = true;
        reader.join();

        worker.stop();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
