#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <cstdlib>
#include <openssl/sha.h>
#include <openssl/rand.h>
#include <boost/asio/ip/address.hpp>

namespace tether {

// Structured event log. Network addresses are blinded (salted hash) before output
// and key material must never be passed in a message.
class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        AUTH_SUCCESS,
        AUTH_FAILURE,
        INVALID_INPUT,
        PRESENCE,
        DELIVERY,
        SYNC,
        CRYPTO,
        CONNECTION,
        SYSTEM
    };

    /**
     * Records an event.
     * @param level Severity level of the event.
     * @param event Event category.
     * @param subject Device id, session id or remote address. Addresses are blinded.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& subject,
                    const std::string& message = "") {
        if (level < min_level()) return;

        std::string line = format(level, event, subject, message);
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
    }

    static std::string format(Level level, EventType event, const std::string& subject,
                              const std::string& message) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "subject=" << blind_subject(subject);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        return ss.str();
    }

    // Remote addresses are replaced by anon_<hash>; other subjects pass through sanitized.
    static std::string blind_subject(const std::string& subject) {
        boost::system::error_code ec;
        boost::asio::ip::make_address(subject, ec);
        if (ec) {
            return sanitize_log_message(subject);
        }

        std::string salt = current_salt();
        std::string data = subject + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

    static Level min_level() {
        static const Level level = [] {
            const char* v = std::getenv("TETHER_LOG_LEVEL");
            if (!v) return Level::INFO;
            std::string s(v);
            if (s == "debug") return Level::DEBUG;
            if (s == "warn") return Level::WARNING;
            if (s == "error") return Level::ERROR;
            return Level::INFO;
        }();
        return level;
    }

private:
    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::AUTH_SUCCESS: return "AUTH_SUCCESS";
            case EventType::AUTH_FAILURE: return "AUTH_FAILURE";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::PRESENCE: return "PRESENCE";
            case EventType::DELIVERY: return "DELIVERY";
            case EventType::SYNC: return "SYNC";
            case EventType::CRYPTO: return "CRYPTO";
            case EventType::CONNECTION: return "CONN";
            case EventType::SYSTEM: return "SYSTEM";
            default: return "UNKNOWN_EVENT";
        }
    }

    // The blinding salt rotates every 6 hours so old address hashes cannot be linked
    // to new ones.
    static std::string current_salt() {
        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::lock_guard<std::mutex> lock(salt_mutex);
        auto now_steady = std::chrono::steady_clock::now();
        if (log_salt.empty() ||
            std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
            unsigned char b[32];
            if (RAND_bytes(b, 32) != 1) {
                std::cerr << "[CRITICAL] CSPRNG failure in Logger. Terminating instance for safety.\n";
                std::terminate();
            }
            std::stringstream salt_ss;
            for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
            log_salt = salt_ss.str();
            last_rotation = now_steady;
        }
        return log_salt;
    }
};

}
