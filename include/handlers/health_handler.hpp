#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <string>
#include "server_config.hpp"
#include "connection_manager.hpp"
#include "presence_registry.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace tether {

http::response<http::string_body> make_json_response(http::status status, unsigned version,
                                                     const json::object& body);

// {"error": message}
http::response<http::string_body> make_error_response(http::status status, unsigned version,
                                                      const std::string& message);

// Constant-time comparison of X-Admin-Token; an empty configured token never matches.
bool admin_token_matches(const http::request<http::string_body>& req, const std::string& admin_token);

// Operator endpoints: /health for liveness checks, /stats and /metrics for loopback or admin callers.
class HealthHandler {
public:
    HealthHandler(const ServerConfig& config, ConnectionManager& connections, PresenceRegistry& presence)
        : config_(config), connections_(connections), presence_(presence) {}

    // 503 while the registry is unreachable, so load balancers drain the node.
    http::response<http::string_body> handle_health(unsigned version, bool registry_connected);
    http::response<http::string_body> handle_stats(const http::request<http::string_body>& req);
    http::response<http::string_body> handle_metrics(unsigned version);

    bool verify_admin_request(const http::request<http::string_body>& req) const {
        return admin_token_matches(req, config_.admin_token);
    }

private:
    const ServerConfig& config_;
    ConnectionManager& connections_;
    PresenceRegistry& presence_;
};

}
