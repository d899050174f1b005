#include "handlers/health_handler.hpp"
#include "metrics.hpp"

#include <openssl/crypto.h>

namespace tether {

http::response<http::string_body> make_json_response(http::status status, unsigned version,
                                                     const json::object& body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> make_error_response(http::status status, unsigned version,
                                                      const std::string& message) {
    json::object body;
    body["error"] = message;
    return make_json_response(status, version, body);
}

bool admin_token_matches(const http::request<http::string_body>& req, const std::string& admin_token) {
    if (admin_token.empty()) return false;
    auto it = req.find("X-Admin-Token");
    if (it == req.end()) return false;
    auto provided = it->value();
    return provided.size() == admin_token.size() &&
           CRYPTO_memcmp(provided.data(), admin_token.data(), admin_token.size()) == 0;
}

http::response<http::string_body> HealthHandler::handle_health(unsigned version, bool registry_connected) {
    json::object body;
    body["status"] = registry_connected ? "healthy" : "degraded";
    body["registry"] = registry_connected ? "connected" : "unavailable";
    body["tls"] = config_.enable_tls;
    return make_json_response(registry_connected ? http::status::ok : http::status::service_unavailable,
                              version, body);
}

http::response<http::string_body> HealthHandler::handle_stats(const http::request<http::string_body>& req) {
    auto& metrics = MetricsRegistry::instance();

    json::object body;
    body["active_connections"] = static_cast<int64_t>(connections_.connection_count());
    body["active_sessions"] = static_cast<int64_t>(presence_.session_count());
    body["session_members"] = metrics.get_gauge("tether_session_members");
    body["delivery_failed"] = metrics.get_counter("tether_delivery_failed_total");
    body["idle_evictions"] = metrics.get_counter("tether_idle_evictions_total");
    body["presence_shards"] = static_cast<int64_t>(presence_.shard_count());
    body["idle_timeout_sec"] = config_.idle_timeout_sec;
    return make_json_response(http::status::ok, req.version(), body);
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = MetricsRegistry::instance().collect_prometheus();
    res.prepare_payload();
    return res;
}

}
