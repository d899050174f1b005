#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "server_config.hpp"
#include "key_storage.hpp"
#include "envelope.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace tether {

// Reference cloud endpoints under /v1: envelope batches, secret grants and the
// device directory. Requests authenticate with "Authorization: Bearer <token>"
// plus "X-Device-Id".
class SyncHandler {
public:
    SyncHandler(const ServerConfig& config, DeviceRegistry& devices, GrantStore& grants, EnvelopeStore& envelopes)
        : config_(config), devices_(devices), grants_(grants), envelopes_(envelopes) {}

    // Dispatches any /v1 request; unknown routes yield 404.
    http::response<http::string_body> handle(const http::request<http::string_body>& req);

    std::optional<DeviceRecord> authenticate(const http::request<http::string_body>& req);

    http::response<http::string_body> handle_batch(const http::request<http::string_body>& req,
                                                   const DeviceRecord& device);
    http::response<http::string_body> handle_store_grants(const http::request<http::string_body>& req,
                                                          const DeviceRecord& device);
    http::response<http::string_body> handle_grant(const http::request<http::string_body>& req,
                                                   const DeviceRecord& device, std::string_view rest);
    http::response<http::string_body> handle_list_devices(const http::request<http::string_body>& req,
                                                          const DeviceRecord& device);
    http::response<http::string_body> handle_register_device(const http::request<http::string_body>& req);

private:
    const ServerConfig& config_;
    DeviceRegistry& devices_;
    GrantStore& grants_;
    EnvelopeStore& envelopes_;

    bool is_admin(const http::request<http::string_body>& req) const;
};

}
