#include "api_client.hpp"
#include "input_validator.hpp"
#include "logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/json.hpp>
#include <openssl/err.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace json = boost::json;
using tcp = net::ip::tcp;

namespace tether {

namespace {

// Runs the queued async operation to completion on a private io_context.
void finish_step(net::io_context& ioc, const beast::error_code& ec, const char* what) {
    ioc.run();
    ioc.restart();
    if (ec) {
        throw ApiError(0, std::string(what) + ": " + ec.message());
    }
}

template <class Stream>
http::response<http::string_body> exchange(net::io_context& ioc, Stream& stream,
                                           http::request<http::string_body>& req,
                                           std::chrono::milliseconds timeout) {
    beast::error_code ec;

    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    finish_step(ioc, ec, "write");

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_read(stream, buffer, res, [&ec](beast::error_code e, std::size_t) { ec = e; });
    finish_step(ioc, ec, "read");
    return res;
}

json::object parse_object(const std::string& body, const char* what) {
    json::value value;
    try {
        value = InputValidator::safe_parse_json(body);
    } catch (const std::exception& e) {
        throw ApiError(0, std::string(what) + ": malformed response body: " + e.what());
    }
    if (!value.is_object()) {
        throw ApiError(0, std::string(what) + ": response is not an object");
    }
    return std::move(value.as_object());
}

int64_t int_field(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return 0;
    if (it->value().is_int64()) return it->value().get_int64();
    if (it->value().is_uint64()) return static_cast<int64_t>(it->value().get_uint64());
    return 0;
}

}

ApiClient::ApiClient(ApiClientConfig config)
    : config_(std::move(config)), ssl_ctx_(ssl::context::tls_client) {
    if (config_.use_tls) {
        if (config_.verify_tls) {
            ssl_ctx_.set_default_verify_paths();
            ssl_ctx_.set_verify_mode(ssl::verify_peer);
        } else {
            ssl_ctx_.set_verify_mode(ssl::verify_none);
        }
    }
}

void ApiClient::set_credentials(const std::string& device_id, const std::string& device_token) {
    std::lock_guard<std::mutex> lock(mutex_);
    device_id_ = device_id;
    device_token_ = device_token;
}

ApiClient::Headers ApiClient::auth_headers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {{"Authorization", "Bearer " + device_token_}, {"X-Device-Id", device_id_}};
}

ApiClient::Response ApiClient::expect_success(Response response, const char* what) const {
    if (response.status < 200 || response.status >= 300) {
        std::string reason;
        try {
            auto obj = parse_object(response.body, what);
            reason = std::string(InputValidator::string_field(obj, "error"));
        } catch (const ApiError&) {
            reason = "no error body";
        }
        throw ApiError(response.status,
                       std::string(what) + " failed with HTTP " + std::to_string(response.status) + ": " + reason);
    }
    return response;
}

ApiClient::Response ApiClient::request(http::verb method, const std::string& target, const std::string& body,
                                       const Headers& headers) {
    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, config_.host);
    req.set(http::field::user_agent, std::string("tether-agent/") + BOOST_BEAST_VERSION_STRING);
    req.set(http::field::accept, "application/json");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();

    net::io_context ioc;
    beast::error_code ec;

    tcp::resolver resolver(ioc);
    tcp::resolver::results_type results;
    resolver.async_resolve(config_.host, std::to_string(config_.port),
                           [&](beast::error_code e, tcp::resolver::results_type r) {
                               ec = e;
                               results = std::move(r);
                           });
    finish_step(ioc, ec, "resolve");

    http::response<http::string_body> res;
    if (config_.use_tls) {
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), config_.host.c_str())) {
            throw ApiError(0, "sni: " + std::to_string(::ERR_get_error()));
        }
        if (config_.verify_tls) {
            stream.set_verify_callback(ssl::host_name_verification(config_.host));
        }

        beast::get_lowest_layer(stream).expires_after(config_.request_timeout);
        beast::get_lowest_layer(stream).async_connect(
            results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        finish_step(ioc, ec, "connect");

        beast::get_lowest_layer(stream).expires_after(config_.request_timeout);
        stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
        finish_step(ioc, ec, "tls_handshake");

        res = exchange(ioc, stream, req, config_.request_timeout);

        beast::get_lowest_layer(stream).expires_after(config_.request_timeout);
        stream.async_shutdown([&ec](beast::error_code e) { ec = e; });
        ioc.run();
        if (ec && ec != net::ssl::error::stream_truncated) {
            Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION, config_.host,
                        "TLS shutdown: " + ec.message());
        }
    } else {
        beast::tcp_stream stream(ioc);
        stream.expires_after(config_.request_timeout);
        stream.async_connect(results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        finish_step(ioc, ec, "connect");

        res = exchange(ioc, stream, req, config_.request_timeout);

        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            Logger::log(Logger::Level::DEBUG, Logger::EventType::CONNECTION, config_.host,
                        "Socket shutdown: " + ec.message());
        }
    }

    Response response;
    response.status = res.result_int();
    response.body = std::move(res.body());
    return response;
}

BatchReceipt ApiClient::send_batch(const std::vector<EncryptedEnvelope>& envelopes) {
    json::array messages;
    for (const auto& envelope : envelopes) {
        messages.push_back(envelope_to_json(envelope));
    }
    json::object body;
    body["messages"] = std::move(messages);

    auto response = expect_success(
        request(http::verb::post, "/v1/messages/batch", json::serialize(body), auth_headers()), "batch upload");
    auto obj = parse_object(response.body, "batch upload");

    BatchReceipt receipt;
    receipt.accepted = static_cast<size_t>(int_field(obj, "accepted"));
    receipt.duplicates = static_cast<size_t>(int_field(obj, "duplicates"));
    return receipt;
}

std::vector<DeviceRecord> ApiClient::list_user_devices(const std::string&) {
    auto response = expect_success(request(http::verb::get, "/v1/devices", "", auth_headers()), "device listing");
    auto obj = parse_object(response.body, "device listing");

    std::vector<DeviceRecord> devices;
    auto it = obj.find("devices");
    if (it == obj.end() || !it->value().is_array()) return devices;
    for (const auto& item : it->value().get_array()) {
        if (item.is_object()) devices.push_back(device_from_json(item.get_object()));
    }
    return devices;
}

bool ApiClient::store_grants(const std::vector<SecretGrant>& grants) {
    json::array list;
    for (const auto& grant : grants) {
        list.push_back(grant_to_json(grant));
    }
    json::object body;
    body["grants"] = std::move(list);

    auto response = expect_success(
        request(http::verb::post, "/v1/grants", json::serialize(body), auth_headers()), "grant upload");
    auto obj = parse_object(response.body, "grant upload");
    return int_field(obj, "stored") == static_cast<int64_t>(grants.size());
}

std::optional<SecretGrant> ApiClient::fetch_grant(const std::string& session_id, const std::string& device_id) {
    auto response = request(http::verb::get, "/v1/grants/" + session_id + "/" + device_id, "", auth_headers());
    if (response.status == 404) return std::nullopt;

    response = expect_success(std::move(response), "grant fetch");
    auto obj = parse_object(response.body, "grant fetch");
    try {
        return grant_from_json(obj);
    } catch (const std::invalid_argument& e) {
        throw ApiError(response.status, std::string("grant fetch: ") + e.what());
    }
}

bool ApiClient::delete_grant(const std::string& session_id, const std::string& device_id) {
    auto response = expect_success(
        request(http::verb::delete_, "/v1/grants/" + session_id + "/" + device_id, "", auth_headers()),
        "grant delete");
    auto obj = parse_object(response.body, "grant delete");
    auto it = obj.find("deleted");
    return it != obj.end() && it->value().is_bool() && it->value().get_bool();
}

DeviceRecord ApiClient::register_device(const DeviceRecord& device, const std::string& device_token,
                                        const std::string& admin_token) {
    json::object body = device_to_json(device);
    body["deviceToken"] = device_token;

    auto response = expect_success(
        request(http::verb::post, "/v1/devices", json::serialize(body), {{"X-Admin-Token", admin_token}}),
        "device registration");
    return device_from_json(parse_object(response.body, "device registration"));
}

}
