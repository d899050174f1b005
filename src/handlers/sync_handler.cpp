#include "handlers/sync_handler.hpp"
#include "handlers/health_handler.hpp"
#include "input_validator.hpp"
#include "logger.hpp"
#include "metrics.hpp"

#include <vector>

namespace tether {

namespace {

std::string_view path_of(std::string_view target) {
    auto q = target.find('?');
    return q == std::string_view::npos ? target : target.substr(0, q);
}

std::string header_value(const http::request<http::string_body>& req, std::string_view name) {
    auto it = req.find(boost::beast::string_view(name.data(), name.size()));
    return it == req.end() ? std::string() : std::string(it->value());
}

}

bool SyncHandler::is_admin(const http::request<http::string_body>& req) const {
    return admin_token_matches(req, config_.admin_token);
}

std::optional<DeviceRecord> SyncHandler::authenticate(const http::request<http::string_body>& req) {
    std::string auth = header_value(req, "Authorization");
    const std::string prefix = "Bearer ";
    if (auth.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

    std::string token = auth.substr(prefix.size());
    std::string device_id = header_value(req, "X-Device-Id");
    if (token.empty() || !InputValidator::is_valid_id(device_id)) return std::nullopt;

    return devices_.authenticate(device_id, token);
}

http::response<http::string_body> SyncHandler::handle(const http::request<http::string_body>& req) {
    std::string_view target(req.target().data(), req.target().size());
    std::string_view path = path_of(target);
    auto method = req.method();

    try {
        if (path == "/v1/devices" && method == http::verb::post) {
            return handle_register_device(req);
        }

        auto device = authenticate(req);
        if (!device) {
            MetricsRegistry::instance().increment_counter("tether_http_auth_failures_total");
            return make_error_response(http::status::unauthorized, req.version(), "Invalid device credentials");
        }

        if (path == "/v1/messages/batch" && method == http::verb::post) {
            return handle_batch(req, *device);
        }
        if (path == "/v1/grants" && method == http::verb::post) {
            return handle_store_grants(req, *device);
        }
        const std::string_view grants_prefix = "/v1/grants/";
        if (path.substr(0, grants_prefix.size()) == grants_prefix &&
            (method == http::verb::get || method == http::verb::delete_)) {
            return handle_grant(req, *device, path.substr(grants_prefix.size()));
        }
        if (path == "/v1/devices" && method == http::verb::get) {
            return handle_list_devices(req, *device);
        }
    } catch (const std::exception& e) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::SYSTEM, "http",
                    std::string("Store unavailable: ") + e.what());
        return make_error_response(http::status::service_unavailable, req.version(), "Storage unavailable");
    }

    return make_error_response(http::status::not_found, req.version(), "Not Found");
}

// Validates every envelope before storing any; a malformed batch is rejected whole.
http::response<http::string_body> SyncHandler::handle_batch(const http::request<http::string_body>& req,
                                                            const DeviceRecord& device) {
    json::value body;
    try {
        body = InputValidator::safe_parse_json(req.body(), config_.max_json_depth);
    } catch (const std::exception&) {
        return make_error_response(http::status::bad_request, req.version(), "Malformed JSON");
    }

    const json::array* messages = nullptr;
    if (body.is_object()) {
        auto it = body.get_object().find("messages");
        if (it != body.get_object().end() && it->value().is_array()) messages = &it->value().get_array();
    }
    if (!messages) {
        return make_error_response(http::status::bad_request, req.version(), "Expected a messages array");
    }
    if (messages->size() > config_.max_batch_messages) {
        return make_error_response(http::status::payload_too_large, req.version(), "Too many messages in batch");
    }

    std::vector<std::pair<EncryptedEnvelope, std::string>> batch;
    batch.reserve(messages->size());
    for (size_t i = 0; i < messages->size(); ++i) {
        const auto& item = (*messages)[i];
        std::string problem = item.is_object() ? validate_envelope_shape(item.get_object()) : "not an object";
        if (problem.empty()) {
            try {
                EncryptedEnvelope envelope = envelope_from_json(item.get_object());
                if (!envelope.sender_device_id.empty() && envelope.sender_device_id != device.device_id) {
                    problem = "senderDeviceId does not match credentials";
                } else {
                    batch.emplace_back(std::move(envelope), json::serialize(item));
                }
            } catch (const EnvelopeError& e) {
                problem = e.what();
            }
        }
        if (!problem.empty()) {
            Logger::log(Logger::Level::WARNING, Logger::EventType::INVALID_INPUT, device.device_id,
                        "Batch rejected at index " + std::to_string(i) + ": " + problem);
            return make_error_response(http::status::bad_request, req.version(),
                                       "messages[" + std::to_string(i) + "]: " + problem);
        }
    }

    int64_t accepted = 0;
    int64_t duplicates = 0;
    json::array results;
    for (const auto& [envelope, serialized] : batch) {
        StoreOutcome outcome = envelopes_.store_envelope(envelope, serialized);
        json::object result;
        result["eventId"] = envelope.event_id;
        if (outcome == StoreOutcome::Duplicate) {
            result["status"] = "duplicate";
            ++duplicates;
        } else {
            result["status"] = "accepted";
            ++accepted;
        }
        results.push_back(std::move(result));
    }

    MetricsRegistry::instance().increment_counter("tether_cloud_envelopes_total", static_cast<double>(accepted));
    MetricsRegistry::instance().increment_counter("tether_cloud_duplicates_total", static_cast<double>(duplicates));

    json::object response;
    response["accepted"] = accepted;
    response["duplicates"] = duplicates;
    response["results"] = std::move(results);
    return make_json_response(http::status::ok, req.version(), response);
}

// Grants may only be addressed to devices of the caller's own account.
http::response<http::string_body> SyncHandler::handle_store_grants(const http::request<http::string_body>& req,
                                                                   const DeviceRecord& device) {
    std::vector<SecretGrant> grants;
    try {
        auto body = InputValidator::safe_parse_json(req.body(), config_.max_json_depth);
        const auto& list = body.as_object().at("grants").as_array();
        for (const auto& item : list) {
            grants.push_back(grant_from_json(item.as_object()));
        }
    } catch (const std::exception&) {
        return make_error_response(http::status::bad_request, req.version(), "Expected a grants array");
    }

    for (const auto& grant : grants) {
        if (!InputValidator::is_valid_id(grant.session_id) || !InputValidator::is_valid_base64(grant.ephemeral_public_key) ||
            !InputValidator::is_valid_base64(grant.encrypted_session_key)) {
            return make_error_response(http::status::bad_request, req.version(), "Malformed grant");
        }
        auto recipient = devices_.get_device(grant.recipient_device_id);
        if (!recipient || recipient->user_id != device.user_id) {
            Logger::log(Logger::Level::WARNING, Logger::EventType::AUTH_FAILURE, device.device_id,
                        "Grant addressed outside the caller's account");
            return make_error_response(http::status::forbidden, req.version(), "Unknown recipient device");
        }
    }

    if (!grants_.store_grants(grants)) {
        return make_error_response(http::status::service_unavailable, req.version(), "Grant store rejected batch");
    }

    json::object response;
    response["stored"] = static_cast<int64_t>(grants.size());
    return make_json_response(http::status::ok, req.version(), response);
}

// rest is "<sessionId>/<deviceId>"; only the recipient may read or consume its grant.
http::response<http::string_body> SyncHandler::handle_grant(const http::request<http::string_body>& req,
                                                            const DeviceRecord& device, std::string_view rest) {
    auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
        return make_error_response(http::status::not_found, req.version(), "Not Found");
    }
    std::string session_id(rest.substr(0, slash));
    std::string device_id(rest.substr(slash + 1));
    if (!InputValidator::is_valid_id(session_id) || !InputValidator::is_valid_id(device_id)) {
        return make_error_response(http::status::bad_request, req.version(), "Malformed grant path");
    }
    if (device_id != device.device_id) {
        return make_error_response(http::status::forbidden, req.version(), "Grant belongs to another device");
    }

    if (req.method() == http::verb::delete_) {
        json::object response;
        response["deleted"] = grants_.delete_grant(session_id, device_id);
        return make_json_response(http::status::ok, req.version(), response);
    }

    auto grant = grants_.fetch_grant(session_id, device_id);
    if (!grant) {
        return make_error_response(http::status::not_found, req.version(), "No grant for session");
    }
    return make_json_response(http::status::ok, req.version(), grant_to_json(*grant));
}

http::response<http::string_body> SyncHandler::handle_list_devices(const http::request<http::string_body>& req,
                                                                   const DeviceRecord& device) {
    json::array list;
    for (const auto& d : devices_.list_user_devices(device.user_id)) {
        list.push_back(device_to_json(d));
    }
    json::object response;
    response["devices"] = std::move(list);
    return make_json_response(http::status::ok, req.version(), response);
}

// Provisioning: {deviceId, userId, name, role, publicKey, deviceToken}, admin token required.
http::response<http::string_body> SyncHandler::handle_register_device(const http::request<http::string_body>& req) {
    if (!is_admin(req)) {
        return make_error_response(http::status::unauthorized, req.version(), "Admin token required");
    }

    DeviceRecord device;
    std::string token;
    try {
        auto body = InputValidator::safe_parse_json(req.body(), config_.max_json_depth);
        const auto& obj = body.as_object();
        device = device_from_json(obj);
        token = std::string(InputValidator::string_field(obj, "deviceToken"));
    } catch (const std::exception&) {
        return make_error_response(http::status::bad_request, req.version(), "Malformed device");
    }

    if (!device.public_key.empty() && !InputValidator::is_valid_base64(device.public_key)) {
        return make_error_response(http::status::bad_request, req.version(), "publicKey must be base64");
    }
    if (!devices_.register_device(device, token)) {
        return make_error_response(http::status::conflict, req.version(), "Device could not be registered");
    }

    Logger::log(Logger::Level::INFO, Logger::EventType::AUTH_SUCCESS, device.device_id, "Device registered");
    json::object response = device_to_json(device);
    return make_json_response(http::status::created, req.version(), response);
}

}
