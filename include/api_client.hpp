#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <mutex>
#include <stdexcept>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include "key_storage.hpp"
#include "message_sync_worker.hpp"
#include "server_config.hpp"

namespace tether {

// Non-2xx answer or transport failure. status is 0 when no response arrived.
class ApiError : public std::runtime_error {
public:
    ApiError(unsigned status, const std::string& what) : std::runtime_error(what), status_(status) {}
    unsigned status() const { return status_; }

private:
    unsigned status_;
};

/**
 * Blocking HTTP client for the /v1 cloud endpoints. Backs the sync worker's
 * CloudSyncEndpoint and the secret distributor's directory and grant store.
 * Every call opens its own connection and honours request_timeout.
 */
class ApiClient : public CloudSyncEndpoint, public DeviceDirectory, public GrantStore {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    struct Response {
        unsigned status = 0;
        std::string body;
    };

    explicit ApiClient(ApiClientConfig config);

    void set_credentials(const std::string& device_id, const std::string& device_token);

    BatchReceipt send_batch(const std::vector<EncryptedEnvelope>& envelopes) override;

    // The server scopes the listing to the authenticated device's account.
    std::vector<DeviceRecord> list_user_devices(const std::string& user_id) override;

    bool store_grants(const std::vector<SecretGrant>& grants) override;
    std::optional<SecretGrant> fetch_grant(const std::string& session_id, const std::string& device_id) override;
    bool delete_grant(const std::string& session_id, const std::string& device_id) override;

    // Provisioning call guarded by the relay's admin token.
    DeviceRecord register_device(const DeviceRecord& device, const std::string& device_token,
                                 const std::string& admin_token);

    // Throws ApiError on transport failure only; any HTTP status is returned.
    Response request(boost::beast::http::verb method, const std::string& target, const std::string& body,
                     const Headers& headers);

private:
    Headers auth_headers() const;
    Response expect_success(Response response, const char* what) const;

    ApiClientConfig config_;
    boost::asio::ssl::context ssl_ctx_;

    mutable std::mutex mutex_;
    std::string device_id_;
    std::string device_token_;
};

}
