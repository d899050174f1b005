#pragma once

#include <string>
#include <mutex>
#include <atomic>
#include <chrono>
#include <optional>

#include "key_storage.hpp"

namespace tether {

// One live device connection as seen by the relay. WebSocketSession is the
// production implementation.
class RelayPeer {
public:
    using Clock = std::chrono::steady_clock;

    RelayPeer() : last_activity_(Clock::now().time_since_epoch().count()) {}
    virtual ~RelayPeer() = default;

    RelayPeer(const RelayPeer&) = delete;
    RelayPeer& operator=(const RelayPeer&) = delete;

    // Queues a text frame; never blocks on the network.
    virtual void send_text(const std::string& message) = 0;
    virtual void close() = 0;
    virtual std::string remote_address() const = 0;

    void set_identity(const DeviceRecord& device) {
        std::lock_guard<std::mutex> lock(identity_mutex_);
        identity_ = device;
    }

    std::optional<DeviceRecord> identity() const {
        std::lock_guard<std::mutex> lock(identity_mutex_);
        return identity_;
    }

    std::string device_id() const {
        std::lock_guard<std::mutex> lock(identity_mutex_);
        return identity_ ? identity_->device_id : std::string();
    }

    // Set once the peer has been counted against its address limit.
    void set_authenticated(bool auth) { authenticated_ = auth; }
    bool is_authenticated() const { return authenticated_; }

    void touch() { last_activity_ = Clock::now().time_since_epoch().count(); }

    Clock::time_point last_activity() const {
        return Clock::time_point(Clock::duration(last_activity_.load()));
    }

private:
    mutable std::mutex identity_mutex_;
    std::optional<DeviceRecord> identity_;
    std::atomic<bool> authenticated_{false};
    std::atomic<Clock::rep> last_activity_;
};

}
