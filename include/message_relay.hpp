#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>

#include "server_config.hpp"
#include "connection_manager.hpp"
#include "presence_registry.hpp"
#include "relay_protocol.hpp"
#include "key_storage.hpp"

namespace tether {

class RelayPeer;

// Frame dispatch for the relay. Routes opaque envelopes between the members of a
// session and keeps presence in step with connections. Payloads are validated
// for shape only and forwarded verbatim.
class MessageRelay {
public:
    MessageRelay(const ServerConfig& config, ConnectionManager& conn_manager,
                 PresenceRegistry& presence, DeviceRegistry& devices);
    ~MessageRelay() = default;

    // Entry point for every text frame received on a connection.
    void handle_frame(const std::shared_ptr<RelayPeer>& peer, const std::string& text);

    /**
     * Disconnect path shared by socket close and eviction. Leaves every joined
     * session and notifies the remaining members. Safe to call repeatedly: only
     * the first call for a membership emits MEMBER_LEFT.
     */
    void on_disconnect(RelayPeer* peer, const std::string& reason);

    // Evicts authenticated peers with no traffic within idle_timeout_sec.
    size_t evict_idle(std::chrono::steady_clock::time_point now);

    bool validate_message_size(size_t size) const {
        return size <= config_.max_message_size;
    }

private:
    const ServerConfig& config_;
    ConnectionManager& conn_manager_;
    PresenceRegistry& presence_;
    DeviceRegistry& devices_;

    void handle_auth(const std::shared_ptr<RelayPeer>& peer, const boost::json::object& frame);
    void handle_join(const std::shared_ptr<RelayPeer>& peer, const DeviceRecord& device,
                     const boost::json::object& frame);
    void handle_leave(const std::shared_ptr<RelayPeer>& peer, const DeviceRecord& device,
                      const boost::json::object& frame);
    void handle_stream_chunk(const std::shared_ptr<RelayPeer>& peer, const DeviceRecord& device,
                             const boost::json::object& frame, const std::string& text);
    void handle_remote_control(const std::shared_ptr<RelayPeer>& peer, const DeviceRecord& device,
                               const boost::json::object& frame, const std::string& text);
    void handle_remote_control_ack(const std::shared_ptr<RelayPeer>& peer, const DeviceRecord& device,
                                   const boost::json::object& frame, const std::string& text);

    // Checks membership and sends the matching ERROR when the device is not a member.
    std::optional<Participant> require_member(const std::shared_ptr<RelayPeer>& peer,
                                              const std::string& session_id, const std::string& device_id);

    // Sends to every online member except the sender. Returns the number reached.
    size_t broadcast(const std::string& session_id, const std::string& frame,
                     const std::string& except_device_id);

    void announce_left(const std::string& session_id, const Participant& participant, const std::string& reason);
    void leave_sessions(const std::string& device_id, const std::string& reason);
};

}
