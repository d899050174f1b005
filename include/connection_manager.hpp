#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <shared_mutex>
#include <memory>

namespace tether {

class RelayPeer;

// deviceId -> live connection on this relay instance.
class ConnectionManager {
public:
    using PeerPtr = std::shared_ptr<RelayPeer>;
    using WeakPeerPtr = std::weak_ptr<RelayPeer>;

    struct AddResult {
        bool accepted = false;
        PeerPtr replaced;  // older connection of the same device, to be closed by the caller
    };

    explicit ConnectionManager(const std::string& salt);
    ~ConnectionManager() = default;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * Registers an authenticated device while enforcing the per-address limit.
     * A device that is already connected is replaced by the new connection.
     */
    AddResult add_connection(const std::string& device_id, PeerPtr peer,
                             const std::string& ip_address, size_t max_per_ip);

    // Drops the mapping only if it still points at this peer.
    void remove_peer(RelayPeer* peer);

    PeerPtr get_connection(const std::string& device_id);
    bool is_online(const std::string& device_id);

    std::vector<PeerPtr> snapshot() const;

    size_t connection_count() const;
    size_t connection_count_for_ip(const std::string& ip_address) const;

    void cleanup_dead_connections();
    void close_all_connections();

    std::string blind_id(const std::string& id) const;

private:
    std::unordered_map<std::string, WeakPeerPtr> connections_;
    std::unordered_map<std::string, size_t> ip_counts_;

    mutable std::shared_mutex connections_mutex_;
    std::string salt_;

    void release_ip_slot(const std::string& ip_address);
};

}
