#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <mutex>
#include "connection_manager.hpp"
#include "relay_peer.hpp"
#include "metrics.hpp"
#include "logger.hpp"

namespace tether {

ConnectionManager::ConnectionManager(const std::string& salt) : salt_(salt) {
}

// Registers a device connection while enforcing per-IP resource limits.
ConnectionManager::AddResult ConnectionManager::add_connection(const std::string& device_id,
                                                               PeerPtr peer,
                                                               const std::string& ip_address,
                                                               size_t max_per_ip) {
    AddResult result;
    std::unique_lock lock(connections_mutex_);

    // A re-authenticating peer is already counted toward its IP.
    bool already_counted = peer->is_authenticated();

    std::string b_ip = blind_id(ip_address);
    size_t& count = ip_counts_[b_ip];
    if (!already_counted && count >= max_per_ip) {
        MetricsRegistry::instance().increment_counter("tether_connection_rejected_limit_total");
        if (count == 0) ip_counts_.erase(b_ip);
        return result;
    }

    auto it = connections_.find(device_id);
    if (it != connections_.end()) {
        auto existing = it->second.lock();
        if (existing && existing != peer) {
            result.replaced = existing;
        }
    }
    connections_[device_id] = peer;

    if (!already_counted) {
        count++;
        peer->set_authenticated(true);
        MetricsRegistry::instance().increment_gauge("tether_active_connections");
    }

    MetricsRegistry::instance().increment_counter("tether_connection_created_total");
    result.accepted = true;
    return result;
}

void ConnectionManager::release_ip_slot(const std::string& ip_address) {
    auto slot = ip_counts_.find(blind_id(ip_address));
    if (slot == ip_counts_.end()) return;
    if (slot->second <= 1) {
        ip_counts_.erase(slot);
    } else {
        --slot->second;
    }
}

// Cleans up tracking data when a connection terminates.
void ConnectionManager::remove_peer(RelayPeer* peer) {
    if (!peer) return;

    std::unique_lock lock(connections_mutex_);

    std::string device_id = peer->device_id();
    if (!device_id.empty()) {
        auto it = connections_.find(device_id);
        if (it != connections_.end()) {
            auto existing = it->second.lock();
            if (!existing || existing.get() == peer) {
                connections_.erase(it);
            }
        }
    }

    if (peer->is_authenticated()) {
        MetricsRegistry::instance().decrement_gauge("tether_active_connections");
        release_ip_slot(peer->remote_address());
        peer->set_authenticated(false);
    }
}

ConnectionManager::PeerPtr ConnectionManager::get_connection(const std::string& device_id) {
    std::shared_lock lock(connections_mutex_);
    auto it = connections_.find(device_id);
    return it == connections_.end() ? nullptr : it->second.lock();
}

bool ConnectionManager::is_online(const std::string& device_id) {
    return !device_id.empty() && get_connection(device_id) != nullptr;
}

std::vector<ConnectionManager::PeerPtr> ConnectionManager::snapshot() const {
    std::vector<PeerPtr> peers;
    std::shared_lock lock(connections_mutex_);
    peers.reserve(connections_.size());
    for (const auto& entry : connections_) {
        if (auto peer = entry.second.lock()) peers.push_back(std::move(peer));
    }
    return peers;
}

size_t ConnectionManager::connection_count() const {
    std::shared_lock lock(connections_mutex_);
    return connections_.size();
}

size_t ConnectionManager::connection_count_for_ip(const std::string& ip_address) const {
    const std::string key = blind_id(ip_address);
    std::shared_lock lock(connections_mutex_);
    auto it = ip_counts_.find(key);
    return it == ip_counts_.end() ? 0 : it->second;
}

// Removes entries whose connection object is already gone.
void ConnectionManager::cleanup_dead_connections() {
    std::unique_lock lock(connections_mutex_);
    auto it = connections_.begin();
    while (it != connections_.end()) {
        it = it->second.expired() ? connections_.erase(it) : std::next(it);
    }
}

void ConnectionManager::close_all_connections() {
    for (const auto& peer : snapshot()) {
        try {
            peer->close();
        } catch (const std::exception& e) {
            Logger::log(Logger::Level::WARNING, Logger::EventType::CONNECTION, peer->remote_address(),
                        std::string("Close failed during shutdown: ") + e.what());
        }
    }
}

// Salted SHA256 of an identifier; keeps raw addresses out of the limit table.
std::string ConnectionManager::blind_id(const std::string& id) const {
    std::string data = id + salt_;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

}
