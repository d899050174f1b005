#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <shared_mutex>
#include <memory>

#include "relay_protocol.hpp"

namespace tether {

// Session membership on this relay. State is split into shards selected by a
// hash of the sessionId, so joins in unrelated sessions never contend.
class PresenceRegistry {
public:
    struct JoinResult {
        bool added = false;                     // false when the device was already a member
        bool rejected = false;                  // session is held by another account
        Participant participant;                // the stored record
        std::vector<Participant> participants;  // full membership after the join
    };

    explicit PresenceRegistry(size_t shard_count = 64);

    PresenceRegistry(const PresenceRegistry&) = delete;
    PresenceRegistry& operator=(const PresenceRegistry&) = delete;

    // Idempotent: joining twice keeps the first record and reports added = false.
    // All members of a session must belong to the same account.
    JoinResult join(const std::string& session_id, const Participant& participant);

    // Returns the removed record, or nullopt if the device was not a member.
    std::optional<Participant> leave(const std::string& session_id, const std::string& device_id);

    // Removes the device from every session it joined.
    std::vector<std::pair<std::string, Participant>> leave_all(const std::string& device_id);

    std::vector<Participant> participants(const std::string& session_id) const;
    std::optional<Participant> find(const std::string& session_id, const std::string& device_id) const;
    bool is_member(const std::string& session_id, const std::string& device_id) const;

    std::vector<std::string> sessions_of(const std::string& device_id) const;

    size_t session_count() const;
    size_t shard_count() const { return shards_.size(); }

private:
    struct SessionShard {
        mutable std::shared_mutex mutex;
        std::map<std::string, std::map<std::string, Participant>> sessions;  // session -> device -> record
    };

    struct DeviceShard {
        mutable std::shared_mutex mutex;
        std::map<std::string, std::set<std::string>> sessions;  // device -> joined sessions
    };

    SessionShard& session_shard(const std::string& session_id) const;
    DeviceShard& device_shard(const std::string& device_id) const;

    std::vector<std::unique_ptr<SessionShard>> shards_;
    std::vector<std::unique_ptr<DeviceShard>> device_shards_;
};

}
