#include <gtest/gtest.h>
#include "secret_distributor.hpp"

#include <map>
#include <stdexcept>

using namespace tether;

namespace {

class FakeDirectory : public DeviceDirectory {
public:
    std::vector<DeviceRecord> list_user_devices(const std::string& user_id) override {
        if (fail) throw std::runtime_error("directory offline");
        std::vector<DeviceRecord> out;
        for (const auto& d : devices) {
            if (d.user_id == user_id) out.push_back(d);
        }
        return out;
    }

    std::vector<DeviceRecord> devices;
    bool fail = false;
};

class FakeGrantStore : public GrantStore {
public:
    bool store_grants(const std::vector<SecretGrant>& grants) override {
        if (fail) throw std::runtime_error("store offline");
        for (const auto& g : grants) stored[{g.session_id, g.recipient_device_id}] = g;
        return true;
    }

    std::optional<SecretGrant> fetch_grant(const std::string& session_id, const std::string& device_id) override {
        ++fetches;
        auto it = stored.find({session_id, device_id});
        if (it == stored.end()) return std::nullopt;
        return it->second;
    }

    bool delete_grant(const std::string& session_id, const std::string& device_id) override {
        return stored.erase({session_id, device_id}) > 0;
    }

    std::map<std::pair<std::string, std::string>, SecretGrant> stored;
    bool fail = false;
    int fetches = 0;
};

struct Device {
    DeviceRecord record;
    X25519KeyPair keys;
};

Device make_device(const std::string& id, const std::string& user) {
    Device d;
    d.keys = Crypto::generate_x25519_keypair();
    d.record.device_id = id;
    d.record.user_id = user;
    d.record.public_key = Crypto::base64_encode(d.keys.public_key);
    return d;
}

}

class SecretDistributorTest : public ::testing::Test {
protected:
    void SetUp() override {
        laptop = make_device("laptop", "alice");
        phone = make_device("phone", "alice");
        tablet = make_device("tablet", "alice");
        directory.devices = {laptop.record, phone.record, tablet.record};

        distributor.set_user("alice");
        distributor.set_device_identity("laptop", laptop.keys.private_key);
    }

    FakeDirectory directory;
    FakeGrantStore store;
    KeyCache cache;
    SecretDistributor distributor{directory, store, cache};
    Device laptop, phone, tablet;
};

TEST_F(SecretDistributorTest, OneGrantPerDeviceIncludingSelf) {
    auto key = Crypto::random_key();
    auto grants = distributor.distribute_secret("s1", key);

    ASSERT_EQ(grants.size(), 3u);
    EXPECT_EQ(grants[0].recipient_device_id, "laptop");
    EXPECT_EQ(store.stored.size(), 3u);
    EXPECT_TRUE(*cache.get("alice", "s1") == key);

    for (const auto& g : grants) {
        EXPECT_EQ(g.session_id, "s1");
        EXPECT_GT(g.created_at, 0);
    }
    EXPECT_NE(grants[1].ephemeral_public_key, grants[2].ephemeral_public_key);
}

TEST_F(SecretDistributorTest, RecipientsUnwrapTheSameKey) {
    auto key = Crypto::random_key();
    distributor.distribute_secret("s1", key);

    auto phone_grant = store.stored.at({"s1", "phone"});
    EXPECT_TRUE(SecretDistributor::unwrap_grant(phone_grant, phone.keys.private_key) == key);

    // Another device's private key cannot open it.
    EXPECT_THROW(SecretDistributor::unwrap_grant(phone_grant, tablet.keys.private_key), CryptoError);
}

TEST_F(SecretDistributorTest, SkipsDevicesWithoutUsableKeys) {
    DeviceRecord no_key;
    no_key.device_id = "watch";
    no_key.user_id = "alice";
    DeviceRecord bad_key = no_key;
    bad_key.device_id = "tv";
    bad_key.public_key = Crypto::base64_encode(std::vector<unsigned char>(16, 0x01));
    directory.devices.push_back(no_key);
    directory.devices.push_back(bad_key);

    auto grants = distributor.distribute_secret("s1", Crypto::random_key());
    EXPECT_EQ(grants.size(), 3u);
    EXPECT_EQ(store.stored.count({"s1", "watch"}), 0u);
    EXPECT_EQ(store.stored.count({"s1", "tv"}), 0u);
}

TEST_F(SecretDistributorTest, GrantIsBoundToSession) {
    auto key = Crypto::random_key();
    distributor.distribute_secret("s1", key);

    auto grant = store.stored.at({"s1", "phone"});
    grant.session_id = "s2";
    EXPECT_THROW(SecretDistributor::unwrap_grant(grant, phone.keys.private_key), CryptoError);
}

TEST_F(SecretDistributorTest, RequiresUserAndIdentity) {
    FakeDirectory dir;
    FakeGrantStore grants;
    KeyCache local;
    SecretDistributor anonymous(dir, grants, local);

    try {
        anonymous.distribute_secret("s1", Crypto::random_key());
        FAIL() << "expected SecretError";
    } catch (const SecretError& e) {
        EXPECT_EQ(e.code(), SecretErrorCode::NotAuthenticated);
    }

    anonymous.set_user("alice");
    try {
        anonymous.session_key("s1");
        FAIL() << "expected SecretError";
    } catch (const SecretError& e) {
        EXPECT_EQ(e.code(), SecretErrorCode::NoDeviceIdentity);
    }
}

TEST_F(SecretDistributorTest, StorageFailures) {
    directory.fail = true;
    try {
        distributor.distribute_secret("s1", Crypto::random_key());
        FAIL() << "expected SecretError";
    } catch (const SecretError& e) {
        EXPECT_EQ(e.code(), SecretErrorCode::Storage);
    }

    directory.fail = false;
    store.fail = true;
    EXPECT_THROW(distributor.distribute_secret("s1", Crypto::random_key()), SecretError);
    EXPECT_FALSE(cache.contains("alice", "s1"));
}

TEST_F(SecretDistributorTest, RejectsShortSessionKey) {
    try {
        distributor.distribute_secret("s1", SecureBytes(16));
        FAIL() << "expected SecretError";
    } catch (const SecretError& e) {
        EXPECT_EQ(e.code(), SecretErrorCode::Encryption);
    }
}

TEST_F(SecretDistributorTest, RecipientFetchesAndConsumesGrant) {
    auto key = Crypto::random_key();
    distributor.distribute_secret("s1", key);

    KeyCache phone_cache;
    SecretDistributor on_phone(directory, store, phone_cache);
    on_phone.set_user("alice");
    on_phone.set_device_identity("phone", phone.keys.private_key);

    EXPECT_TRUE(on_phone.session_key("s1") == key);
    EXPECT_TRUE(phone_cache.contains("alice", "s1"));
    EXPECT_EQ(store.stored.count({"s1", "phone"}), 0u);

    // Served from the cache afterwards.
    int fetches = store.fetches;
    EXPECT_TRUE(on_phone.session_key("s1") == key);
    EXPECT_EQ(store.fetches, fetches);
}

TEST_F(SecretDistributorTest, MissingGrantIsSessionNotFound) {
    try {
        distributor.session_key("unknown");
        FAIL() << "expected SecretError";
    } catch (const SecretError& e) {
        EXPECT_EQ(e.code(), SecretErrorCode::SessionNotFound);
    }
}

TEST_F(SecretDistributorTest, AcceptedGrantAvoidsTheStore) {
    auto key = Crypto::random_key();
    auto grant = SecretDistributor::wrap_for_recipient("s9", key, "laptop", laptop.keys.public_key);

    distributor.accept_grant(grant);
    EXPECT_TRUE(distributor.session_key("s9") == key);
    EXPECT_EQ(store.fetches, 0);
}

TEST_F(SecretDistributorTest, GrantForAnotherDeviceIsRefused) {
    auto grant = SecretDistributor::wrap_for_recipient("s1", Crypto::random_key(), "phone", phone.keys.public_key);
    EXPECT_THROW(distributor.open_grant(grant), SecretError);
}

TEST_F(SecretDistributorTest, ClearWipesCachedKeys) {
    distributor.distribute_secret("s1", Crypto::random_key());
    ASSERT_TRUE(cache.contains("alice", "s1"));

    distributor.clear();
    EXPECT_FALSE(cache.contains("alice", "s1"));
    EXPECT_THROW(distributor.session_key("s1"), SecretError);
}
