#include <gtest/gtest.h>

#include "relay/ConnectionRegistry.h"

#include <stdexcept>

namespace walkierelay::relay {
namespace test {

class ConnectionRegistryTest : public ::testing::Test {
protected:
    ConnectionRegistry registry_;
};

TEST_F(ConnectionRegistryTest, RegisterCreatesRecordWithoutIdentity) {
    registry_.register_connection("conn-1", 42);

    const Connection* conn = registry_.lookup("conn-1");
    ASSERT_NE(conn, nullptr);
    EXPECT_EQ(conn->connection_id, "conn-1");
    EXPECT_EQ(conn->connected_at_ms, 42);
    EXPECT_FALSE(conn->has_identity());
    EXPECT_FALSE(conn->current_channel.has_value());
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(ConnectionRegistryTest, RegisterSameIdTwiceThrows) {
    registry_.register_connection("conn-1", 0);
    EXPECT_THROW(registry_.register_connection("conn-1", 1), std::invalid_argument);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(ConnectionRegistryTest, LookupUnknownReturnsNull) {
    EXPECT_EQ(registry_.lookup("nobody"), nullptr);
    EXPECT_EQ(registry_.lookup_by_user_id("nobody"), nullptr);
}

TEST_F(ConnectionRegistryTest, IdentityIsIndexed) {
    registry_.register_connection("conn-1", 0);
    ASSERT_TRUE(registry_.set_identity("conn-1", "alice"));

    const Connection* conn = registry_.lookup_by_user_id("alice");
    ASSERT_NE(conn, nullptr);
    EXPECT_EQ(conn->connection_id, "conn-1");
}

TEST_F(ConnectionRegistryTest, ChangingIdentityDropsOldIndexEntry) {
    registry_.register_connection("conn-1", 0);
    registry_.set_identity("conn-1", "alice");
    registry_.set_identity("conn-1", "bob");

    EXPECT_EQ(registry_.lookup_by_user_id("alice"), nullptr);
    ASSERT_NE(registry_.lookup_by_user_id("bob"), nullptr);
}

TEST_F(ConnectionRegistryTest, SharedUserIdResolvesToLowestConnectionId) {
    registry_.register_connection("conn-b", 0);
    registry_.register_connection("conn-a", 0);
    registry_.set_identity("conn-b", "alice");
    registry_.set_identity("conn-a", "alice");

    const Connection* conn = registry_.lookup_by_user_id("alice");
    ASSERT_NE(conn, nullptr);
    EXPECT_EQ(conn->connection_id, "conn-a");

    registry_.remove("conn-a");
    conn = registry_.lookup_by_user_id("alice");
    ASSERT_NE(conn, nullptr);
    EXPECT_EQ(conn->connection_id, "conn-b");
}

TEST_F(ConnectionRegistryTest, RemoveDropsRecordAndIndex) {
    registry_.register_connection("conn-1", 0);
    registry_.set_identity("conn-1", "alice");

    EXPECT_TRUE(registry_.remove("conn-1"));
    EXPECT_EQ(registry_.lookup("conn-1"), nullptr);
    EXPECT_EQ(registry_.lookup_by_user_id("alice"), nullptr);
    EXPECT_EQ(registry_.size(), 0u);

    EXPECT_FALSE(registry_.remove("conn-1"));
}

TEST_F(ConnectionRegistryTest, SettersRejectUnknownConnection) {
    EXPECT_FALSE(registry_.set_identity("ghost", "alice"));
    EXPECT_FALSE(registry_.set_channel("ghost", std::string("room1")));
    EXPECT_EQ(registry_.lookup_by_user_id("alice"), nullptr);
}

TEST_F(ConnectionRegistryTest, SetChannelCanClear) {
    registry_.register_connection("conn-1", 0);
    registry_.set_channel("conn-1", std::string("room1"));
    ASSERT_EQ(registry_.lookup("conn-1")->current_channel, std::optional<std::string>("room1"));

    registry_.set_channel("conn-1", std::nullopt);
    EXPECT_FALSE(registry_.lookup("conn-1")->current_channel.has_value());
}

TEST_F(ConnectionRegistryTest, ConnectionIdsAreSorted) {
    registry_.register_connection("conn-c", 0);
    registry_.register_connection("conn-a", 0);
    registry_.register_connection("conn-b", 0);

    const std::vector<ConnectionId> expected{"conn-a", "conn-b", "conn-c"};
    EXPECT_EQ(registry_.connection_ids(), expected);
}

} // namespace test
} // namespace walkierelay::relay
