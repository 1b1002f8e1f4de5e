#include <gtest/gtest.h>

#include "relay/Payload.h"
#include "relay/SignalingRouter.h"
#include "support/RelayFixture.h"

#include <boost/json.hpp>

namespace walkierelay::relay {
namespace test {

namespace json = boost::json;
using walkierelay::test::RelayFixture;

class SignalingRouterTest : public RelayFixture {
protected:
    void SetUp() override {
        connect_and_join("conn-a", "room1", "userA");
        connect_and_join("conn-b", "room1", "userB");
        connect_and_join("conn-c", "room2", "userC");
        transport.clear();
    }

    static json::object offer() { return json::object{{"type", "offer"}, {"sdp", "v=0"}}; }

    SignalingRouter router_{ctx, false};
};

TEST(SignalKindTest, MapsInboundEventNames) {
    EXPECT_EQ(signal_kind_of("webrtc-offer"), SignalKind::Offer);
    EXPECT_EQ(signal_kind_of("webrtc-answer"), SignalKind::Answer);
    EXPECT_EQ(signal_kind_of("webrtc-ice-candidate"), SignalKind::IceCandidate);
    EXPECT_EQ(signal_kind_of("ice-candidate"), SignalKind::IceCandidate);
    EXPECT_EQ(signal_kind_of("request-webrtc-connection"), SignalKind::ConnectionRequest);
    EXPECT_FALSE(signal_kind_of("audio-data").has_value());
}

TEST_F(SignalingRouterTest, OfferWithoutTargetGoesToRestOfChannel) {
    connect_and_join("conn-d", "room1", "userD");
    transport.clear();

    const auto n = router_.route("conn-a", "webrtc-offer", json::object{{"channelId", "room1"}, {"offer", offer()}});

    EXPECT_EQ(n, 2u);
    for (const char* id : {"conn-b", "conn-d"}) {
        const auto* got = transport.last(id, "webrtc-offer");
        ASSERT_NE(got, nullptr) << id;
        EXPECT_EQ(got->payload, json::value(json::object{{"userId", "userA"}, {"offer", offer()}}));
    }
    EXPECT_EQ(transport.count("conn-a", "webrtc-offer"), 0u);
    EXPECT_EQ(transport.count("conn-c", "webrtc-offer"), 0u);
}

TEST_F(SignalingRouterTest, TargetedOfferReachesOnlyTarget) {
    connect_and_join("conn-d", "room1", "userD");
    transport.clear();

    const auto n = router_.route("conn-a", "webrtc-offer",
                                 json::object{{"channelId", "room1"}, {"targetUserId", "userB"}, {"offer", offer()}});

    EXPECT_EQ(n, 1u);
    EXPECT_EQ(transport.count("conn-b", "webrtc-offer"), 1u);
    EXPECT_EQ(transport.count("conn-d", "webrtc-offer"), 0u);
}

TEST_F(SignalingRouterTest, TargetedOfferFollowsRenamedMember) {
    presence.join("conn-b", "room1", "userB2");
    transport.clear();

    const auto n = router_.route("conn-a", "webrtc-offer",
                                 json::object{{"channelId", "room1"}, {"targetUserId", "userB2"}, {"offer", offer()}});

    EXPECT_EQ(n, 1u);
    EXPECT_EQ(transport.count("conn-b", "webrtc-offer"), 1u);
}

TEST_F(SignalingRouterTest, AnswerNeedsTarget) {
    try {
        router_.route("conn-b", "webrtc-answer", json::object{{"channelId", "room1"}, {"answer", offer()}});
        FAIL() << "expected RelayError";
    } catch (const RelayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidPayload);
    }
    EXPECT_TRUE(transport.delivered.empty());
}

TEST_F(SignalingRouterTest, AnswerToTargetCarriesAnswer) {
    const auto n = router_.route("conn-b", "webrtc-answer",
                                 json::object{{"channelId", "room1"}, {"targetUserId", "userA"}, {"answer", offer()}});

    EXPECT_EQ(n, 1u);
    const auto* got = transport.last("conn-a", "webrtc-answer");
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->payload, json::value(json::object{{"userId", "userB"}, {"answer", offer()}}));
}

TEST_F(SignalingRouterTest, MissingOfferIsInvalid) {
    EXPECT_THROW(router_.route("conn-a", "webrtc-offer", json::object{{"channelId", "room1"}}), RelayError);
}

TEST_F(SignalingRouterTest, MissingChannelIsInvalid) {
    EXPECT_THROW(router_.route("conn-a", "webrtc-offer", json::object{{"offer", offer()}}), RelayError);
}

TEST_F(SignalingRouterTest, IceCandidateKeepsItsEventName) {
    const json::object candidate{{"candidate", "candidate:1 1 udp 1 1.2.3.4 5 typ host"}, {"sdpMid", "0"}};

    router_.route("conn-a", "ice-candidate",
                  json::object{{"channelId", "room1"}, {"targetUserId", "userB"}, {"candidate", candidate}});
    router_.route("conn-a", "webrtc-ice-candidate",
                  json::object{{"channelId", "room1"}, {"candidate", candidate}});

    const auto* plain = transport.last("conn-b", "ice-candidate");
    ASSERT_NE(plain, nullptr);
    EXPECT_EQ(plain->payload, json::value(json::object{{"userId", "userA"}, {"candidate", candidate}}));
    EXPECT_EQ(transport.count("conn-b", "webrtc-ice-candidate"), 1u);
}

TEST_F(SignalingRouterTest, ConnectionRequestIsRenamed) {
    const auto n = router_.route("conn-a", "request-webrtc-connection",
                                 json::object{{"channelId", "room1"}, {"targetUserId", "userB"}});

    EXPECT_EQ(n, 1u);
    const auto* got = transport.last("conn-b", "webrtc-connection-request");
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->payload, json::value(json::object{{"userId", "userA"}}));
}

TEST_F(SignalingRouterTest, ConnectionRequestNeedsTarget) {
    EXPECT_THROW(router_.route("conn-a", "request-webrtc-connection", json::object{{"channelId", "room1"}}),
                 RelayError);
}

TEST_F(SignalingRouterTest, UnknownTargetIsDroppedQuietly) {
    const auto n = router_.route("conn-a", "webrtc-offer",
                                 json::object{{"channelId", "room1"}, {"targetUserId", "ghost"}, {"offer", offer()}});

    EXPECT_EQ(n, 0u);
    EXPECT_TRUE(transport.delivered.empty());
}

TEST_F(SignalingRouterTest, TargetInOtherChannelIsNotReachedByChannelAddressing) {
    const auto n = router_.route("conn-a", "webrtc-offer",
                                 json::object{{"channelId", "room1"}, {"targetUserId", "userC"}, {"offer", offer()}});
    EXPECT_EQ(n, 0u);
    EXPECT_EQ(transport.count("conn-c", "webrtc-offer"), 0u);
}

TEST_F(SignalingRouterTest, ToAddressStaysInsideSenderChannel) {
    EXPECT_EQ(router_.route("conn-a", "webrtc-offer", json::object{{"to", "userC"}, {"offer", offer()}}), 0u);
    EXPECT_EQ(transport.count("conn-c", "webrtc-offer"), 0u);

    EXPECT_EQ(router_.route("conn-a", "webrtc-offer", json::object{{"to", "userB"}, {"offer", offer()}}), 1u);
    const auto* got = transport.last("conn-b", "webrtc-offer");
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->payload,
              json::value(json::object{{"userId", "userA"}, {"offer", offer()}, {"from", "userA"}}));
}

TEST_F(SignalingRouterTest, ToAddressCanCrossChannelsWhenAllowed) {
    SignalingRouter open_router(ctx, true);
    ASSERT_TRUE(open_router.allows_cross_channel());

    EXPECT_EQ(open_router.route("conn-a", "webrtc-offer", json::object{{"to", "userC"}, {"offer", offer()}}), 1u);
    EXPECT_EQ(transport.count("conn-c", "webrtc-offer"), 1u);
}

TEST_F(SignalingRouterTest, ToAddressFromSenderOutsideAnyChannelIsDropped) {
    connect("conn-e");
    transport.clear();

    const auto n = router_.route("conn-e", "webrtc-offer",
                                 json::object{{"userId", "userE"}, {"to", "userB"}, {"offer", offer()}});

    EXPECT_EQ(n, 0u);
    EXPECT_TRUE(transport.delivered.empty());
}

TEST_F(SignalingRouterTest, SenderWithoutIdentityIsRejected) {
    connect("conn-e");

    try {
        router_.route("conn-e", "webrtc-offer", json::object{{"channelId", "room1"}, {"offer", offer()}});
        FAIL() << "expected RelayError";
    } catch (const RelayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IdentityNotSet);
    }
}

TEST_F(SignalingRouterTest, PayloadUserIdUsedOnlyWithoutRegisteredIdentity) {
    router_.route("conn-a", "webrtc-offer",
                  json::object{{"channelId", "room1"}, {"userId", "impostor"}, {"offer", offer()}});
    const auto* got = transport.last("conn-b", "webrtc-offer");
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->payload.as_object().at("userId"), json::value("userA"));

    connect("conn-e");
    router_.route("conn-e", "webrtc-offer",
                  json::object{{"channelId", "room1"}, {"userId", "userE"}, {"offer", offer()}});
    got = transport.last("conn-b", "webrtc-offer");
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->payload.as_object().at("userId"), json::value("userE"));
}

TEST_F(SignalingRouterTest, ResolveHonoursChannelScope) {
    EXPECT_EQ(router_.resolve(DirectTo{"userB", std::string("room1")}), std::optional<ConnectionId>("conn-b"));
    EXPECT_FALSE(router_.resolve(DirectTo{"userB", std::string("room2")}).has_value());
    EXPECT_EQ(router_.resolve(DirectTo{"userC", std::nullopt}), std::optional<ConnectionId>("conn-c"));
}

TEST_F(SignalingRouterTest, NonSignalingEventIsUnknown) {
    try {
        router_.route("conn-a", "audio-data", json::object{});
        FAIL() << "expected RelayError";
    } catch (const RelayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnknownEvent);
    }
}

} // namespace test
} // namespace walkierelay::relay
