#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "fakes.h"
#include "registry/room_registry_client.h"

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using json = nlohmann::json;

namespace {

class MockRegistryClient : public RoomRegistryClient {
public:
    using RoomRegistryClient::HttpResponse;

    MockRegistryClient()
        : RoomRegistryClient(RegistryConfig{"https://relay.example/api/tools/banpick", "/rooms", 1000}) {}

    MOCK_METHOD(HttpResponse, perform,
                (const std::string& method, const std::string& url, const std::string& body),
                (override));
};

MockRegistryClient::HttpResponse reply(long status, const std::string& body) {
    return {status, body};
}

} // namespace

TEST(RoomRegistryClientTest, CreateRoomPostsOffer) {
    MockRegistryClient client;
    const std::string url = "https://relay.example/api/tools/banpick/rooms";
    EXPECT_CALL(client, perform("POST", url, _))
        .WillOnce([](const std::string&, const std::string&, const std::string& body) {
            const json j = json::parse(body);
            EXPECT_EQ(j.at("room_id"), "AB12CD34");
            EXPECT_EQ(j.at("host_offer"), "offer-blob");
            return reply(200, R"({"room_id":"AB12CD34","message":"Room created"})");
        });

    const CreatedRoom created = client.create_room("AB12CD34", "offer-blob");
    EXPECT_EQ(created.room_id, "AB12CD34");
    EXPECT_EQ(created.message, "Room created");
}

TEST(RoomRegistryClientTest, CheckTreats404AsMissing) {
    MockRegistryClient client;
    EXPECT_CALL(client, perform("GET", "https://relay.example/api/tools/banpick/rooms/ZZZZ9999/check", ""))
        .WillOnce(Return(reply(404, R"({"exists":false})")));

    const RoomCheck check = client.check_room("ZZZZ9999");
    EXPECT_FALSE(check.exists);
    EXPECT_FALSE(check.room.has_value());
}

TEST(RoomRegistryClientTest, CheckReturnsRoom) {
    MockRegistryClient client;
    EXPECT_CALL(client, perform("GET", _, _))
        .WillOnce(Return(reply(200,
            R"({"exists":true,"room":{"room_id":"AB12CD34","host_offer":"o","guest_answer":"",)"
            R"("created_at":1700000000,"ttl":3600,"tool_type":"banpick_simulator"}})")));

    const RoomCheck check = client.check_room("AB12CD34");
    ASSERT_TRUE(check.exists);
    ASSERT_TRUE(check.room.has_value());
    EXPECT_EQ(check.room->host_offer, "o");
    EXPECT_EQ(check.room->ttl, 3600);
    EXPECT_EQ(check.room->tool_type, "banpick_simulator");
}

TEST(RoomRegistryClientTest, RoomDataDefaultsMissingFields) {
    MockRegistryClient client;
    EXPECT_CALL(client, perform("GET", "https://relay.example/api/tools/banpick/rooms/AB12CD34", ""))
        .WillOnce(Return(reply(200, R"({"room_id":"AB12CD34","created_at":"1700000000"})")));

    const RoomRecord room = client.get_room_data("AB12CD34");
    EXPECT_EQ(room.room_id, "AB12CD34");
    EXPECT_EQ(room.host_offer, "");
    EXPECT_EQ(room.guest_answer, "");
    EXPECT_EQ(room.created_at, 1700000000);
    EXPECT_EQ(room.ttl, 0);
}

TEST(RoomRegistryClientTest, MistypedFieldsAreRegistryErrors) {
    MockRegistryClient client;
    EXPECT_CALL(client, perform("GET", _, _))
        .WillOnce(Return(reply(200, R"({"room_id":"AB12CD34","host_offer":"o","guest_answer":null})")))
        .WillOnce(Return(reply(200, R"({"exists":true,"room":{"room_id":42}})")))
        .WillOnce(Return(reply(200, R"({"exists":"yes"})")))
        .WillOnce(Return(reply(200, R"(["AB12CD34"])")));

    EXPECT_THROW(client.get_room_data("AB12CD34"), RegistryError);
    EXPECT_THROW(client.check_room("AB12CD34"), RegistryError);
    EXPECT_THROW(client.check_room("AB12CD34"), RegistryError);
    EXPECT_THROW(client.get_room_data("AB12CD34"), RegistryError);
}

TEST(RoomRegistryClientTest, UpdatesUsePut) {
    MockRegistryClient client;
    EXPECT_CALL(client, perform("PUT", "https://relay.example/api/tools/banpick/rooms/AB12CD34/answer",
                                R"({"guest_answer":"answer-blob"})"))
        .WillOnce(Return(reply(200, R"({"message":"Answer updated"})")));
    EXPECT_CALL(client, perform("PUT", "https://relay.example/api/tools/banpick/rooms/AB12CD34/offer",
                                R"({"host_offer":"offer-blob"})"))
        .WillOnce(Return(reply(200, R"({"message":"Offer updated"})")));

    EXPECT_EQ(client.update_room_answer("AB12CD34", "answer-blob"), "Answer updated");
    EXPECT_EQ(client.update_room_offer("AB12CD34", "offer-blob"), "Offer updated");
}

TEST(RoomRegistryClientTest, ErrorStatusUsesBodyMessage) {
    MockRegistryClient client;
    EXPECT_CALL(client, perform(_, _, _))
        .WillOnce(Return(reply(404, R"({"error":"Room not found"})")))
        .WillOnce(Return(reply(500, "{}")))
        .WillOnce(Return(reply(502, "<html>bad gateway</html>")));

    try {
        client.get_room_data("AB12CD34");
        FAIL() << "expected RegistryError";
    } catch (const RegistryError& ex) {
        EXPECT_STREQ(ex.what(), "Room not found");
        EXPECT_EQ(ex.status(), 404);
    }
    try {
        client.update_room_answer("AB12CD34", "x");
        FAIL() << "expected RegistryError";
    } catch (const RegistryError& ex) {
        EXPECT_STREQ(ex.what(), "HTTP 500");
        EXPECT_EQ(ex.status(), 500);
    }
    EXPECT_THROW(client.create_room("AB12CD34"), RegistryError);
}

TEST(RoomRegistryClientTest, TransportFailurePropagates) {
    MockRegistryClient client;
    EXPECT_CALL(client, perform(_, _, _))
        .WillOnce(Throw(RegistryError("registry request failed: Couldn't connect to server", 0)));

    try {
        client.check_room("AB12CD34");
        FAIL() << "expected RegistryError";
    } catch (const RegistryError& ex) {
        EXPECT_EQ(ex.status(), 0);
    }
}

TEST(RoomRegistryClientTest, InvalidIdNeverReachesTheNetwork) {
    MockRegistryClient client;
    EXPECT_CALL(client, perform(_, _, _)).Times(0);
    EXPECT_THROW(client.get_room_data("../admin"), std::invalid_argument);
    EXPECT_THROW(client.check_room("ab12cd34"), std::invalid_argument);
}

TEST(RoomRegistryClientTest, RoomIdFormat) {
    EXPECT_TRUE(is_valid_room_id("AB12CD34"));
    EXPECT_TRUE(is_valid_room_id("00000000"));
    EXPECT_FALSE(is_valid_room_id("AB12CD3"));
    EXPECT_FALSE(is_valid_room_id("AB12CD345"));
    EXPECT_FALSE(is_valid_room_id("ab12cd34"));
    EXPECT_FALSE(is_valid_room_id("AB12-D34"));
    EXPECT_FALSE(is_valid_room_id(""));
}

TEST(RoomRegistryClientTest, InMemoryRelayRoundTrip) {
    InMemoryRegistry registry;
    registry.create_room("AB12CD34", "offer");
    EXPECT_TRUE(registry.check_room("AB12CD34").exists);
    EXPECT_FALSE(registry.check_room("ZZ12CD34").exists);

    registry.update_room_answer("AB12CD34", "answer");
    const RoomRecord room = registry.get_room_data("AB12CD34");
    EXPECT_EQ(room.host_offer, "offer");
    EXPECT_EQ(room.guest_answer, "answer");
    EXPECT_EQ(registry.calls.front(), "POST /rooms");
}
