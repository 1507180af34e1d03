#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "network/signaling.h"

using namespace signaling;
using json = nlohmann::json;

TEST(SignalingTest, OfferKeepsCandidateOrder) {
    Offer offer;
    offer.session = "0123456789abcdef0123456789abcdef";
    offer.candidates = {{"192.168.1.10", 40000}, {"127.0.0.1", 40000}};

    const json j = json::parse(encode_offer(offer));
    EXPECT_EQ(j.at("type"), "offer");
    EXPECT_EQ(j.at("candidates").at(0).at("address"), "192.168.1.10");

    const Offer back = decode_offer(encode_offer(offer));
    EXPECT_EQ(back.session, offer.session);
    ASSERT_EQ(back.candidates.size(), 2u);
    EXPECT_EQ(back.candidates[1].address, "127.0.0.1");
    EXPECT_EQ(back.candidates[1].port, 40000);
}

TEST(SignalingTest, AnswerFields) {
    const Answer answer = decode_answer(R"({"type":"answer","session":"s1","token":"t1"})");
    EXPECT_EQ(answer.session, "s1");
    EXPECT_EQ(answer.token, "t1");
}

TEST(SignalingTest, RejectsMalformedOffers) {
    const char* bad[] = {
        "",
        "v=0\r\no=- 0 0 IN IP4 127.0.0.1",
        R"({"type":"answer","session":"s","token":"t"})",
        R"({"type":"offer","candidates":[{"address":"127.0.0.1","port":1}]})",
        R"({"type":"offer","session":"s","candidates":[]})",
        R"({"type":"offer","session":"s","candidates":[{"address":"127.0.0.1"}]})",
        R"({"type":"offer","session":"s","candidates":[{"address":"127.0.0.1","port":0}]})",
        R"({"type":"offer","session":"s","candidates":[{"address":"127.0.0.1","port":70000}]})",
        R"({"type":"offer","session":"s","candidates":[{"address":"not-an-ip","port":80}]})",
    };
    for (const char* blob : bad) {
        EXPECT_THROW(decode_offer(blob), NegotiationError) << blob;
    }
}

TEST(SignalingTest, RejectsMalformedAnswers) {
    EXPECT_THROW(decode_answer("{"), NegotiationError);
    EXPECT_THROW(decode_answer(R"({"type":"offer","session":"s","token":"t"})"), NegotiationError);
    EXPECT_THROW(decode_answer(R"({"type":"answer","session":"s"})"), NegotiationError);
    EXPECT_THROW(decode_answer(R"({"type":"answer","session":"s","token":""})"), NegotiationError);
}

TEST(SignalingTest, HelloAndAck) {
    const Answer answer{"session-1", "token-1"};
    const auto hello = decode_hello(encode_hello(answer));
    ASSERT_TRUE(hello.has_value());
    EXPECT_EQ(hello->session, "session-1");
    EXPECT_EQ(hello->token, "token-1");

    EXPECT_FALSE(decode_hello("garbage").has_value());
    EXPECT_FALSE(decode_hello(R"({"hello":{"session":"s"}})").has_value());
    EXPECT_FALSE(decode_hello(R"({"hello":{"session":1,"token":2}})").has_value());

    EXPECT_TRUE(is_ack_for(encode_ack("session-1"), "session-1"));
    EXPECT_FALSE(is_ack_for(encode_ack("session-2"), "session-1"));
    EXPECT_FALSE(is_ack_for(R"({"type":"DRAFT_RESET"})", "session-1"));
}
