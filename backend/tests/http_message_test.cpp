#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "api/http_message.h"

TEST(HttpMessageTest, ParsesRequestHead) {
    const auto request = parse_request_head(
        "POST /select?debug=1 HTTP/1.1\r\n"
        "Host: 127.0.0.1:8787\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length:  17 \r\n"
        "\r\n");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method, "POST");
    EXPECT_EQ(request->target, "/select?debug=1");
    EXPECT_EQ(request->path, "/select");
    EXPECT_EQ(request->header("content-type"), "application/json");
    EXPECT_EQ(request->header("CONTENT-TYPE"), "application/json");
    EXPECT_EQ(request->header("x-missing"), "");
    EXPECT_EQ(content_length(*request), std::size_t{17});
}

TEST(HttpMessageTest, RejectsMalformedHeads) {
    EXPECT_FALSE(parse_request_head("").has_value());
    EXPECT_FALSE(parse_request_head("GET /\r\n\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET / SPDY/3\r\n\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET state HTTP/1.1\r\n\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1\r\nno colon here\r\n\r\n").has_value());
}

TEST(HttpMessageTest, ContentLength) {
    HttpRequest request;
    EXPECT_EQ(content_length(request), std::size_t{0});

    request.headers["content-length"] = "-5";
    EXPECT_FALSE(content_length(request).has_value());

    request.headers["content-length"] = "99999999999999999999999";
    EXPECT_FALSE(content_length(request).has_value());
}

TEST(HttpMessageTest, SerializesResponse) {
    const HttpResponse response = error_response(409, "a session is already solo");
    const std::string text = serialize(response);

    EXPECT_EQ(text.rfind("HTTP/1.1 409 Conflict\r\n", 0), 0u);
    EXPECT_NE(text.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(text.find("Content-Length: " + std::to_string(response.body.size()) + "\r\n"),
              std::string::npos);
    EXPECT_NE(text.find("Connection: close\r\n\r\n"), std::string::npos);

    const auto body = nlohmann::json::parse(text.substr(text.find("\r\n\r\n") + 4));
    EXPECT_EQ(body.at("error"), "a session is already solo");
}
