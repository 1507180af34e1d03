#include <gtest/gtest.h>

#include <string>

#include "network/frame.h"

TEST(FrameTest, HeaderIsBigEndian) {
    const frame::Header header = frame::encode_header(0x01020304u);
    EXPECT_EQ(header[0], 0x01);
    EXPECT_EQ(header[1], 0x02);
    EXPECT_EQ(header[2], 0x03);
    EXPECT_EQ(header[3], 0x04);
    EXPECT_EQ(frame::decode_header(header), 0x01020304u);
}

TEST(FrameTest, EncodePrefixesLength) {
    const std::string framed = frame::encode("{\"ack\":\"s\"}");
    ASSERT_EQ(framed.size(), frame::kHeaderSize + 11);
    EXPECT_EQ(framed.substr(0, 4), std::string("\0\0\0\x0b", 4));
    EXPECT_EQ(framed.substr(4), "{\"ack\":\"s\"}");

    EXPECT_EQ(frame::encode(""), std::string(4, '\0'));
}
