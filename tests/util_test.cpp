#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "shadowrelay/logging.hpp"
#include "shadowrelay/protocol.hpp"
#include "shadowrelay/util.hpp"

using namespace shadowrelay;

TEST(UtilTest, ParseHostPort) {
    std::string host;
    uint16_t port = 0;
    ASSERT_TRUE(parse_host_port("0.0.0.0:8388", host, port));
    EXPECT_EQ(host, "0.0.0.0");
    EXPECT_EQ(port, 8388);
    ASSERT_TRUE(parse_host_port("[::1]:65535", host, port));
    EXPECT_EQ(host, "::1");
    EXPECT_EQ(port, 65535);
    EXPECT_FALSE(parse_host_port("localhost", host, port));
    EXPECT_FALSE(parse_host_port(":80", host, port));
    EXPECT_FALSE(parse_host_port("host:65536", host, port));
    EXPECT_FALSE(parse_host_port("host:-1", host, port));
    EXPECT_FALSE(parse_host_port("host:", host, port));
}

TEST(UtilTest, HexToBytes) {
    EXPECT_EQ(hex_to_bytes("00ff10Ab"), (std::vector<uint8_t>{0x00, 0xff, 0x10, 0xab}));
    EXPECT_TRUE(hex_to_bytes("abc").empty());
    EXPECT_TRUE(hex_to_bytes("zz").empty());
    EXPECT_TRUE(hex_to_bytes("").empty());
}

TEST(UtilTest, ParseUint) {
    uint64_t v = 0;
    EXPECT_TRUE(parse_uint("3000", 600000, v));
    EXPECT_EQ(v, 3000u);
    EXPECT_FALSE(parse_uint("600001", 600000, v));
    EXPECT_FALSE(parse_uint("12a", 600000, v));
    EXPECT_FALSE(parse_uint("", 600000, v));
}

TEST(UtilTest, LogLevelNames) {
    LogLevel lvl = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("debug", lvl));
    EXPECT_EQ(lvl, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("error", lvl));
    EXPECT_EQ(lvl, LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("loud", lvl));
    EXPECT_EQ(lvl, LogLevel::ERROR);
}

TEST(UtilTest, ErrorMessagesNameTheCategory) {
    std::error_code ec = relay_errc::truncated_chunk_header;
    EXPECT_STREQ(ec.category().name(), "shadowrelay");
    EXPECT_EQ(ec.message(), "auth head is too short");
}
