#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/scanners/AddressCodec.h"
#include <string>
#include <vector>

namespace conn_tracker {

class AddressCodecTest : public ::testing::Test {};

TEST_F(AddressCodecTest, DecodeIpv4Loopback) {
    auto ip = decode_ipv4("0100007F");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "127.0.0.1");
}

// The table stores the address little-endian; bytes read back to front.
TEST_F(AddressCodecTest, DecodeIpv4IsLittleEndian) {
    auto ip = decode_ipv4("01020304");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "4.3.2.1");
}

TEST_F(AddressCodecTest, DecodeIpv4AcceptsLowercaseHex) {
    auto ip = decode_ipv4("0a01a8c0");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "192.168.1.10");
}

TEST_F(AddressCodecTest, DecodeIpv4Wildcard) {
    EXPECT_EQ(decode_ipv4("00000000").value_or(""), "0.0.0.0");
}

TEST_F(AddressCodecTest, DecodeIpv4RejectsWrongLength) {
    EXPECT_FALSE(decode_ipv4("").has_value());
    EXPECT_FALSE(decode_ipv4("0100007").has_value());
    EXPECT_FALSE(decode_ipv4("0100007F0").has_value());
    EXPECT_FALSE(decode_ipv4("00000000000000000000000000000001").has_value());
}

TEST_F(AddressCodecTest, DecodeIpv4RejectsNonHex) {
    EXPECT_FALSE(decode_ipv4("0100007G").has_value());
    EXPECT_FALSE(decode_ipv4("+100007F").has_value());
    EXPECT_FALSE(decode_ipv4("0x00007F").has_value());
    EXPECT_FALSE(decode_ipv4("0100 07F").has_value());
}

TEST_F(AddressCodecTest, Ipv4RoundTrip) {
    std::vector<std::string> addrs = {"127.0.0.1", "10.0.0.5", "192.168.100.254", "255.255.255.255", "1.2.3.4"};
    for (const auto& a : addrs) {
        auto hex = encode_ipv4(a);
        ASSERT_TRUE(hex.has_value()) << a;
        EXPECT_EQ(hex->size(), 8u);
        EXPECT_EQ(decode_ipv4(*hex).value_or(""), a);
    }
}

TEST_F(AddressCodecTest, EncodeIpv4MatchesTableForm) {
    EXPECT_EQ(encode_ipv4("127.0.0.1").value_or(""), "0100007F");
    EXPECT_EQ(encode_ipv4("4.3.2.1").value_or(""), "01020304");
    EXPECT_FALSE(encode_ipv4("not-an-ip").has_value());
    EXPECT_FALSE(encode_ipv4("::1").has_value());
}

TEST_F(AddressCodecTest, DecodeIpv6Loopback) {
    auto ip = decode_ipv6("00000000000000000000000000000001");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "::1");
}

TEST_F(AddressCodecTest, DecodeIpv6IsBigEndian) {
    EXPECT_EQ(decode_ipv6("20010DB8000000000000000000000001").value_or(""), "2001:db8::1");
    EXPECT_EQ(decode_ipv6("fe800000000000000000000000000abc").value_or(""), "fe80::abc");
}

TEST_F(AddressCodecTest, DecodeIpv6MappedIpv4) {
    EXPECT_EQ(decode_ipv6("00000000000000000000FFFF01020304").value_or(""), "::ffff:1.2.3.4");
}

TEST_F(AddressCodecTest, DecodeIpv6RejectsWrongLengthOrHex) {
    EXPECT_FALSE(decode_ipv6("").has_value());
    EXPECT_FALSE(decode_ipv6("0100007F").has_value());
    EXPECT_FALSE(decode_ipv6("0000000000000000000000000000001").has_value());
    EXPECT_FALSE(decode_ipv6("000000000000000000000000000000010").has_value());
    EXPECT_FALSE(decode_ipv6("0000000000000000000000000000000Z").has_value());
}

TEST_F(AddressCodecTest, Ipv6RoundTrip) {
    std::vector<std::string> addrs = {"::1", "2001:db8::1", "fe80::1ff:fe23:4567:890a", "2001:db8:85a3::8a2e:370:7334", "::"};
    for (const auto& a : addrs) {
        auto hex = encode_ipv6(a);
        ASSERT_TRUE(hex.has_value()) << a;
        EXPECT_EQ(hex->size(), 32u);
        EXPECT_EQ(decode_ipv6(*hex).value_or(""), a);
    }
    EXPECT_FALSE(encode_ipv6("127.0.0.1").has_value());
}

} // namespace conn_tracker
