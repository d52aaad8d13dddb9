#include <array>
#include <set>
#include <string>

#include <gtest/gtest.h>
#include <pcapstat/ip_address.hpp>

using pcapstat::IpAddress;

TEST(IpAddressTest, ParsesDottedQuad) {
    auto addr = IpAddress::parse("192.168.1.5");
    ASSERT_TRUE(addr.has_value());
    EXPECT_TRUE(addr->is_v4());
    EXPECT_EQ(addr->to_string(), "192.168.1.5");
}

TEST(IpAddressTest, ParsesIPv6) {
    auto addr = IpAddress::parse("2001:db8::1");
    ASSERT_TRUE(addr.has_value());
    EXPECT_FALSE(addr->is_v4());
    EXPECT_EQ(addr->to_string(), "2001:db8::1");
}

TEST(IpAddressTest, CanonicalizesIPv6Text) {
    auto addr = IpAddress::parse("2001:0DB8:0000:0000:0000:0000:0000:0001");
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(addr->to_string(), "2001:db8::1");
}

TEST(IpAddressTest, MappedIPv6EqualsIPv4) {
    auto v4 = IpAddress::parse("10.0.0.1");
    auto mapped = IpAddress::parse("::ffff:10.0.0.1");
    ASSERT_TRUE(v4.has_value());
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(*v4, *mapped);
    EXPECT_TRUE(mapped->is_v4());
    EXPECT_EQ(mapped->to_string(), "10.0.0.1");
}

TEST(IpAddressTest, RejectsNonAddresses) {
    EXPECT_FALSE(IpAddress::parse("not-an-ip").has_value());
    EXPECT_FALSE(IpAddress::parse("").has_value());
    EXPECT_FALSE(IpAddress::parse("256.1.1.1").has_value());
    EXPECT_FALSE(IpAddress::parse("1.2.3").has_value());
    EXPECT_FALSE(IpAddress::parse(" 1.2.3.4").has_value());
    EXPECT_FALSE(IpAddress::parse("10.0.0.0/8").has_value());
    EXPECT_FALSE(IpAddress::parse("2001:db8:::1").has_value());
}

TEST(IpAddressTest, RejectsEmbeddedNul) {
    using namespace std::string_literals;
    const std::string with_nul = "192.168.1.5\0junk"s;
    EXPECT_FALSE(IpAddress::parse(with_nul).has_value());
    EXPECT_FALSE(IpAddress::parse(std::string("::1\0", 4)).has_value());
    EXPECT_TRUE(IpAddress::parse("192.168.1.5").has_value());
}

TEST(IpAddressTest, FromV4Bytes) {
    const std::array<uint8_t, 4> octets = {172, 16, 0, 9};
    auto addr = IpAddress::from_v4(octets);
    EXPECT_TRUE(addr.is_v4());
    EXPECT_EQ(addr.to_string(), "172.16.0.9");
    EXPECT_EQ(addr, *IpAddress::parse("172.16.0.9"));
}

TEST(IpAddressTest, OrderingIsTotal) {
    std::set<IpAddress> addresses;
    addresses.insert(*IpAddress::parse("10.0.0.2"));
    addresses.insert(*IpAddress::parse("10.0.0.1"));
    addresses.insert(*IpAddress::parse("::ffff:10.0.0.1"));
    addresses.insert(*IpAddress::parse("::1"));

    ASSERT_EQ(addresses.size(), 3u);
    EXPECT_EQ(addresses.begin()->to_string(), "::1");
}
