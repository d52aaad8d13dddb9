#pragma once

#include <algorithm>
#include <array>
#include <span>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../detail/endian.hpp"
#include "../ip_address.hpp"

namespace pcapstat::capture {

// =============================================================================
// Network Header Layout (for synthetic frames)
// =============================================================================

constexpr size_t ETHERNET_HEADER_SIZE = 14;
constexpr size_t VLAN_TAG_SIZE = 4;
constexpr size_t IPV4_HEADER_SIZE = 20;
constexpr size_t IPV6_HEADER_SIZE = 40;
constexpr size_t UDP_HEADER_SIZE = 8;
constexpr size_t ARP_PAYLOAD_SIZE = 28;

constexpr uint16_t ETHERTYPE_IPV4 = 0x0800;
constexpr uint16_t ETHERTYPE_ARP = 0x0806;
constexpr uint16_t ETHERTYPE_VLAN = 0x8100;
constexpr uint16_t ETHERTYPE_QINQ = 0x88A8;
constexpr uint16_t ETHERTYPE_IPV6 = 0x86DD;

constexpr uint8_t IP_PROTOCOL_UDP = 17;
constexpr uint8_t IP_DEFAULT_TTL = 64;

/// Ethernet + IPv4 + UDP, the smallest frame build_ethernet_ipv4() emits
constexpr size_t UDP_V4_FRAME_MIN = ETHERNET_HEADER_SIZE + IPV4_HEADER_SIZE + UDP_HEADER_SIZE;
static_assert(UDP_V4_FRAME_MIN == 42, "Ethernet/IPv4/UDP headers must be 42 bytes");

/// Ethernet + IPv6 + UDP, the smallest frame build_ethernet_ipv6() emits
constexpr size_t UDP_V6_FRAME_MIN = ETHERNET_HEADER_SIZE + IPV6_HEADER_SIZE + UDP_HEADER_SIZE;
static_assert(UDP_V6_FRAME_MIN == 62, "Ethernet/IPv6/UDP headers must be 62 bytes");

constexpr uint16_t DEFAULT_SOURCE_PORT = 40000;
constexpr uint16_t DEFAULT_DESTINATION_PORT = 4991;

/**
 * @brief Calculate IPv4 header checksum
 *
 * @param header The 20-byte header with its checksum field zeroed
 * @return Checksum value (host order, store big-endian)
 */
inline uint16_t calculate_ip_checksum(std::span<const uint8_t, IPV4_HEADER_SIZE> header) noexcept {
    uint32_t sum = 0;
    for (size_t i = 0; i < header.size(); i += 2) {
        sum += detail::load_be16(header.data() + i);
    }

    // Fold 32-bit sum to 16 bits
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum);
}

} // namespace pcapstat::capture

namespace pcapstat::detail {

inline void append_be16(std::vector<uint8_t>& out, uint16_t value) {
    append16(out, value, true);
}

inline void append_be32(std::vector<uint8_t>& out, uint32_t value) {
    append32(out, value, true);
}

inline void append_ethernet(std::vector<uint8_t>& out, uint16_t ethertype,
                            std::span<const uint16_t> vlan_ids) {
    static constexpr std::array<uint8_t, 6> dst_mac = {0x00, 0x00, 0x00, 0x00, 0x00, 0x02};
    static constexpr std::array<uint8_t, 6> src_mac = {0x00, 0x00, 0x00, 0x00, 0x00, 0x01};
    out.insert(out.end(), dst_mac.begin(), dst_mac.end());
    out.insert(out.end(), src_mac.begin(), src_mac.end());

    // Outer tag is 802.1ad when stacked, 802.1Q otherwise
    for (size_t i = 0; i < vlan_ids.size(); ++i) {
        const bool outer_of_stack = vlan_ids.size() > 1 && i == 0;
        append_be16(out, outer_of_stack ? capture::ETHERTYPE_QINQ : capture::ETHERTYPE_VLAN);
        append_be16(out, static_cast<uint16_t>(vlan_ids[i] & 0x0FFF));
    }
    append_be16(out, ethertype);
}

inline void append_ipv4_udp(std::vector<uint8_t>& out, const IpAddress& source,
                            const IpAddress& destination, size_t payload_size) {
    const size_t udp_length = capture::UDP_HEADER_SIZE + payload_size;
    const size_t ip_total_length = capture::IPV4_HEADER_SIZE + udp_length;

    const size_t ip_start = out.size();
    out.push_back(0x45); // IPv4, 5 words (20 bytes)
    out.push_back(0);    // DSCP/ECN
    append_be16(out, static_cast<uint16_t>(ip_total_length));
    append_be16(out, 0);      // identification
    append_be16(out, 0x4000); // Don't fragment
    out.push_back(capture::IP_DEFAULT_TTL);
    out.push_back(capture::IP_PROTOCOL_UDP);
    append_be16(out, 0); // Checksum, calculated below
    out.insert(out.end(), source.bytes().begin() + 12, source.bytes().end());
    out.insert(out.end(), destination.bytes().begin() + 12, destination.bytes().end());

    const std::span<const uint8_t, capture::IPV4_HEADER_SIZE> header(
        out.data() + ip_start, capture::IPV4_HEADER_SIZE);
    store_be16(out.data() + ip_start + 10, capture::calculate_ip_checksum(header));

    append_be16(out, capture::DEFAULT_SOURCE_PORT);
    append_be16(out, capture::DEFAULT_DESTINATION_PORT);
    append_be16(out, static_cast<uint16_t>(udp_length));
    append_be16(out, 0); // UDP checksum optional for IPv4
    out.insert(out.end(), payload_size, 0);
}

} // namespace pcapstat::detail

namespace pcapstat::capture {

/**
 * @brief Build an Ethernet/IPv4/UDP frame
 *
 * @param source IPv4 source address (IPv4-mapped form is used as is)
 * @param destination IPv4 destination address
 * @param frame_size Total frame size; padded with a zero UDP payload, never
 *                   smaller than UDP_V4_FRAME_MIN
 * @param vlan_ids Optional VLAN tags, outermost first
 */
inline std::vector<uint8_t> build_ethernet_ipv4(const IpAddress& source,
                                                const IpAddress& destination,
                                                size_t frame_size = UDP_V4_FRAME_MIN,
                                                std::span<const uint16_t> vlan_ids = {}) {
    const size_t l2_size = ETHERNET_HEADER_SIZE + VLAN_TAG_SIZE * vlan_ids.size();
    const size_t minimum = l2_size + IPV4_HEADER_SIZE + UDP_HEADER_SIZE;

    std::vector<uint8_t> frame;
    frame.reserve(std::max(frame_size, minimum));
    detail::append_ethernet(frame, ETHERTYPE_IPV4, vlan_ids);
    detail::append_ipv4_udp(frame, source, destination,
                            frame_size > minimum ? frame_size - minimum : 0);
    return frame;
}

/**
 * @brief Build an Ethernet/IPv6/UDP frame (UDP checksum left zero)
 */
inline std::vector<uint8_t> build_ethernet_ipv6(const IpAddress& source,
                                                const IpAddress& destination,
                                                size_t frame_size = UDP_V6_FRAME_MIN) {
    const size_t payload_size = frame_size > UDP_V6_FRAME_MIN ? frame_size - UDP_V6_FRAME_MIN : 0;
    const size_t udp_length = UDP_HEADER_SIZE + payload_size;

    std::vector<uint8_t> frame;
    frame.reserve(UDP_V6_FRAME_MIN + payload_size);
    detail::append_ethernet(frame, ETHERTYPE_IPV6, {});

    detail::append_be32(frame, 0x60000000); // version 6, no traffic class or flow label
    detail::append_be16(frame, static_cast<uint16_t>(udp_length));
    frame.push_back(IP_PROTOCOL_UDP);
    frame.push_back(IP_DEFAULT_TTL);
    frame.insert(frame.end(), source.bytes().begin(), source.bytes().end());
    frame.insert(frame.end(), destination.bytes().begin(), destination.bytes().end());

    detail::append_be16(frame, DEFAULT_SOURCE_PORT);
    detail::append_be16(frame, DEFAULT_DESTINATION_PORT);
    detail::append_be16(frame, static_cast<uint16_t>(udp_length));
    detail::append_be16(frame, 0);
    frame.insert(frame.end(), payload_size, 0);
    return frame;
}

/**
 * @brief Build an Ethernet ARP request (who-has target, tell sender)
 */
inline std::vector<uint8_t> build_ethernet_arp(const IpAddress& sender, const IpAddress& target) {
    std::vector<uint8_t> frame;
    frame.reserve(ETHERNET_HEADER_SIZE + ARP_PAYLOAD_SIZE);
    detail::append_ethernet(frame, ETHERTYPE_ARP, {});

    detail::append_be16(frame, 1); // hardware type: Ethernet
    detail::append_be16(frame, ETHERTYPE_IPV4);
    frame.push_back(6); // hardware address length
    frame.push_back(4); // protocol address length
    detail::append_be16(frame, 1); // request
    frame.insert(frame.end(), {0x00, 0x00, 0x00, 0x00, 0x00, 0x01});
    frame.insert(frame.end(), sender.bytes().begin() + 12, sender.bytes().end());
    frame.insert(frame.end(), 6, 0);
    frame.insert(frame.end(), target.bytes().begin() + 12, target.bytes().end());
    return frame;
}

/**
 * @brief Build a bare IPv4/UDP packet for raw-IP link types
 */
inline std::vector<uint8_t> build_raw_ipv4(const IpAddress& source, const IpAddress& destination,
                                           size_t packet_size = IPV4_HEADER_SIZE +
                                                                UDP_HEADER_SIZE) {
    constexpr size_t minimum = IPV4_HEADER_SIZE + UDP_HEADER_SIZE;
    std::vector<uint8_t> packet;
    packet.reserve(std::max(packet_size, minimum));
    detail::append_ipv4_udp(packet, source, destination,
                            packet_size > minimum ? packet_size - minimum : 0);
    return packet;
}

} // namespace pcapstat::capture
