#pragma once

#include <optional>
#include <span>

#include <cstddef>
#include <cstdint>

#include "../capture/frame.hpp"
#include "../capture/pcap_common.hpp"
#include "../detail/endian.hpp"
#include "../ip_address.hpp"

namespace pcapstat {

/**
 * @brief Network-layer endpoints of one frame
 */
struct AddressPair {
    IpAddress source;
    IpAddress destination;

    friend bool operator==(const AddressPair&, const AddressPair&) = default;
};

namespace detail {

// Link-layer header sizes
constexpr size_t ETHERNET_HEADER = 14;
constexpr size_t VLAN_TAG = 4;
constexpr size_t SLL_HEADER = 16;
constexpr size_t SLL2_HEADER = 20;
constexpr size_t LOOPBACK_HEADER = 4;

constexpr size_t IPV4_MIN_HEADER = 20;
constexpr size_t IPV6_HEADER = 40;

constexpr uint16_t ETHERTYPE_IPV4 = 0x0800;
constexpr uint16_t ETHERTYPE_IPV6 = 0x86DD;

/// 802.1Q, 802.1ad and the legacy pre-standard QinQ tag
constexpr bool is_vlan_ethertype(uint16_t ethertype) noexcept {
    return ethertype == 0x8100 || ethertype == 0x88A8 || ethertype == 0x9100;
}

// BSD AF_INET6 differs per platform
constexpr bool is_bsd_inet6_family(uint32_t family) noexcept {
    return family == 10 || family == 24 || family == 28 || family == 30;
}

inline std::optional<AddressPair> decode_ipv4(std::span<const uint8_t> packet) noexcept {
    if (packet.size() < IPV4_MIN_HEADER || (packet[0] >> 4) != 4) {
        return std::nullopt;
    }
    const size_t header_length = static_cast<size_t>(packet[0] & 0x0F) * 4;
    if (header_length < IPV4_MIN_HEADER || header_length > packet.size()) {
        return std::nullopt;
    }
    return AddressPair{IpAddress::from_v4(packet.subspan<12, 4>()),
                       IpAddress::from_v4(packet.subspan<16, 4>())};
}

inline std::optional<AddressPair> decode_ipv6(std::span<const uint8_t> packet) noexcept {
    if (packet.size() < IPV6_HEADER || (packet[0] >> 4) != 6) {
        return std::nullopt;
    }
    return AddressPair{IpAddress::from_v6(packet.subspan<8, 16>()),
                       IpAddress::from_v6(packet.subspan<24, 16>())};
}

/// Raw IP: the version nibble selects the header
inline std::optional<AddressPair> decode_raw_ip(std::span<const uint8_t> packet) noexcept {
    if (packet.empty()) {
        return std::nullopt;
    }
    switch (packet[0] >> 4) {
        case 4:
            return decode_ipv4(packet);
        case 6:
            return decode_ipv6(packet);
        default:
            return std::nullopt;
    }
}

inline std::optional<AddressPair> decode_ethertype(uint16_t ethertype,
                                                   std::span<const uint8_t> payload) noexcept {
    switch (ethertype) {
        case ETHERTYPE_IPV4:
            return decode_ipv4(payload);
        case ETHERTYPE_IPV6:
            return decode_ipv6(payload);
        default:
            return std::nullopt;
    }
}

inline std::optional<AddressPair> decode_ethernet(std::span<const uint8_t> frame) noexcept {
    if (frame.size() < ETHERNET_HEADER) {
        return std::nullopt;
    }
    size_t offset = 12;
    uint16_t ethertype = load_be16(frame.data() + offset);
    while (is_vlan_ethertype(ethertype)) {
        offset += VLAN_TAG;
        if (frame.size() < offset + 2) {
            return std::nullopt;
        }
        ethertype = load_be16(frame.data() + offset);
    }
    return decode_ethertype(ethertype, frame.subspan(offset + 2));
}

inline std::optional<AddressPair> decode_loopback(std::span<const uint8_t> frame,
                                                  bool network_order) noexcept {
    if (frame.size() < LOOPBACK_HEADER) {
        return std::nullopt;
    }
    // LINKTYPE_NULL stores the family in the capturing host's byte order
    uint32_t family = network_order ? load_be32(frame.data()) : load_le32(frame.data());
    if (!network_order && family > 0xFFFF) {
        family = load_be32(frame.data());
    }
    const auto payload = frame.subspan(LOOPBACK_HEADER);
    if (family == 2) {
        return decode_ipv4(payload);
    }
    if (is_bsd_inet6_family(family)) {
        return decode_ipv6(payload);
    }
    return std::nullopt;
}

} // namespace detail

/**
 * @brief Extract the network-layer source and destination of a frame
 *
 * The link-layer header is selected by frame.link_type:
 * - Ethernet, with any number of 802.1Q/802.1ad tags
 * - Linux cooked capture (SLL, SLL2)
 * - BSD loopback (NULL, LOOP)
 * - Raw IP (DLT_RAW, LINKTYPE_RAW, IPV4, IPV6)
 *
 * Addresses are copied out of the frame, so the result outlives the capture
 * buffer. Decoding is pure.
 *
 * @return Address pair, or std::nullopt for non-IP payloads, unknown link
 *         types and truncated headers
 */
[[nodiscard]] inline std::optional<AddressPair> decode_frame(const Frame& frame) noexcept {
    const auto data = frame.data;

    switch (frame.link_type) {
        case capture::LINKTYPE_ETHERNET:
            return detail::decode_ethernet(data);

        case capture::LINKTYPE_LINUX_SLL:
            if (data.size() < detail::SLL_HEADER) {
                return std::nullopt;
            }
            return detail::decode_ethertype(detail::load_be16(data.data() + 14),
                                            data.subspan(detail::SLL_HEADER));

        case capture::LINKTYPE_LINUX_SLL2:
            if (data.size() < detail::SLL2_HEADER) {
                return std::nullopt;
            }
            return detail::decode_ethertype(detail::load_be16(data.data()),
                                            data.subspan(detail::SLL2_HEADER));

        case capture::LINKTYPE_NULL:
            return detail::decode_loopback(data, false);

        case capture::LINKTYPE_LOOP:
            return detail::decode_loopback(data, true);

        case capture::LINKTYPE_DLT_RAW:
        case capture::LINKTYPE_RAW:
            return detail::decode_raw_ip(data);

        case capture::LINKTYPE_IPV4:
            return detail::decode_ipv4(data);

        case capture::LINKTYPE_IPV6:
            return detail::decode_ipv6(data);

        default:
            return std::nullopt;
    }
}

} // namespace pcapstat
