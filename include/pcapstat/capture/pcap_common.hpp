#pragma once

#include <array>

#include <cstddef>
#include <cstdint>

namespace pcapstat::capture {

// =============================================================================
// Classic PCAP File Format Constants
// =============================================================================

/**
 * @brief PCAP magic numbers for file format identification
 *
 * The magic number indicates both byte order and timestamp precision. Values
 * are as read with a little-endian load of the first four file bytes:
 * - 0xa1b2c3d4: Microsecond precision, little-endian (most common)
 * - 0xd4c3b2a1: Microsecond precision, big-endian
 * - 0xa1b23c4d: Nanosecond precision, little-endian
 * - 0x4d3cb2a1: Nanosecond precision, big-endian
 */
constexpr uint32_t PCAP_MAGIC_MICROSEC_LE = 0xa1b2c3d4;
constexpr uint32_t PCAP_MAGIC_MICROSEC_BE = 0xd4c3b2a1;
constexpr uint32_t PCAP_MAGIC_NANOSEC_LE = 0xa1b23c4d;
constexpr uint32_t PCAP_MAGIC_NANOSEC_BE = 0x4d3cb2a1;

/**
 * @brief PCAP file format version
 *
 * Current stable version is 2.4 (established in 1998)
 */
constexpr uint16_t PCAP_VERSION_MAJOR = 2;
constexpr uint16_t PCAP_VERSION_MINOR = 4;

/**
 * @brief PCAP header sizes (fixed by the format)
 */
constexpr size_t PCAP_GLOBAL_HEADER_SIZE = 24; ///< File header size
constexpr size_t PCAP_RECORD_HEADER_SIZE = 16; ///< Per-packet record header size

constexpr uint32_t DEFAULT_SNAPLEN = 65535; ///< Maximum packet capture length

// =============================================================================
// pcapng Block Constants
// =============================================================================

/**
 * @brief Leading bytes of every pcapng file (Section Header Block type)
 */
constexpr std::array<uint8_t, 4> PCAPNG_MAGIC_BYTES = {0x0A, 0x0D, 0x0D, 0x0A};

constexpr uint32_t PCAPNG_BLOCK_SECTION_HEADER = 0x0A0D0D0A;
constexpr uint32_t PCAPNG_BLOCK_INTERFACE_DESCRIPTION = 0x00000001;
constexpr uint32_t PCAPNG_BLOCK_PACKET = 0x00000002; ///< Obsolete Packet Block
constexpr uint32_t PCAPNG_BLOCK_SIMPLE_PACKET = 0x00000003;
constexpr uint32_t PCAPNG_BLOCK_NAME_RESOLUTION = 0x00000004;
constexpr uint32_t PCAPNG_BLOCK_INTERFACE_STATISTICS = 0x00000005;
constexpr uint32_t PCAPNG_BLOCK_ENHANCED_PACKET = 0x00000006;

constexpr uint32_t PCAPNG_BYTE_ORDER_MAGIC = 0x1A2B3C4D;
constexpr uint16_t PCAPNG_VERSION_MAJOR = 1;
constexpr uint16_t PCAPNG_VERSION_MINOR = 0;

/// Block type + block total length + trailing block total length
constexpr size_t PCAPNG_BLOCK_OVERHEAD = 12;
constexpr size_t PCAPNG_SECTION_HEADER_BODY = 16; ///< BOM, versions, section length

constexpr uint16_t PCAPNG_OPT_END = 0;
constexpr uint16_t PCAPNG_OPT_IF_TSRESOL = 9;

constexpr uint64_t PCAPNG_DEFAULT_TICKS_PER_SECOND = 1'000'000; ///< if_tsresol absent

// =============================================================================
// Link-Layer Types
// =============================================================================

/**
 * @brief PCAP link-layer types (network field / IDB LinkType)
 *
 * See: https://www.tcpdump.org/linktypes.html
 */
constexpr uint32_t LINKTYPE_NULL = 0;           ///< BSD loopback, host-order family
constexpr uint32_t LINKTYPE_ETHERNET = 1;       ///< Ethernet (DIX/802.3)
constexpr uint32_t LINKTYPE_DLT_RAW = 12;       ///< Raw IP (DLT_RAW on most platforms)
constexpr uint32_t LINKTYPE_RAW = 101;          ///< Raw IP (no link layer)
constexpr uint32_t LINKTYPE_LOOP = 108;         ///< OpenBSD loopback, network-order family
constexpr uint32_t LINKTYPE_LINUX_SLL = 113;    ///< Linux cooked capture v1
constexpr uint32_t LINKTYPE_IPV4 = 228;         ///< Raw IPv4
constexpr uint32_t LINKTYPE_IPV6 = 229;         ///< Raw IPv6
constexpr uint32_t LINKTYPE_LINUX_SLL2 = 276;   ///< Linux cooked capture v2

// =============================================================================
// Helper Functions
// =============================================================================

/**
 * @brief Check if magic number is valid PCAP format
 *
 * @param magic The first four file bytes, loaded little-endian
 */
constexpr bool is_valid_pcap_magic(uint32_t magic) noexcept {
    return magic == PCAP_MAGIC_MICROSEC_LE || magic == PCAP_MAGIC_MICROSEC_BE ||
           magic == PCAP_MAGIC_NANOSEC_LE || magic == PCAP_MAGIC_NANOSEC_BE;
}

/**
 * @brief Check if PCAP file uses big-endian byte order
 */
constexpr bool is_big_endian_pcap(uint32_t magic) noexcept {
    return magic == PCAP_MAGIC_MICROSEC_BE || magic == PCAP_MAGIC_NANOSEC_BE;
}

/**
 * @brief Check if PCAP file uses nanosecond precision
 */
constexpr bool is_nanosecond_precision(uint32_t magic) noexcept {
    return magic == PCAP_MAGIC_NANOSEC_LE || magic == PCAP_MAGIC_NANOSEC_BE;
}

} // namespace pcapstat::capture
