#pragma once

/**
 * @file endian.hpp
 * @brief Byte order helpers for capture parsing and writing
 *
 * Capture files carry their own byte order (classic pcap via its magic number,
 * pcapng per section via the byte-order magic), while network headers are
 * always big-endian. Loads are assembled byte by byte so they work on
 * unaligned data independent of host endianness.
 */

#include <vector>

#include <cstdint>

namespace pcapstat::detail {

inline uint32_t byteswap32(uint32_t value) noexcept {
    return __builtin_bswap32(value);
}

// =============================================================================
// Loads
// =============================================================================

inline uint16_t load_be16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>((uint16_t{p[0]} << 8) | uint16_t{p[1]});
}

inline uint16_t load_le16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>((uint16_t{p[1]} << 8) | uint16_t{p[0]});
}

inline uint32_t load_be32(const uint8_t* p) noexcept {
    return (uint32_t{p[0]} << 24) | (uint32_t{p[1]} << 16) | (uint32_t{p[2]} << 8) |
           uint32_t{p[3]};
}

inline uint32_t load_le32(const uint8_t* p) noexcept {
    return (uint32_t{p[3]} << 24) | (uint32_t{p[2]} << 16) | (uint32_t{p[1]} << 8) |
           uint32_t{p[0]};
}

/**
 * @brief Load a 16-bit field stored in the given file byte order
 */
inline uint16_t load16(const uint8_t* p, bool big_endian) noexcept {
    return big_endian ? load_be16(p) : load_le16(p);
}

/**
 * @brief Load a 32-bit field stored in the given file byte order
 */
inline uint32_t load32(const uint8_t* p, bool big_endian) noexcept {
    return big_endian ? load_be32(p) : load_le32(p);
}

// =============================================================================
// Stores (append to a growing byte buffer)
// =============================================================================

inline void append16(std::vector<uint8_t>& out, uint16_t value, bool big_endian) {
    if (big_endian) {
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value));
    } else {
        out.push_back(static_cast<uint8_t>(value));
        out.push_back(static_cast<uint8_t>(value >> 8));
    }
}

inline void append32(std::vector<uint8_t>& out, uint32_t value, bool big_endian) {
    if (big_endian) {
        append16(out, static_cast<uint16_t>(value >> 16), true);
        append16(out, static_cast<uint16_t>(value), true);
    } else {
        append16(out, static_cast<uint16_t>(value), false);
        append16(out, static_cast<uint16_t>(value >> 16), false);
    }
}

inline void store_be16(uint8_t* p, uint16_t value) noexcept {
    p[0] = static_cast<uint8_t>(value >> 8);
    p[1] = static_cast<uint8_t>(value);
}

} // namespace pcapstat::detail
