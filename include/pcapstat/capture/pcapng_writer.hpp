// Copyright (c) 2025 The pcapstat Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <cstdint>

#include "../detail/endian.hpp"
#include "../io/capture_file.hpp"
#include "pcap_common.hpp"

namespace pcapstat::capture {

/**
 * @brief Build a pcapng capture in memory
 *
 * Writes a Section Header Block on construction. Interfaces must be declared
 * with add_interface() before packets referencing them are written.
 *
 * Example usage:
 * @code
 * PcapngWriter writer;
 * auto eth = writer.add_interface(LINKTYPE_ETHERNET);
 * writer.write_enhanced_packet(eth, std::chrono::seconds{1700000000}, frame_bytes);
 * writer.save("sample.pcapng");
 * @endcode
 */
class PcapngWriter {
public:
    explicit PcapngWriter(bool big_endian = false) : big_endian_(big_endian) { begin_section(); }

    /**
     * @brief Start a new section (new SHB); previously declared interfaces are dropped
     */
    void begin_section() {
        std::vector<uint8_t> body;
        detail::append32(body, PCAPNG_BYTE_ORDER_MAGIC, big_endian_);
        detail::append16(body, PCAPNG_VERSION_MAJOR, big_endian_);
        detail::append16(body, PCAPNG_VERSION_MINOR, big_endian_);
        // Section length unknown (-1)
        detail::append32(body, 0xFFFFFFFF, big_endian_);
        detail::append32(body, 0xFFFFFFFF, big_endian_);
        write_block(PCAPNG_BLOCK_SECTION_HEADER, body);
        ticks_per_second_.clear();
    }

    /**
     * @brief Declare an interface (Interface Description Block)
     *
     * @param link_type LINKTYPE_* value recorded in the block
     * @param snaplen Maximum captured length, 0 for unlimited
     * @param tsresol if_tsresol option value; absent means microseconds
     * @return Interface id for write_enhanced_packet()
     */
    uint32_t add_interface(uint32_t link_type = LINKTYPE_ETHERNET, uint32_t snaplen = 0,
                           std::optional<uint8_t> tsresol = std::nullopt) {
        std::vector<uint8_t> body;
        detail::append16(body, static_cast<uint16_t>(link_type), big_endian_);
        detail::append16(body, 0, big_endian_);
        detail::append32(body, snaplen, big_endian_);

        uint64_t ticks = PCAPNG_DEFAULT_TICKS_PER_SECOND;
        if (tsresol) {
            detail::append16(body, PCAPNG_OPT_IF_TSRESOL, big_endian_);
            detail::append16(body, 1, big_endian_);
            body.push_back(*tsresol);
            body.insert(body.end(), 3, 0); // pad to 32 bits
            detail::append16(body, PCAPNG_OPT_END, big_endian_);
            detail::append16(body, 0, big_endian_);
            ticks = resolution_ticks(*tsresol);
        }

        write_block(PCAPNG_BLOCK_INTERFACE_DESCRIPTION, body);
        ticks_per_second_.push_back(ticks);
        return static_cast<uint32_t>(ticks_per_second_.size() - 1);
    }

    /**
     * @brief Append an Enhanced Packet Block
     *
     * @param interface_id Id returned by add_interface()
     * @param timestamp Capture time since the Unix epoch
     * @param data Link-layer frame bytes (copied)
     * @param original_length On-wire length; 0 means data.size()
     * @return false if the interface is undeclared or the timestamp is negative
     */
    bool write_enhanced_packet(uint32_t interface_id, std::chrono::nanoseconds timestamp,
                               std::span<const uint8_t> data, uint32_t original_length = 0) {
        if (interface_id >= ticks_per_second_.size() || timestamp.count() < 0) {
            return false;
        }
        if (original_length == 0) {
            original_length = static_cast<uint32_t>(data.size());
        }
        const uint64_t ticks = to_ticks(timestamp, ticks_per_second_[interface_id]);

        std::vector<uint8_t> body;
        detail::append32(body, interface_id, big_endian_);
        detail::append32(body, static_cast<uint32_t>(ticks >> 32), big_endian_);
        detail::append32(body, static_cast<uint32_t>(ticks), big_endian_);
        detail::append32(body, static_cast<uint32_t>(data.size()), big_endian_);
        detail::append32(body, original_length, big_endian_);
        body.insert(body.end(), data.begin(), data.end());
        write_block(PCAPNG_BLOCK_ENHANCED_PACKET, body);

        frames_written_++;
        return true;
    }

    /**
     * @brief Append a Simple Packet Block (interface 0, no timestamp)
     */
    bool write_simple_packet(std::span<const uint8_t> data, uint32_t original_length = 0) {
        if (ticks_per_second_.empty()) {
            return false;
        }
        if (original_length == 0) {
            original_length = static_cast<uint32_t>(data.size());
        }
        std::vector<uint8_t> body;
        detail::append32(body, original_length, big_endian_);
        body.insert(body.end(), data.begin(), data.end());
        write_block(PCAPNG_BLOCK_SIMPLE_PACKET, body);

        frames_written_++;
        return true;
    }

    /**
     * @brief Append an arbitrary block; the body is zero-padded to 32 bits
     */
    void write_block(uint32_t type, std::span<const uint8_t> body) {
        const size_t padded = (body.size() + 3) & ~size_t{3};
        const auto total_length = static_cast<uint32_t>(padded + PCAPNG_BLOCK_OVERHEAD);

        detail::append32(bytes_, type, big_endian_);
        detail::append32(bytes_, total_length, big_endian_);
        bytes_.insert(bytes_.end(), body.begin(), body.end());
        bytes_.insert(bytes_.end(), padded - body.size(), 0);
        detail::append32(bytes_, total_length, big_endian_);
    }

    const std::vector<uint8_t>& bytes() const noexcept { return bytes_; }

    size_t frames_written() const noexcept { return frames_written_; }

    size_t interface_count() const noexcept { return ticks_per_second_.size(); }

    /**
     * @brief Write the capture to disk
     *
     * @throws std::runtime_error if the file cannot be written
     */
    void save(const std::string& filepath) const { io::write_capture_file(filepath, bytes_); }

private:
    static uint64_t resolution_ticks(uint8_t tsresol) noexcept {
        const uint8_t exponent = tsresol & 0x7F;
        if (tsresol & 0x80) {
            return uint64_t{1} << (exponent & 0x3F);
        }
        uint64_t ticks = 1;
        for (uint8_t i = 0; i < exponent && i < 19; ++i) {
            ticks *= 10;
        }
        return ticks;
    }

    static uint64_t to_ticks(std::chrono::nanoseconds timestamp, uint64_t per_second) noexcept {
        constexpr uint64_t nanos_per_second = 1'000'000'000;
        const auto nanos = static_cast<uint64_t>(timestamp.count());
        const uint64_t seconds = nanos / nanos_per_second;
        const uint64_t remainder = nanos % nanos_per_second;
        if (per_second <= nanos_per_second && nanos_per_second % per_second == 0) {
            return seconds * per_second + remainder / (nanos_per_second / per_second);
        }
        return seconds * per_second +
               static_cast<uint64_t>(static_cast<long double>(remainder) * per_second /
                                     nanos_per_second);
    }

    bool big_endian_;
    std::vector<uint8_t> bytes_;
    std::vector<uint64_t> ticks_per_second_; ///< Per declared interface
    size_t frames_written_{0};
};

} // namespace pcapstat::capture
