// Copyright (c) 2025 The pcapstat Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <chrono>
#include <limits>
#include <optional>
#include <span>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../detail/capture_error.hpp"
#include "../detail/endian.hpp"
#include "../expected.hpp"
#include "frame.hpp"
#include "pcap_common.hpp"

namespace pcapstat::capture {

/**
 * @brief Read frames from an in-memory pcapng capture
 *
 * Walks the block sequence of one or more sections. Each Section Header Block
 * sets the byte order for the blocks that follow it and resets the interface
 * table. Frames are produced for Enhanced Packet, Simple Packet and obsolete
 * Packet Blocks; every other block type is length-checked and skipped.
 *
 * Link type: unless ReaderOptions::honor_interface_link_type is set, every
 * frame is tagged as Ethernet regardless of what its Interface Description
 * Block declares.
 *
 * Simple Packet Blocks carry no timestamp; they inherit the timestamp of the
 * previous packet in the section (zero if there is none).
 *
 * Error handling contract:
 * - The buffer ending exactly on a block boundary is EndOfStream
 * - A block extending past the buffer is FormatError (truncated_record)
 * - Bad block lengths, mismatched trailing length, undeclared interface ids
 *   and packet data overrunning the block are FormatError (malformed_block)
 * - Once an error has been returned, every further read returns it again
 */
class PcapngReader {
public:
    /**
     * @brief Validate the leading Section Header Block
     *
     * @param capture Complete capture file contents
     * @param options Reader behaviour switches
     * @return Reader positioned after the first SHB, or FormatError
     */
    static expected<PcapngReader, FormatError> open(std::span<const uint8_t> capture,
                                                    ReaderOptions options = {}) {
        PcapngReader reader(capture, options);
        if (capture.size() < PCAPNG_BLOCK_OVERHEAD + PCAPNG_SECTION_HEADER_BODY) {
            return unexpected(FormatError{FormatError::Kind::truncated_header, 0});
        }
        if (detail::load_be32(capture.data()) != PCAPNG_BLOCK_SECTION_HEADER) {
            return unexpected(FormatError{FormatError::Kind::bad_magic, 0});
        }
        auto first = reader.read_block();
        if (!first) {
            return unexpected(first.error());
        }
        return reader;
    }

    /**
     * @brief Read next frame
     *
     * @return expected<Frame, ReaderError>:
     *         - Value: Next packet in block order
     *         - unexpected(EndOfStream{}): Clean end of capture
     *         - unexpected(FormatError{...}): Truncated or inconsistent block
     */
    FrameResult read_next_frame() {
        while (true) {
            if (failed_) {
                return unexpected(ReaderError{*failed_});
            }
            if (offset_ == capture_.size()) {
                return unexpected(ReaderError{EndOfStream{}});
            }
            auto block = read_block();
            if (!block) {
                return unexpected(ReaderError{block.error()});
            }
            if (block->has_value()) {
                frames_read_++;
                return **block;
            }
        }
    }

    size_t tell() const noexcept { return offset_; }
    size_t size() const noexcept { return capture_.size(); }
    size_t frames_read() const noexcept { return frames_read_; }

    /**
     * @brief Number of interfaces declared in the current section
     */
    size_t interface_count() const noexcept { return interfaces_.size(); }

    /**
     * @brief Byte order of the current section
     */
    bool is_big_endian() const noexcept { return big_endian_; }

    /**
     * @brief Link type declared by an interface of the current section
     */
    std::optional<uint32_t> interface_link_type(size_t id) const noexcept {
        if (id >= interfaces_.size()) {
            return std::nullopt;
        }
        return interfaces_[id].link_type;
    }

private:
    struct InterfaceInfo {
        uint32_t link_type;
        uint32_t snaplen;
        uint64_t ticks_per_second;
    };

    /// A block yields either a frame or nothing (non-packet block)
    using BlockResult = expected<std::optional<Frame>, FormatError>;

    PcapngReader(std::span<const uint8_t> capture, ReaderOptions options) noexcept
        : capture_(capture),
          options_(options) {}

    BlockResult fail(FormatError::Kind kind, size_t offset) {
        failed_ = FormatError{kind, offset};
        return unexpected(*failed_);
    }

    uint32_t load32(const uint8_t* p) const noexcept { return detail::load32(p, big_endian_); }
    uint16_t load16(const uint8_t* p) const noexcept { return detail::load16(p, big_endian_); }

    /**
     * @brief Consume one block at offset_
     */
    BlockResult read_block() {
        const size_t block_offset = offset_;
        const size_t remaining = capture_.size() - offset_;
        if (remaining < 8) {
            return fail(FormatError::Kind::truncated_record, block_offset);
        }

        const uint8_t* start = capture_.data() + offset_;
        // The SHB type is a byte-order palindrome, so it reads the same either way
        const uint32_t type = load32(start);

        // A new section may switch byte order, so resolve it before the length
        if (type == PCAPNG_BLOCK_SECTION_HEADER) {
            if (remaining < 12) {
                return fail(FormatError::Kind::truncated_record, block_offset);
            }
            const uint32_t bom = detail::load_le32(start + 8);
            if (bom == PCAPNG_BYTE_ORDER_MAGIC) {
                big_endian_ = false;
            } else if (bom == detail::byteswap32(PCAPNG_BYTE_ORDER_MAGIC)) {
                big_endian_ = true;
            } else {
                return fail(FormatError::Kind::bad_magic, block_offset + 8);
            }
        }

        const uint32_t total_length = load32(start + 4);
        if (total_length < PCAPNG_BLOCK_OVERHEAD || total_length % 4 != 0) {
            return fail(FormatError::Kind::malformed_block, block_offset);
        }
        if (remaining < total_length) {
            return fail(FormatError::Kind::truncated_record, block_offset);
        }
        if (load32(start + total_length - 4) != total_length) {
            return fail(FormatError::Kind::malformed_block, block_offset);
        }

        auto body = capture_.subspan(offset_ + 8, total_length - PCAPNG_BLOCK_OVERHEAD);
        offset_ += total_length;

        switch (type) {
            case PCAPNG_BLOCK_SECTION_HEADER:
                return read_section_header(body, block_offset);
            case PCAPNG_BLOCK_INTERFACE_DESCRIPTION:
                return read_interface_description(body, block_offset);
            case PCAPNG_BLOCK_ENHANCED_PACKET:
                return read_enhanced_packet(body, block_offset);
            case PCAPNG_BLOCK_SIMPLE_PACKET:
                return read_simple_packet(body, block_offset);
            case PCAPNG_BLOCK_PACKET:
                return read_obsolete_packet(body, block_offset);
            default:
                return std::optional<Frame>{};
        }
    }

    BlockResult read_section_header(std::span<const uint8_t> body, size_t block_offset) {
        if (body.size() < PCAPNG_SECTION_HEADER_BODY) {
            return fail(FormatError::Kind::malformed_block, block_offset);
        }
        if (load16(body.data() + 4) != PCAPNG_VERSION_MAJOR) {
            return fail(FormatError::Kind::unsupported_version, block_offset + 12);
        }
        interfaces_.clear();
        last_timestamp_ = {};
        return std::optional<Frame>{};
    }

    BlockResult read_interface_description(std::span<const uint8_t> body, size_t block_offset) {
        if (body.size() < 8) {
            return fail(FormatError::Kind::malformed_block, block_offset);
        }
        InterfaceInfo info{load16(body.data()), load32(body.data() + 4),
                           PCAPNG_DEFAULT_TICKS_PER_SECOND};

        // Options: code(2) length(2) value padded to 4 bytes, until opt_endofopt
        size_t pos = 8;
        while (pos + 4 <= body.size()) {
            const uint16_t code = load16(body.data() + pos);
            const uint16_t length = load16(body.data() + pos + 2);
            pos += 4;
            if (code == PCAPNG_OPT_END) {
                break;
            }
            if (pos + length > body.size()) {
                return fail(FormatError::Kind::malformed_block, block_offset);
            }
            if (code == PCAPNG_OPT_IF_TSRESOL && length >= 1) {
                auto ticks = ticks_per_second(body[pos]);
                if (!ticks) {
                    return fail(FormatError::Kind::malformed_block, block_offset);
                }
                info.ticks_per_second = *ticks;
            }
            pos += (static_cast<size_t>(length) + 3) & ~size_t{3};
        }

        interfaces_.push_back(info);
        return std::optional<Frame>{};
    }

    BlockResult read_enhanced_packet(std::span<const uint8_t> body, size_t block_offset) {
        if (body.size() < 20) {
            return fail(FormatError::Kind::malformed_block, block_offset);
        }
        const uint32_t interface_id = load32(body.data());
        const uint64_t ticks =
            (uint64_t{load32(body.data() + 4)} << 32) | uint64_t{load32(body.data() + 8)};
        const uint32_t captured = load32(body.data() + 12);
        const uint32_t original = load32(body.data() + 16);

        if (interface_id >= interfaces_.size() || body.size() - 20 < captured) {
            return fail(FormatError::Kind::malformed_block, block_offset);
        }
        const auto& iface = interfaces_[interface_id];
        const auto timestamp = to_timestamp(ticks, iface.ticks_per_second);
        if (!timestamp) {
            return fail(FormatError::Kind::malformed_block, block_offset);
        }
        last_timestamp_ = *timestamp;
        return make_frame(iface, body.subspan(20, captured), original);
    }

    BlockResult read_simple_packet(std::span<const uint8_t> body, size_t block_offset) {
        if (body.size() < 4 || interfaces_.empty()) {
            return fail(FormatError::Kind::malformed_block, block_offset);
        }
        const auto& iface = interfaces_.front();
        const uint32_t original = load32(body.data());
        size_t captured = std::min<size_t>(original, body.size() - 4);
        if (iface.snaplen != 0) {
            captured = std::min<size_t>(captured, iface.snaplen);
        }
        return make_frame(iface, body.subspan(4, captured), original);
    }

    BlockResult read_obsolete_packet(std::span<const uint8_t> body, size_t block_offset) {
        if (body.size() < 20) {
            return fail(FormatError::Kind::malformed_block, block_offset);
        }
        const uint16_t interface_id = load16(body.data());
        const uint64_t ticks =
            (uint64_t{load32(body.data() + 4)} << 32) | uint64_t{load32(body.data() + 8)};
        const uint32_t captured = load32(body.data() + 12);
        const uint32_t original = load32(body.data() + 16);

        if (interface_id >= interfaces_.size() || body.size() - 20 < captured) {
            return fail(FormatError::Kind::malformed_block, block_offset);
        }
        const auto& iface = interfaces_[interface_id];
        const auto timestamp = to_timestamp(ticks, iface.ticks_per_second);
        if (!timestamp) {
            return fail(FormatError::Kind::malformed_block, block_offset);
        }
        last_timestamp_ = *timestamp;
        return make_frame(iface, body.subspan(20, captured), original);
    }

    std::optional<Frame> make_frame(const InterfaceInfo& iface, std::span<const uint8_t> data,
                                    uint32_t original) const noexcept {
        Frame frame;
        frame.timestamp = last_timestamp_;
        frame.captured_length = static_cast<uint32_t>(data.size());
        frame.original_length = original;
        frame.link_type = options_.honor_interface_link_type ? iface.link_type : LINKTYPE_ETHERNET;
        frame.data = data;
        return frame;
    }

    /**
     * @brief Decode if_tsresol: 10^-n, or 2^-n when the high bit is set
     */
    static std::optional<uint64_t> ticks_per_second(uint8_t tsresol) noexcept {
        const uint8_t exponent = tsresol & 0x7F;
        if (tsresol & 0x80) {
            if (exponent > 63) {
                return std::nullopt;
            }
            return uint64_t{1} << exponent;
        }
        if (exponent > 19) {
            return std::nullopt;
        }
        uint64_t ticks = 1;
        for (uint8_t i = 0; i < exponent; ++i) {
            ticks *= 10;
        }
        return ticks;
    }

    /**
     * @brief Convert interface ticks to nanoseconds since the Unix epoch
     *
     * @return std::nullopt when the time is not representable in 64-bit nanoseconds
     */
    static std::optional<std::chrono::nanoseconds> to_timestamp(uint64_t ticks,
                                                                uint64_t per_second) noexcept {
        constexpr uint64_t nanos_per_second = 1'000'000'000;
        constexpr uint64_t max_seconds =
            static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) / nanos_per_second;
        const uint64_t seconds = ticks / per_second;
        const uint64_t remainder = ticks % per_second;
        if (seconds >= max_seconds) {
            return std::nullopt;
        }
        uint64_t nanos = 0;
        if (per_second <= nanos_per_second && nanos_per_second % per_second == 0) {
            nanos = remainder * (nanos_per_second / per_second);
        } else {
            // Binary resolutions and sub-nanosecond decimal resolutions
            nanos = static_cast<uint64_t>(static_cast<long double>(remainder) *
                                          nanos_per_second / per_second);
        }
        return std::chrono::seconds{static_cast<int64_t>(seconds)} +
               std::chrono::nanoseconds{static_cast<int64_t>(nanos)};
    }

    std::span<const uint8_t> capture_;
    ReaderOptions options_;
    size_t offset_{0};
    size_t frames_read_{0};
    bool big_endian_{false}; ///< Byte order of the current section
    std::vector<InterfaceInfo> interfaces_;
    std::chrono::nanoseconds last_timestamp_{};
    std::optional<FormatError> failed_;
};

} // namespace pcapstat::capture
