// Copyright (c) 2025 The pcapstat Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <optional>
#include <span>

#include <cstddef>
#include <cstdint>

#include "../detail/capture_error.hpp"
#include "../detail/endian.hpp"
#include "../expected.hpp"
#include "frame.hpp"
#include "pcap_common.hpp"

namespace pcapstat::capture {

/**
 * @brief Read frames from an in-memory classic PCAP capture
 *
 * Parses the 24-byte global header once, then walks the 16-byte record headers.
 * Frames are zero-copy views into the capture buffer, which must outlive the
 * reader and every Frame it returns.
 *
 * Supported variants:
 * - Little-endian and big-endian files (resolved from the magic number)
 * - Microsecond and nanosecond timestamp precision
 *
 * Error handling contract:
 * - A record ending exactly at the end of the buffer is followed by EndOfStream
 * - A partial record header or body is FormatError (truncated_record)
 * - incl_len larger than snaplen or orig_len is FormatError (invalid_record)
 * - Once an error has been returned, every further read returns it again
 *
 * Example usage:
 * @code
 * auto reader = PcapReader::open(bytes);
 * if (!reader) {
 *     std::cerr << reader.error().message() << "\n";
 *     return;
 * }
 * while (true) {
 *     auto frame = reader->read_next_frame();
 *     if (!frame) {
 *         break;  // EndOfStream or FormatError
 *     }
 *     process(*frame);
 * }
 * @endcode
 */
class PcapReader {
public:
    /**
     * @brief Validate the global header and position at the first record
     *
     * @param capture Complete capture file contents
     * @return Reader, or FormatError (truncated_header, bad_magic, unsupported_version)
     */
    static expected<PcapReader, FormatError> open(std::span<const uint8_t> capture) noexcept {
        if (capture.size() < PCAP_GLOBAL_HEADER_SIZE) {
            return unexpected(FormatError{FormatError::Kind::truncated_header, 0});
        }

        const uint32_t magic = detail::load_le32(capture.data());
        if (!is_valid_pcap_magic(magic)) {
            return unexpected(FormatError{FormatError::Kind::bad_magic, 0});
        }

        PcapReader reader(capture);
        reader.big_endian_ = is_big_endian_pcap(magic);
        reader.nanosecond_precision_ = capture::is_nanosecond_precision(magic);
        reader.version_major_ = detail::load16(capture.data() + 4, reader.big_endian_);
        reader.version_minor_ = detail::load16(capture.data() + 6, reader.big_endian_);
        reader.snaplen_ = detail::load32(capture.data() + 16, reader.big_endian_);
        // Link type is the low 16 bits; bits 26-31 carry the FCS length flags
        reader.link_type_ = detail::load32(capture.data() + 20, reader.big_endian_) & 0xFFFF;

        if (reader.version_major_ != PCAP_VERSION_MAJOR) {
            return unexpected(FormatError{FormatError::Kind::unsupported_version, 4});
        }
        return reader;
    }

    /**
     * @brief Read next frame
     *
     * @return expected<Frame, ReaderError>:
     *         - Value: Next frame in container order
     *         - unexpected(EndOfStream{}): Clean end of capture
     *         - unexpected(FormatError{...}): Truncated or inconsistent record
     */
    FrameResult read_next_frame() noexcept {
        if (failed_) {
            return unexpected(ReaderError{*failed_});
        }
        if (offset_ == capture_.size()) {
            return unexpected(ReaderError{EndOfStream{}});
        }

        const size_t record_offset = offset_;
        if (capture_.size() - offset_ < PCAP_RECORD_HEADER_SIZE) {
            return fail(FormatError::Kind::truncated_record, record_offset);
        }

        const uint8_t* header = capture_.data() + offset_;
        const uint32_t ts_sec = detail::load32(header, big_endian_);
        const uint32_t ts_frac = detail::load32(header + 4, big_endian_);
        const uint32_t incl_len = detail::load32(header + 8, big_endian_);
        const uint32_t orig_len = detail::load32(header + 12, big_endian_);

        // snaplen 0 is written by some tools to mean "unlimited"
        if ((snaplen_ != 0 && incl_len > snaplen_) || incl_len > orig_len) {
            return fail(FormatError::Kind::invalid_record, record_offset);
        }
        if (capture_.size() - offset_ - PCAP_RECORD_HEADER_SIZE < incl_len) {
            return fail(FormatError::Kind::truncated_record, record_offset);
        }

        Frame frame;
        frame.timestamp = std::chrono::seconds{ts_sec} +
                          (nanosecond_precision_ ? std::chrono::nanoseconds{ts_frac}
                                                 : std::chrono::nanoseconds{
                                                       std::chrono::microseconds{ts_frac}});
        frame.captured_length = incl_len;
        frame.original_length = orig_len;
        frame.link_type = link_type_;
        frame.data = capture_.subspan(offset_ + PCAP_RECORD_HEADER_SIZE, incl_len);

        offset_ += PCAP_RECORD_HEADER_SIZE + incl_len;
        frames_read_++;
        return frame;
    }

    /**
     * @brief Get current read position in bytes
     */
    size_t tell() const noexcept { return offset_; }

    /**
     * @brief Get total capture size in bytes
     */
    size_t size() const noexcept { return capture_.size(); }

    /**
     * @brief Get number of frames read so far
     */
    size_t frames_read() const noexcept { return frames_read_; }

    uint32_t link_type() const noexcept { return link_type_; }
    uint32_t snaplen() const noexcept { return snaplen_; }
    uint16_t version_major() const noexcept { return version_major_; }
    uint16_t version_minor() const noexcept { return version_minor_; }
    bool is_big_endian() const noexcept { return big_endian_; }
    bool is_nanosecond_precision() const noexcept { return nanosecond_precision_; }

private:
    explicit PcapReader(std::span<const uint8_t> capture) noexcept
        : capture_(capture),
          offset_(PCAP_GLOBAL_HEADER_SIZE) {}

    FrameResult fail(FormatError::Kind kind, size_t offset) noexcept {
        failed_ = FormatError{kind, offset};
        return unexpected(ReaderError{*failed_});
    }

    std::span<const uint8_t> capture_; ///< Whole capture, header included
    size_t offset_;                    ///< Start of the next record header
    size_t frames_read_{0};
    uint32_t snaplen_{0};
    uint32_t link_type_{LINKTYPE_ETHERNET};
    uint16_t version_major_{0};
    uint16_t version_minor_{0};
    bool big_endian_{false};           ///< True if file fields are big-endian
    bool nanosecond_precision_{false}; ///< True if ts_frac holds nanoseconds
    std::optional<FormatError> failed_;
};

} // namespace pcapstat::capture
