// Copyright (c) 2025 The pcapstat Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <span>
#include <string>
#include <vector>

#include <cstdint>

#include "../detail/endian.hpp"
#include "../io/capture_file.hpp"
#include "pcap_common.hpp"

namespace pcapstat::capture {

/**
 * @brief Settings for a classic PCAP capture
 */
struct PcapWriterOptions {
    uint32_t link_type{LINKTYPE_ETHERNET};
    uint32_t snaplen{DEFAULT_SNAPLEN}; ///< 0 for unlimited
    bool big_endian{false};           ///< Write fields (and magic) big-endian
    bool nanosecond_precision{false}; ///< Use the nanosecond magic and ts field
};

/**
 * @brief Build a classic PCAP capture in memory
 *
 * Writes the global header on construction and one record per write_frame()
 * call. Use cases:
 * - Create test captures with exact timestamps and frame sizes
 * - Generate sample captures from the pcapstat_gen tool
 *
 * Example usage:
 * @code
 * PcapWriter writer;
 * writer.write_frame(std::chrono::seconds{1700000000}, frame_bytes);
 * writer.save("sample.pcap");
 * @endcode
 */
class PcapWriter {
public:
    explicit PcapWriter(PcapWriterOptions options = {}) : options_(options) {
        write_global_header();
    }

    /**
     * @brief Append one record
     *
     * @param timestamp Capture time since the Unix epoch (must fit 32-bit seconds)
     * @param data Link-layer frame bytes (copied)
     * @param original_length On-wire length; 0 means data.size()
     * @return false if the frame exceeds snaplen, the original length is
     *         smaller than the data, or the timestamp is out of range
     */
    bool write_frame(std::chrono::nanoseconds timestamp, std::span<const uint8_t> data,
                     uint32_t original_length = 0) {
        if (original_length == 0) {
            original_length = static_cast<uint32_t>(data.size());
        }
        if ((options_.snaplen != 0 && data.size() > options_.snaplen) ||
            original_length < data.size()) {
            return false;
        }
        const auto seconds = std::chrono::floor<std::chrono::seconds>(timestamp);
        if (seconds.count() < 0 || seconds.count() > UINT32_MAX) {
            return false;
        }
        const auto fraction = timestamp - seconds;
        const auto frac_field =
            options_.nanosecond_precision
                ? fraction.count()
                : std::chrono::duration_cast<std::chrono::microseconds>(fraction).count();

        append32(static_cast<uint32_t>(seconds.count()));
        append32(static_cast<uint32_t>(frac_field));
        append32(static_cast<uint32_t>(data.size()));
        append32(original_length);
        bytes_.insert(bytes_.end(), data.begin(), data.end());

        frames_written_++;
        return true;
    }

    /**
     * @brief Capture bytes written so far (global header included)
     */
    const std::vector<uint8_t>& bytes() const noexcept { return bytes_; }

    size_t frames_written() const noexcept { return frames_written_; }

    const PcapWriterOptions& options() const noexcept { return options_; }

    /**
     * @brief Write the capture to disk
     *
     * @throws std::runtime_error if the file cannot be written
     */
    void save(const std::string& filepath) const { io::write_capture_file(filepath, bytes_); }

private:
    void append16(uint16_t value) { detail::append16(bytes_, value, options_.big_endian); }
    void append32(uint32_t value) { detail::append32(bytes_, value, options_.big_endian); }

    void write_global_header() {
        // The magic is written in file byte order like every other field, so a
        // big-endian file starts a1 b2 c3 d4 on disk
        const uint32_t magic = options_.nanosecond_precision ? PCAP_MAGIC_NANOSEC_LE
                                                             : PCAP_MAGIC_MICROSEC_LE;
        append32(magic);
        append16(PCAP_VERSION_MAJOR);
        append16(PCAP_VERSION_MINOR);
        append32(0); // thiszone
        append32(0); // sigfigs
        append32(options_.snaplen);
        append32(options_.link_type);
    }

    PcapWriterOptions options_;
    std::vector<uint8_t> bytes_;
    size_t frames_written_{0};
};

} // namespace pcapstat::capture
