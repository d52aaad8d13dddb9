#pragma once

#include <span>
#include <utility>
#include <variant>

#include <cstdint>

#include "../detail/capture_error.hpp"
#include "../expected.hpp"
#include "format_detector.hpp"
#include "frame.hpp"
#include "frame_iteration.hpp"
#include "pcap_reader.hpp"
#include "pcapng_reader.hpp"

namespace pcapstat::capture {

/**
 * @brief Format-agnostic frame reader
 *
 * Detects the container format from the first four bytes and dispatches to
 * PcapReader or PcapngReader. The frame sequence is lazy, finite and read
 * front to back exactly once.
 *
 * Example usage:
 * @code
 * auto reader = CaptureReader::open(bytes);
 * if (!reader) {
 *     return reader.error();
 * }
 * for_each_frame(*reader, [](const Frame& frame) {
 *     inspect(frame);
 *     return true;
 * });
 * @endcode
 */
class CaptureReader {
public:
    /**
     * @brief Detect the format and validate the container header
     *
     * @param capture Complete capture file contents (must outlive the reader)
     * @param options Reader behaviour switches (pcapng link type handling)
     * @return Reader, or FormatError from detection or header validation
     */
    static expected<CaptureReader, FormatError> open(std::span<const uint8_t> capture,
                                                     ReaderOptions options = {}) {
        auto format = detect_format(capture);
        if (!format) {
            return unexpected(format.error());
        }

        if (*format == CaptureFormat::next_generation) {
            auto reader = PcapngReader::open(capture, options);
            if (!reader) {
                return unexpected(reader.error());
            }
            return CaptureReader(std::move(*reader));
        }

        auto reader = PcapReader::open(capture);
        if (!reader) {
            return unexpected(reader.error());
        }
        return CaptureReader(std::move(*reader));
    }

    /**
     * @brief Read next frame from the underlying container
     */
    FrameResult read_next_frame() {
        return std::visit([](auto& reader) { return reader.read_next_frame(); }, reader_);
    }

    CaptureFormat format() const noexcept {
        return std::holds_alternative<PcapngReader>(reader_) ? CaptureFormat::next_generation
                                                             : CaptureFormat::classic;
    }

    size_t frames_read() const noexcept {
        return std::visit([](const auto& reader) { return reader.frames_read(); }, reader_);
    }

    size_t tell() const noexcept {
        return std::visit([](const auto& reader) { return reader.tell(); }, reader_);
    }

private:
    explicit CaptureReader(PcapReader reader) : reader_(std::move(reader)) {}
    explicit CaptureReader(PcapngReader reader) : reader_(std::move(reader)) {}

    std::variant<PcapReader, PcapngReader> reader_;
};

static_assert(FrameReader<CaptureReader>);
static_assert(FrameReader<PcapReader>);
static_assert(FrameReader<PcapngReader>);

} // namespace pcapstat::capture
