#pragma once

#include <chrono>
#include <span>

#include <cstdint>

#include "../expected.hpp"
#include "../detail/capture_error.hpp"
#include "pcap_common.hpp"

namespace pcapstat {

/**
 * @brief One link-layer unit demultiplexed from a capture container
 *
 * The data span points into the caller's capture buffer; a Frame is only
 * valid while that buffer is alive.
 */
struct Frame {
    std::chrono::nanoseconds timestamp{}; ///< Capture time since the Unix epoch
    uint32_t captured_length{0};          ///< Bytes present in the capture
    uint32_t original_length{0};          ///< Bytes on the wire
    uint32_t link_type{capture::LINKTYPE_ETHERNET};
    std::span<const uint8_t> data{}; ///< captured_length bytes of link-layer data
};

/**
 * @brief The two supported container formats
 */
enum class CaptureFormat : uint8_t {
    classic,        ///< libpcap: fixed file header + fixed record headers
    next_generation ///< pcapng: self-describing blocks
};

[[nodiscard]] constexpr const char* format_name(CaptureFormat format) noexcept {
    return format == CaptureFormat::next_generation ? "pcapng" : "pcap";
}

/**
 * @brief Reader behaviour switches
 */
struct ReaderOptions {
    /// pcapng only: decode with the link type of each Interface Description
    /// Block instead of assuming Ethernet for every interface.
    bool honor_interface_link_type{false};
};

/// Result type for frame reads
using FrameResult = expected<Frame, ReaderError>;

} // namespace pcapstat
