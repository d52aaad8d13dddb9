#pragma once

#include <algorithm>
#include <span>

#include <cstdint>

#include "../detail/capture_error.hpp"
#include "../expected.hpp"
#include "frame.hpp"
#include "pcap_common.hpp"

namespace pcapstat::capture {

/**
 * @brief Decide which container format a capture buffer holds
 *
 * Reads exactly the first four bytes. The pcapng Section Header Block type
 * (0A 0D 0D 0A) selects the block-structured reader; anything else is handed
 * to the classic reader, which validates its own magic and byte order.
 *
 * @return The detected format, or FormatError (short_input) when fewer than
 *         four bytes are available
 */
inline expected<CaptureFormat, FormatError>
detect_format(std::span<const uint8_t> capture) noexcept {
    if (capture.size() < PCAPNG_MAGIC_BYTES.size()) {
        return unexpected(FormatError{FormatError::Kind::short_input, 0});
    }
    if (std::equal(PCAPNG_MAGIC_BYTES.begin(), PCAPNG_MAGIC_BYTES.end(), capture.begin())) {
        return CaptureFormat::next_generation;
    }
    return CaptureFormat::classic;
}

} // namespace pcapstat::capture
