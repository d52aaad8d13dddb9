#pragma once

#include <concepts>
#include <variant>

#include <cstddef>

#include "../detail/capture_error.hpp"
#include "../expected.hpp"
#include "frame.hpp"

namespace pcapstat::capture {

/**
 * @brief Concept for readers that provide read_next_frame()
 *
 * Any container reader returning expected<Frame, ReaderError> can be shared
 * between analysis workers and used with these iteration helpers.
 */
template <typename T>
concept FrameReader = requires(T& reader) {
    { reader.read_next_frame() } -> std::same_as<FrameResult>;
};

/**
 * @brief Iterate over every frame of a reader
 *
 * Error handling contract:
 * - EndOfStream: Stop iteration, success
 * - FormatError: Stop iteration, returned to the caller
 *
 * @tparam Reader Type satisfying FrameReader concept
 * @tparam Callback Function type with signature: bool(const Frame&)
 * @param reader Reader providing read_next_frame()
 * @param callback Function called for each frame. Return false to stop iteration.
 * @return Number of frames processed, or the FormatError that ended iteration
 */
template <FrameReader Reader, typename Callback>
expected<size_t, FormatError> for_each_frame(Reader& reader, Callback&& callback) {
    size_t count = 0;

    while (true) {
        auto result = reader.read_next_frame();

        if (!result.has_value()) {
            if (is_eof(result.error())) {
                break;
            }
            return unexpected(std::get<FormatError>(result.error()));
        }

        ++count;
        if (!callback(*result)) {
            break; // Callback requested stop
        }
    }

    return count;
}

} // namespace pcapstat::capture
