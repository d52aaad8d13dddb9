#pragma once

#include <mutex>
#include <optional>
#include <utility>
#include <variant>

#include <cstddef>

#include "../capture/frame.hpp"
#include "../capture/frame_iteration.hpp"
#include "../detail/capture_error.hpp"

namespace pcapstat {

/**
 * @brief Depletable frame sequence shared by analysis workers
 *
 * Wraps a container reader behind a mutex so several workers can pull frames
 * until the reader is exhausted. The first FormatError closes the source; it
 * is kept for the caller and every later next() returns std::nullopt.
 *
 * @tparam Reader Type satisfying capture::FrameReader
 */
template <capture::FrameReader Reader>
class SharedFrameSource {
public:
    explicit SharedFrameSource(Reader reader) : reader_(std::move(reader)) {}

    SharedFrameSource(const SharedFrameSource&) = delete;
    SharedFrameSource& operator=(const SharedFrameSource&) = delete;

    /**
     * @brief Pull the next frame
     *
     * @return Frame, or std::nullopt once the source is exhausted or closed
     */
    std::optional<Frame> next() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return std::nullopt;
        }

        auto result = reader_.read_next_frame();
        if (!result.has_value()) {
            closed_ = true;
            if (const auto* error = std::get_if<FormatError>(&result.error())) {
                error_ = *error;
            }
            return std::nullopt;
        }

        delivered_++;
        return *result;
    }

    /**
     * @brief Stop handing out frames
     */
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    /**
     * @brief The FormatError that ended the sequence, if any
     */
    std::optional<FormatError> error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    size_t frames_delivered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_;
    }

private:
    mutable std::mutex mutex_;
    Reader reader_;
    bool closed_{false};
    std::optional<FormatError> error_;
    size_t delivered_{0};
};

} // namespace pcapstat
