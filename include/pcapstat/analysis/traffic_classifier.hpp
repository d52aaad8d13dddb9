#pragma once

#include <chrono>

#include <cstdint>

#include "../capture/frame.hpp"
#include "../decode/frame_decoder.hpp"
#include "../ip_address.hpp"
#include "traffic_stats.hpp"

namespace pcapstat {

/**
 * @brief How a frame relates to the target address
 */
enum class Direction : uint8_t {
    sent,           ///< Target is the source
    received,       ///< Target is the destination
    unrelated,      ///< Addressable, but the target is neither endpoint
    not_addressable ///< No IPv4/IPv6 header could be decoded
};

/**
 * @brief Classifies frames against a target and folds them into counters
 *
 * Stateless apart from the target and epoch, so one classifier can be shared
 * read-only by every worker while each worker folds into its own TrafficStats.
 */
class TrafficClassifier {
public:
    TrafficClassifier(const IpAddress& target, std::chrono::nanoseconds epoch) noexcept
        : target_(target),
          epoch_(epoch) {}

    /**
     * @brief Decode @p frame and count it in @p stats if it involves the target
     *
     * A frame whose source is the target is counted as sent (packets per
     * second, captured bytes per second, packets per destination). Otherwise a
     * frame whose destination is the target is counted as received.
     *
     * @return How the frame was classified
     */
    Direction fold(const Frame& frame, TrafficStats& stats) const {
        const auto addresses = decode_frame(frame);
        if (!addresses) {
            return Direction::not_addressable;
        }

        const RelativeSecond second = relative_second(frame.timestamp, epoch_);
        if (addresses->source == target_) {
            stats.sent_time[second]++;
            stats.sent_size[second] += frame.captured_length;
            stats.sent_ip[addresses->destination.to_string()]++;
            return Direction::sent;
        }
        if (addresses->destination == target_) {
            stats.received_time[second]++;
            stats.received_ip[addresses->source.to_string()]++;
            return Direction::received;
        }
        return Direction::unrelated;
    }

    const IpAddress& target() const noexcept { return target_; }

    std::chrono::nanoseconds epoch() const noexcept { return epoch_; }

private:
    IpAddress target_;
    std::chrono::nanoseconds epoch_;
};

} // namespace pcapstat
