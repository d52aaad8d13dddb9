#pragma once

#include <chrono>
#include <map>
#include <span>
#include <string>

#include <cstdint>

namespace pcapstat {

/// Whole seconds since the first frame of the capture
using RelativeSecond = int64_t;

/**
 * @brief Traffic counters relative to one target address
 *
 * Used both as a worker's private partial result and as the merged final
 * result. Counters only ever grow.
 */
struct TrafficStats {
    std::map<RelativeSecond, uint64_t> sent_time;     ///< Packets sent by the target per second
    std::map<RelativeSecond, uint64_t> received_time; ///< Packets received per second
    std::map<std::string, uint64_t> sent_ip;          ///< Packets sent per destination peer
    std::map<std::string, uint64_t> received_ip;      ///< Packets received per source peer
    std::map<RelativeSecond, uint64_t> sent_size;     ///< Captured bytes sent per second

    [[nodiscard]] bool empty() const noexcept {
        return sent_time.empty() && received_time.empty() && sent_ip.empty() &&
               received_ip.empty() && sent_size.empty();
    }

    friend bool operator==(const TrafficStats&, const TrafficStats&) = default;
};

namespace detail {

template <typename Key>
void add_counts(std::map<Key, uint64_t>& dest, const std::map<Key, uint64_t>& src) {
    for (const auto& [key, count] : src) {
        dest[key] += count;
    }
}

} // namespace detail

/**
 * @brief Add every counter of @p src into @p dest
 *
 * Keys missing on either side count as zero. The operation is commutative and
 * associative, so partial results may be merged in any order.
 */
inline void merge_into(TrafficStats& dest, const TrafficStats& src) {
    detail::add_counts(dest.sent_time, src.sent_time);
    detail::add_counts(dest.received_time, src.received_time);
    detail::add_counts(dest.sent_ip, src.sent_ip);
    detail::add_counts(dest.received_ip, src.received_ip);
    detail::add_counts(dest.sent_size, src.sent_size);
}

/**
 * @brief Sum a set of partial results into a fresh result
 */
[[nodiscard]] inline TrafficStats merge_all(std::span<const TrafficStats> partials) {
    TrafficStats total;
    for (const auto& partial : partials) {
        merge_into(total, partial);
    }
    return total;
}

/**
 * @brief Elapsed whole seconds between @p epoch and @p timestamp
 *
 * The sub-second remainder is truncated. Timestamps earlier than the epoch
 * fall into second 0.
 */
[[nodiscard]] constexpr RelativeSecond relative_second(std::chrono::nanoseconds timestamp,
                                                       std::chrono::nanoseconds epoch) noexcept {
    const auto elapsed = timestamp - epoch;
    if (elapsed.count() <= 0) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
}

} // namespace pcapstat
