#pragma once

#include <map>
#include <string>
#include <vector>

#include <cstdint>

#include <nlohmann/json.hpp>

#include "../analysis/top_peers.hpp"
#include "../analysis/traffic_stats.hpp"

namespace pcapstat {

namespace detail {

// JSON object keys are strings; second buckets are rendered in decimal
inline nlohmann::json seconds_object(const std::map<RelativeSecond, uint64_t>& counts) {
    auto object = nlohmann::json::object();
    for (const auto& [second, count] : counts) {
        object[std::to_string(second)] = count;
    }
    return object;
}

} // namespace detail

/**
 * @brief Serialize counters in the dashboard's graph-object shape
 *
 * Keys: sentTime, receivedTime, sentIP, receivedIP, sentSize. Empty mappings
 * are emitted as empty objects.
 */
inline void to_json(nlohmann::json& j, const TrafficStats& stats) {
    j = nlohmann::json{
        {"sentTime", detail::seconds_object(stats.sent_time)},
        {"receivedTime", detail::seconds_object(stats.received_time)},
        {"sentIP", nlohmann::json(stats.sent_ip)},
        {"receivedIP", nlohmann::json(stats.received_ip)},
        {"sentSize", detail::seconds_object(stats.sent_size)},
    };
}

inline void to_json(nlohmann::json& j, const PeerCount& peer) {
    j = nlohmann::json{{"ip", peer.address}, {"count", peer.count}};
}

namespace io {

/**
 * @brief Full report document: {"graphObjects": ..., "topPeers": [...]}
 */
inline nlohmann::json make_report(const TrafficStats& stats, const std::vector<PeerCount>& peers) {
    return nlohmann::json{{"graphObjects", stats}, {"topPeers", peers}};
}

} // namespace io

} // namespace pcapstat
