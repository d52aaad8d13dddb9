#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace pcapstat {

/// Peers reported by the command-line tool
constexpr size_t DEFAULT_TOP_PEERS = 20;

struct PeerCount {
    std::string address;
    uint64_t count{0};

    friend bool operator==(const PeerCount&, const PeerCount&) = default;
};

/**
 * @brief Select the @p k peers with the highest packet counts
 *
 * Ordered by count, highest first. Equal counts are ordered by address text
 * so the selection is deterministic.
 */
[[nodiscard]] inline std::vector<PeerCount> top_peers(const std::map<std::string, uint64_t>& peers,
                                                      size_t k) {
    std::vector<PeerCount> ranked;
    ranked.reserve(peers.size());
    for (const auto& [address, count] : peers) {
        ranked.push_back(PeerCount{address, count});
    }

    const auto by_rank = [](const PeerCount& a, const PeerCount& b) {
        if (a.count != b.count) {
            return a.count > b.count;
        }
        return a.address < b.address;
    };
    const size_t keep = std::min(k, ranked.size());
    std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(keep),
                      ranked.end(), by_rank);
    ranked.resize(keep);
    return ranked;
}

} // namespace pcapstat
