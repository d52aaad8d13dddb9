#pragma once
// Analysis bindings: analyze, detect_format, top_peers

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <pcapstat/analysis/top_peers.hpp>
#include <pcapstat/analysis/traffic_analyzer.hpp>
#include <pcapstat/capture/format_detector.hpp>

#include <map>
#include <string>

#include <cstdint>

#include "error_bindings.hpp"
#include "py_types.hpp"

namespace nb = nanobind;
using namespace nb::literals;

namespace pcapstat_python {

template <typename Key>
nb::dict to_dict(const std::map<Key, uint64_t>& counts) {
    nb::dict result;
    for (const auto& [key, count] : counts) {
        result[nb::cast(key)] = count;
    }
    return result;
}

/**
 * @brief Counters in the same shape as the JSON report's graphObjects
 */
inline nb::dict stats_to_dict(const pcapstat::TrafficStats& stats) {
    nb::dict result;
    result["sentTime"] = to_dict(stats.sent_time);
    result["receivedTime"] = to_dict(stats.received_time);
    result["sentIP"] = to_dict(stats.sent_ip);
    result["receivedIP"] = to_dict(stats.received_ip);
    result["sentSize"] = to_dict(stats.sent_size);
    return result;
}

inline void bind_analysis(nb::module_& m) {
    m.def(
        "analyze",
        [](const nb::bytes& data, const std::string& target, size_t workers,
           bool honor_link_type) {
            pcapstat::AnalyzerConfig config;
            config.worker_count = workers;
            config.reader.honor_interface_link_type = honor_link_type;

            auto result = [&]() {
                nb::gil_scoped_release release;
                return pcapstat::TrafficAnalyzer(config).analyze(as_span(data), target);
            }();
            if (!result) {
                raise_analysis_error(result.error());
            }
            return stats_to_dict(*result);
        },
        "data"_a, "target"_a, "workers"_a = 0, "honor_link_type"_a = false,
        "Count the packets and bytes a target address sent and received.\n\n"
        "Returns a dict with sentTime, receivedTime, sentIP, receivedIP and sentSize.\n"
        "Raises InvalidAddressError or FormatError.");

    m.def(
        "detect_format",
        [](const nb::bytes& data) {
            auto format = pcapstat::capture::detect_format(as_span(data));
            if (!format) {
                raise_analysis_error(pcapstat::AnalysisError{format.error()});
            }
            return std::string(pcapstat::format_name(*format));
        },
        "data"_a, "Return 'pcap' or 'pcapng' for a capture's leading bytes.");

    m.def(
        "top_peers",
        [](const nb::dict& peers, size_t k) {
            std::map<std::string, uint64_t> counts;
            for (auto [key, value] : peers) {
                counts[nb::cast<std::string>(key)] = nb::cast<uint64_t>(value);
            }
            nb::list result;
            for (const auto& peer : pcapstat::top_peers(counts, k)) {
                result.append(nb::make_tuple(peer.address, peer.count));
            }
            return result;
        },
        "peers"_a, "k"_a = pcapstat::DEFAULT_TOP_PEERS,
        "Highest-count (address, count) pairs, ties ordered by address.");
}

} // namespace pcapstat_python
