#pragma once

#include <algorithm>
#include <exception>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../capture/capture_reader.hpp"
#include "../capture/frame.hpp"
#include "../detail/capture_error.hpp"
#include "../expected.hpp"
#include "../ip_address.hpp"
#include "frame_source.hpp"
#include "traffic_classifier.hpp"
#include "traffic_stats.hpp"

namespace pcapstat {

/// Upper bound on worker threads; larger requests are clamped
constexpr size_t MAX_WORKERS = 256;

/**
 * @brief Analysis settings
 */
struct AnalyzerConfig {
    size_t worker_count{0}; ///< 0 uses the host's hardware concurrency, capped at MAX_WORKERS
    ReaderOptions reader{};
};

/**
 * @brief Facts about the most recent analysis run
 */
struct AnalysisSummary {
    CaptureFormat format{CaptureFormat::classic};
    size_t frames{0};  ///< Frames read from the container
    size_t workers{0}; ///< Worker threads started (0 for an empty capture)
};

/**
 * @brief Concurrent traffic classifier for one capture and one target
 *
 * The first frame is read on the calling thread and fixes the epoch. The rest
 * of the capture is pulled from a shared source by a pool of workers, each
 * counting into a private TrafficStats. The partial results are merged after
 * every worker has joined, so the result does not depend on the worker count
 * or on scheduling.
 *
 * Example usage:
 * @code
 * TrafficAnalyzer analyzer({.worker_count = 4});
 * auto stats = analyzer.analyze(capture_bytes, "192.168.1.5");
 * if (!stats) {
 *     std::cerr << describe(stats.error()) << "\n";
 * }
 * @endcode
 */
class TrafficAnalyzer {
public:
    explicit TrafficAnalyzer(AnalyzerConfig config = {}) : config_(config) {}

    /**
     * @brief Count the traffic sent and received by @p target
     *
     * @param capture Complete classic pcap or pcapng file contents
     * @param target IPv4 or IPv6 address text, validated before the capture is read
     * @return Merged counters, InvalidAddressError, or the FormatError that
     *         stopped the read
     * @throws std::system_error if a worker thread cannot be started
     * @throws std::bad_alloc (or any other exception raised by a worker),
     *         rethrown on the calling thread after all workers joined
     */
    expected<TrafficStats, AnalysisError> analyze(std::span<const uint8_t> capture,
                                                  std::string_view target) {
        summary_ = AnalysisSummary{};

        const auto target_address = IpAddress::parse(target);
        if (!target_address) {
            return unexpected(AnalysisError{InvalidAddressError{std::string(target)}});
        }

        auto reader = capture::CaptureReader::open(capture, config_.reader);
        if (!reader) {
            return unexpected(AnalysisError{reader.error()});
        }
        summary_.format = reader->format();

        auto first = reader->read_next_frame();
        if (!first) {
            if (is_eof(first.error())) {
                return TrafficStats{};
            }
            return unexpected(AnalysisError{std::get<FormatError>(first.error())});
        }

        const TrafficClassifier classifier(*target_address, first->timestamp);
        TrafficStats main_stats;
        classifier.fold(*first, main_stats);

        SharedFrameSource<capture::CaptureReader> source(std::move(*reader));
        const size_t workers = worker_count();
        std::vector<TrafficStats> partials(workers);
        std::vector<std::exception_ptr> failures(workers);

        {
            std::vector<std::jthread> pool;
            pool.reserve(workers);
            for (size_t i = 0; i < workers; ++i) {
                pool.emplace_back([&, i] {
                    try {
                        while (auto frame = source.next()) {
                            classifier.fold(*frame, partials[i]);
                        }
                    } catch (...) {
                        failures[i] = std::current_exception();
                        source.close();
                    }
                });
            }
        } // jthread joins on destruction

        for (const auto& failure : failures) {
            if (failure) {
                std::rethrow_exception(failure);
            }
        }

        summary_.frames = 1 + source.frames_delivered();
        summary_.workers = workers;

        if (auto error = source.error()) {
            return unexpected(AnalysisError{*error});
        }

        merge_into(main_stats, merge_all(partials));
        return main_stats;
    }

    /**
     * @brief Number of workers the next analyze() call will start
     */
    size_t worker_count() const noexcept {
        const size_t requested = config_.worker_count > 0 ? config_.worker_count : host_parallelism();
        return std::min(requested, MAX_WORKERS);
    }

    static size_t host_parallelism() noexcept {
        return std::clamp<size_t>(std::thread::hardware_concurrency(), 1, MAX_WORKERS);
    }

    const AnalyzerConfig& config() const noexcept { return config_; }

    const AnalysisSummary& last_summary() const noexcept { return summary_; }

private:
    AnalyzerConfig config_;
    AnalysisSummary summary_;
};

/**
 * @brief Analyze a capture with default settings and host parallelism
 */
inline expected<TrafficStats, AnalysisError> analyze(std::span<const uint8_t> capture,
                                                     std::string_view target) {
    return TrafficAnalyzer{}.analyze(capture, target);
}

} // namespace pcapstat
