// pcapstat: per-target traffic counters for a pcap/pcapng capture
//
// Usage:
//   pcapstat <capture> <target> [--top K] [--workers N] [--honor-link-type]
//            [--compact] [--verbose]
//
// Prints {"graphObjects": <counters>, "topPeers": [...]} on stdout.
// Diagnostics go to stderr.

#include <chrono>
#include <exception>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <pcapstat/io/json_output.hpp>
#include <pcapstat/pcapstat.hpp>

namespace {

struct Options {
    std::string capture_path;
    std::string target;
    size_t top{pcapstat::DEFAULT_TOP_PEERS};
    pcapstat::AnalyzerConfig config{};
    bool compact{false};
    bool verbose{false};
};

void print_usage(const char* program) {
    fmt::print(stderr,
               "Usage: {} <capture> <target> [options]\n"
               "\n"
               "Options:\n"
               "  --top K              Peers listed in topPeers (default {})\n"
               "  --workers N          Worker threads, 0 = hardware concurrency, at most {} (default 0)\n"
               "  --honor-link-type    Decode pcapng frames with each interface's link type\n"
               "  --compact            Single-line JSON output\n"
               "  --verbose            Report progress on stderr\n",
               program, pcapstat::DEFAULT_TOP_PEERS, pcapstat::MAX_WORKERS);
}

std::optional<size_t> parse_count(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const auto digit = static_cast<size_t>(c - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::optional<Options> parse_arguments(int argc, char** argv) {
    Options options;
    std::vector<std::string_view> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--top" || arg == "--workers") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} needs a value\n", arg);
                return std::nullopt;
            }
            const auto value = parse_count(argv[++i]);
            if (!value) {
                fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n", arg,
                           argv[i]);
                return std::nullopt;
            }
            if (arg == "--top") {
                options.top = *value;
            } else {
                options.config.worker_count = *value;
            }
        } else if (arg == "--honor-link-type") {
            options.config.reader.honor_interface_link_type = true;
        } else if (arg == "--compact") {
            options.compact = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg.starts_with("--")) {
            fmt::print(stderr, "Error: unknown option {}\n", arg);
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        return std::nullopt;
    }
    options.capture_path = positional[0];
    options.target = positional[1];
    return options;
}

} // namespace

int main(int argc, char** argv) {
    const auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    std::vector<uint8_t> capture;
    try {
        capture = pcapstat::io::load_capture_file(options->capture_path);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
    if (options->verbose) {
        fmt::print(stderr, "Loaded {} ({} bytes)\n", options->capture_path, capture.size());
    }

    pcapstat::TrafficAnalyzer analyzer(options->config);
    if (options->verbose && options->config.worker_count > pcapstat::MAX_WORKERS) {
        fmt::print(stderr, "Clamping --workers {} to {}\n", options->config.worker_count,
                   pcapstat::MAX_WORKERS);
    }
    const auto started = std::chrono::steady_clock::now();
    pcapstat::expected<pcapstat::TrafficStats, pcapstat::AnalysisError> stats;
    try {
        stats = analyzer.analyze(capture, options->target);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: analysis failed: {}\n", e.what());
        return 1;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!stats) {
        fmt::print(stderr, "Error: {}\n", pcapstat::describe(stats.error()));
        return pcapstat::is_invalid_address(stats.error()) ? 2 : 1;
    }

    if (options->verbose) {
        const auto& summary = analyzer.last_summary();
        fmt::print(stderr, "Format: {}, frames: {}, workers: {}, elapsed: {}\n",
                   pcapstat::format_name(summary.format), summary.frames, summary.workers,
                   elapsed);
    }

    const auto peers = pcapstat::top_peers(stats->sent_ip, options->top);
    const auto report = pcapstat::io::make_report(*stats, peers);
    fmt::print("{}\n", report.dump(options->compact ? -1 : 2));
    return 0;
}
