// pcapstat_gen: write a synthetic request/response capture
//
// Usage:
//   pcapstat_gen <out> [--format pcap|pcapng] [--target IP] [--peer IP] [--frames N]
//
// Frames alternate peer -> target and target -> peer, one per second, starting
// at the current wall-clock time. The defaults reproduce a two-frame exchange
// between 192.168.1.1 and 192.168.1.5.

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cstdint>
#include <cstdio>

#include <fmt/format.h>
#include <pcapstat/pcapstat.hpp>

namespace {

struct Options {
    std::string output;
    pcapstat::CaptureFormat format{pcapstat::CaptureFormat::classic};
    std::string target{"192.168.1.5"};
    std::string peer{"192.168.1.1"};
    size_t frames{2};
};

void print_usage(const char* program) {
    fmt::print(stderr,
               "Usage: {} <out> [--format pcap|pcapng] [--target IP] [--peer IP] [--frames N]\n",
               program);
}

std::optional<Options> parse_arguments(int argc, char** argv) {
    Options options;
    bool have_output = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool takes_value =
            arg == "--format" || arg == "--target" || arg == "--peer" || arg == "--frames";
        if (takes_value && i + 1 >= argc) {
            fmt::print(stderr, "Error: {} needs a value\n", arg);
            return std::nullopt;
        }

        if (arg == "--format") {
            const std::string_view value = argv[++i];
            if (value == "pcap") {
                options.format = pcapstat::CaptureFormat::classic;
            } else if (value == "pcapng") {
                options.format = pcapstat::CaptureFormat::next_generation;
            } else {
                fmt::print(stderr, "Error: unknown format '{}'\n", value);
                return std::nullopt;
            }
        } else if (arg == "--target") {
            options.target = argv[++i];
        } else if (arg == "--peer") {
            options.peer = argv[++i];
        } else if (arg == "--frames") {
            try {
                options.frames = std::stoul(argv[++i]);
            } catch (const std::exception&) {
                fmt::print(stderr, "Error: --frames expects a number, got '{}'\n", argv[i]);
                return std::nullopt;
            }
        } else if (arg.starts_with("--") || have_output) {
            fmt::print(stderr, "Error: unexpected argument {}\n", arg);
            return std::nullopt;
        } else {
            options.output = arg;
            have_output = true;
        }
    }

    if (!have_output) {
        return std::nullopt;
    }
    return options;
}

std::vector<uint8_t> build_frame(const pcapstat::IpAddress& source,
                                 const pcapstat::IpAddress& destination) {
    if (source.is_v4() && destination.is_v4()) {
        return pcapstat::capture::build_ethernet_ipv4(source, destination);
    }
    return pcapstat::capture::build_ethernet_ipv6(source, destination);
}

} // namespace

int main(int argc, char** argv) {
    const auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    const auto target = pcapstat::IpAddress::parse(options->target);
    const auto peer = pcapstat::IpAddress::parse(options->peer);
    if (!target || !peer) {
        fmt::print(stderr, "Error: invalid address '{}'\n",
                   target ? options->peer : options->target);
        return 2;
    }

    const auto start = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch());

    pcapstat::PcapWriter pcap_writer;
    pcapstat::PcapngWriter pcapng_writer;
    const uint32_t interface_id = pcapng_writer.add_interface();

    for (size_t i = 0; i < options->frames; ++i) {
        const bool inbound = i % 2 == 0;
        const auto frame = inbound ? build_frame(*peer, *target) : build_frame(*target, *peer);
        const auto timestamp = start + std::chrono::seconds{static_cast<int64_t>(i)};

        const bool written =
            options->format == pcapstat::CaptureFormat::next_generation
                ? pcapng_writer.write_enhanced_packet(interface_id, timestamp, frame)
                : pcap_writer.write_frame(timestamp, frame);
        if (!written) {
            fmt::print(stderr, "Error: failed to encode frame {}\n", i);
            return 1;
        }
    }

    try {
        if (options->format == pcapstat::CaptureFormat::next_generation) {
            pcapng_writer.save(options->output);
        } else {
            pcap_writer.save(options->output);
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }

    fmt::print(stderr, "Wrote {} frames to {} ({})\n", options->frames, options->output,
               pcapstat::format_name(options->format));
    return 0;
}
