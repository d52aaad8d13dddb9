#pragma once

/**
 * @file pcapstat.hpp
 * @brief Convenience header for capture analysis
 *
 * Primary types:
 * - TrafficAnalyzer: Concurrent per-target traffic counters (RECOMMENDED)
 * - CaptureReader: Format-agnostic frame reader (classic pcap or pcapng)
 * - PcapWriter / PcapngWriter: Build captures in memory (for testing/generation)
 * - TrafficStats: Counter mappings, merged with merge_into()/merge_all()
 *
 * Free functions:
 * - analyze(): One-shot analysis with host parallelism
 * - detect_format(): Container detection from the first four bytes
 * - decode_frame(): Network-layer endpoints of one frame
 * - top_peers(): Highest-count peers of a counter mapping
 */

#include "analysis/frame_source.hpp"
#include "analysis/top_peers.hpp"
#include "analysis/traffic_analyzer.hpp"
#include "analysis/traffic_classifier.hpp"
#include "analysis/traffic_stats.hpp"
#include "capture/capture_reader.hpp"
#include "capture/format_detector.hpp"
#include "capture/frame.hpp"
#include "capture/packet_builder.hpp"
#include "capture/pcap_reader.hpp"
#include "capture/pcap_writer.hpp"
#include "capture/pcapng_reader.hpp"
#include "capture/pcapng_writer.hpp"
#include "decode/frame_decoder.hpp"
#include "detail/capture_error.hpp"
#include "expected.hpp"
#include "io/capture_file.hpp"
#include "ip_address.hpp"

namespace pcapstat {

// Container readers and writers
using CaptureReader = capture::CaptureReader;
using PcapReader = capture::PcapReader;
using PcapngReader = capture::PcapngReader;
using PcapWriter = capture::PcapWriter;
using PcapngWriter = capture::PcapngWriter;

// detect_format() is defined in capture/format_detector.hpp
using capture::detect_format;

} // namespace pcapstat
