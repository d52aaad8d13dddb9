#include <chrono>
#include <vector>

#include <cstdint>
#include <gtest/gtest.h>
#include <pcapstat/capture/capture_reader.hpp>
#include <pcapstat/capture/pcap_reader.hpp>

#include "capture_test_helpers.hpp"

using namespace pcapstat;
using namespace pcapstat::capture;
using namespace std::chrono_literals;
using pcapstat::test::BASE_TIME;

namespace {

constexpr size_t FIRST_RECORD = PCAP_GLOBAL_HEADER_SIZE;

std::vector<uint8_t> two_frame_capture(PcapWriterOptions options = {}) {
    return test::make_pcap({test::ipv4_frame(0s, "192.168.1.1", "192.168.1.5", 80),
                            test::ipv4_frame(1500ms, "192.168.1.5", "192.168.1.1", 120)},
                           options);
}

FormatError expect_format_error(PcapReader& reader) {
    auto result = reader.read_next_frame();
    EXPECT_FALSE(result.has_value());
    if (result.has_value() || !is_format_error(result.error())) {
        ADD_FAILURE() << "expected a FormatError";
        return FormatError{FormatError::Kind::short_input, 0};
    }
    return std::get<FormatError>(result.error());
}

} // namespace

// =============================================================================
// Global Header
// =============================================================================

TEST(PcapReaderTest, OpenParsesGlobalHeader) {
    auto bytes = two_frame_capture();
    auto reader = PcapReader::open(bytes);

    ASSERT_TRUE(reader.has_value()) << reader.error().message();
    EXPECT_EQ(reader->version_major(), 2);
    EXPECT_EQ(reader->version_minor(), 4);
    EXPECT_EQ(reader->snaplen(), DEFAULT_SNAPLEN);
    EXPECT_EQ(reader->link_type(), LINKTYPE_ETHERNET);
    EXPECT_FALSE(reader->is_big_endian());
    EXPECT_FALSE(reader->is_nanosecond_precision());
    EXPECT_EQ(reader->tell(), FIRST_RECORD);
    EXPECT_EQ(reader->size(), bytes.size());
    EXPECT_EQ(reader->frames_read(), 0u);
}

TEST(PcapReaderTest, ShortHeaderIsTruncatedHeader) {
    auto bytes = two_frame_capture();
    bytes.resize(20);

    auto reader = PcapReader::open(bytes);
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().kind, FormatError::Kind::truncated_header);
}

TEST(PcapReaderTest, UnknownMagicIsBadMagic) {
    auto bytes = two_frame_capture();
    test::poke32(bytes, 0, 0xdeadbeef);

    auto reader = PcapReader::open(bytes);
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().kind, FormatError::Kind::bad_magic);
    EXPECT_EQ(reader.error().offset, 0u);
}

TEST(PcapReaderTest, MajorVersionMustBeTwo) {
    auto bytes = two_frame_capture();
    bytes[4] = 3; // little-endian major version

    auto reader = PcapReader::open(bytes);
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().kind, FormatError::Kind::unsupported_version);
}

TEST(PcapReaderTest, LinkTypeIgnoresFcsBits) {
    auto bytes = two_frame_capture();
    test::poke32(bytes, 20, 0x10000000 | LINKTYPE_LINUX_SLL);

    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(reader->link_type(), LINKTYPE_LINUX_SLL);

    auto frame = reader->read_next_frame();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->link_type, LINKTYPE_LINUX_SLL);
}

TEST(PcapReaderTest, FcsLengthFlagsKeepEthernet) {
    auto bytes = two_frame_capture();
    // P bit (26) set, FCS length 4 in bits 28-31
    test::poke32(bytes, 20, (4u << 28) | (1u << 26) | LINKTYPE_ETHERNET);

    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(reader->link_type(), LINKTYPE_ETHERNET);

    auto frame = reader->read_next_frame();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->link_type, LINKTYPE_ETHERNET);
}

TEST(PcapReaderTest, ReservedLinkTypeBitsAreMasked) {
    auto bytes = two_frame_capture();
    test::poke32(bytes, 20, (1u << 27) | (1u << 20) | LINKTYPE_RAW);

    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(reader->link_type(), LINKTYPE_RAW);
}

// =============================================================================
// Records
// =============================================================================

TEST(PcapReaderTest, ReadsFramesInOrder) {
    auto bytes = two_frame_capture();
    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());

    auto first = reader->read_next_frame();
    ASSERT_TRUE(first.has_value()) << error_message(first.error());
    EXPECT_EQ(first->timestamp, BASE_TIME);
    EXPECT_EQ(first->captured_length, 80u);
    EXPECT_EQ(first->original_length, 80u);
    EXPECT_EQ(first->data.size(), 80u);
    EXPECT_EQ(first->data.data(), bytes.data() + FIRST_RECORD + PCAP_RECORD_HEADER_SIZE);

    auto second = reader->read_next_frame();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->timestamp, BASE_TIME + 1500ms);
    EXPECT_EQ(second->captured_length, 120u);
    EXPECT_EQ(reader->frames_read(), 2u);
}

TEST(PcapReaderTest, CleanEndOfStreamRepeats) {
    auto bytes = two_frame_capture();
    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());

    ASSERT_TRUE(reader->read_next_frame().has_value());
    ASSERT_TRUE(reader->read_next_frame().has_value());

    for (int i = 0; i < 2; ++i) {
        auto end = reader->read_next_frame();
        ASSERT_FALSE(end.has_value());
        EXPECT_TRUE(is_eof(end.error()));
    }
    EXPECT_EQ(reader->tell(), bytes.size());
}

TEST(PcapReaderTest, HeaderOnlyCaptureIsEmpty) {
    auto bytes = test::make_pcap({});
    ASSERT_EQ(bytes.size(), PCAP_GLOBAL_HEADER_SIZE);

    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    auto end = reader->read_next_frame();
    ASSERT_FALSE(end.has_value());
    EXPECT_TRUE(is_eof(end.error()));
}

TEST(PcapReaderTest, BigEndianNanosecondCapture) {
    PcapWriterOptions options;
    options.big_endian = true;
    options.nanosecond_precision = true;
    auto bytes = test::make_pcap({{BASE_TIME + 123456789ns, std::vector<uint8_t>(60, 0xAB)}},
                                 options);

    EXPECT_EQ(bytes[0], 0xa1);
    EXPECT_EQ(bytes[1], 0xb2);
    EXPECT_EQ(bytes[2], 0x3c);
    EXPECT_EQ(bytes[3], 0x4d);

    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    EXPECT_TRUE(reader->is_big_endian());
    EXPECT_TRUE(reader->is_nanosecond_precision());

    auto frame = reader->read_next_frame();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->timestamp, BASE_TIME + 123456789ns);
    EXPECT_EQ(frame->captured_length, 60u);
}

TEST(PcapReaderTest, MicrosecondPrecisionScalesFraction) {
    auto bytes = test::make_pcap({{BASE_TIME + 250us, std::vector<uint8_t>(42, 0)}});
    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());

    auto frame = reader->read_next_frame();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->timestamp, BASE_TIME + 250us);
}

TEST(PcapReaderTest, PartialRecordHeaderIsTruncated) {
    auto bytes = two_frame_capture();
    const size_t end_of_frames = bytes.size();
    bytes.insert(bytes.end(), 8, 0);

    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    ASSERT_TRUE(reader->read_next_frame().has_value());
    ASSERT_TRUE(reader->read_next_frame().has_value());

    auto error = expect_format_error(*reader);
    EXPECT_EQ(error.kind, FormatError::Kind::truncated_record);
    EXPECT_EQ(error.offset, end_of_frames);
}

TEST(PcapReaderTest, PartialRecordBodyIsTruncated) {
    auto bytes = two_frame_capture();
    bytes.resize(bytes.size() - 10);

    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    ASSERT_TRUE(reader->read_next_frame().has_value());

    auto error = expect_format_error(*reader);
    EXPECT_EQ(error.kind, FormatError::Kind::truncated_record);
    EXPECT_EQ(error.offset, FIRST_RECORD + PCAP_RECORD_HEADER_SIZE + 80);
}

TEST(PcapReaderTest, RecordLargerThanSnaplenIsInvalid) {
    PcapWriterOptions options;
    options.snaplen = 100;
    auto bytes = test::make_pcap({{BASE_TIME, std::vector<uint8_t>(60, 0)}}, options);
    test::poke32(bytes, FIRST_RECORD + 8, 101);  // incl_len
    test::poke32(bytes, FIRST_RECORD + 12, 200); // orig_len

    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    auto error = expect_format_error(*reader);
    EXPECT_EQ(error.kind, FormatError::Kind::invalid_record);
    EXPECT_EQ(error.offset, FIRST_RECORD);
}

TEST(PcapReaderTest, CapturedLongerThanOriginalIsInvalid) {
    auto bytes = test::make_pcap({{BASE_TIME, std::vector<uint8_t>(60, 0)}});
    test::poke32(bytes, FIRST_RECORD + 12, 59);

    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(expect_format_error(*reader).kind, FormatError::Kind::invalid_record);
}

TEST(PcapReaderTest, ZeroSnaplenMeansUnlimited) {
    PcapWriterOptions options;
    options.snaplen = 0;
    auto bytes = test::make_pcap({{BASE_TIME, std::vector<uint8_t>(1500, 0)}}, options);

    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    auto frame = reader->read_next_frame();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->captured_length, 1500u);
}

TEST(PcapReaderTest, ErrorsAreSticky) {
    auto bytes = two_frame_capture();
    bytes.resize(FIRST_RECORD + 4);

    auto reader = PcapReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(expect_format_error(*reader).kind, FormatError::Kind::truncated_record);
    EXPECT_EQ(expect_format_error(*reader).kind, FormatError::Kind::truncated_record);
    EXPECT_EQ(reader->frames_read(), 0u);
}

// =============================================================================
// Format-agnostic reader
// =============================================================================

TEST(PcapReaderTest, CaptureReaderDispatchesClassic) {
    auto bytes = two_frame_capture();
    auto reader = CaptureReader::open(bytes);
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(reader->format(), CaptureFormat::classic);

    auto count = for_each_frame(*reader, [](const Frame&) { return true; });
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 2u);
    EXPECT_EQ(reader->frames_read(), 2u);
}

TEST(PcapReaderTest, ForEachFrameStopsOnRequest) {
    auto bytes = two_frame_capture();
    auto reader = CaptureReader::open(bytes);
    ASSERT_TRUE(reader.has_value());

    auto count = for_each_frame(*reader, [](const Frame&) { return false; });
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 1u);
}

TEST(PcapReaderTest, ForEachFrameReturnsFormatError) {
    auto bytes = two_frame_capture();
    bytes.resize(bytes.size() - 1);
    auto reader = CaptureReader::open(bytes);
    ASSERT_TRUE(reader.has_value());

    size_t seen = 0;
    auto count = for_each_frame(*reader, [&](const Frame&) {
        ++seen;
        return true;
    });
    ASSERT_FALSE(count.has_value());
    EXPECT_EQ(count.error().kind, FormatError::Kind::truncated_record);
    EXPECT_EQ(seen, 1u);
}
