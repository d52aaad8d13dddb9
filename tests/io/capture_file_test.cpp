#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <vector>

#include <cstdint>
#include <gtest/gtest.h>
#include <pcapstat/io/capture_file.hpp>

#include "capture_test_helpers.hpp"

using namespace pcapstat;
using namespace std::chrono_literals;

TEST(CaptureFileTest, WriteThenLoad) {
    test::TempCaptureFile file("pcapstat_capture_file.pcap");
    auto bytes = test::make_pcap({test::ipv4_frame(0s, "10.0.0.1", "10.0.0.2"),
                                  test::ipv4_frame(1s, "10.0.0.2", "10.0.0.1", 1400)});

    io::write_capture_file(file.path().string(), bytes);
    EXPECT_EQ(io::load_capture_file(file.path().string()), bytes);
}

TEST(CaptureFileTest, LargerThanOneChunk) {
    test::TempCaptureFile file("pcapstat_capture_file_large.bin");
    std::vector<uint8_t> bytes(200'000);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(i * 31);
    }

    io::write_capture_file(file.path().string(), bytes);
    EXPECT_EQ(io::load_capture_file(file.path().string()), bytes);
}

TEST(CaptureFileTest, OverwriteTruncates) {
    test::TempCaptureFile file("pcapstat_capture_file_trunc.bin");
    io::write_capture_file(file.path().string(), std::vector<uint8_t>(100, 1));
    io::write_capture_file(file.path().string(), std::vector<uint8_t>(3, 2));

    EXPECT_EQ(io::load_capture_file(file.path().string()), std::vector<uint8_t>(3, 2));
}

TEST(CaptureFileTest, EmptyFileLoadsEmpty) {
    test::TempCaptureFile file("pcapstat_capture_file_empty.bin");
    io::write_capture_file(file.path().string(), {});
    EXPECT_TRUE(io::load_capture_file(file.path().string()).empty());
}

TEST(CaptureFileTest, MissingFileThrows) {
    test::TempCaptureFile file("pcapstat_capture_file_missing.pcap");
    EXPECT_THROW(io::load_capture_file(file.path().string()), std::runtime_error);
}

TEST(CaptureFileTest, UnwritableLocationThrows) {
    const auto path = (std::filesystem::temp_directory_path() / "pcapstat_no_such_dir" / "x.pcap");
    EXPECT_THROW(io::write_capture_file(path.string(), std::vector<uint8_t>(4, 0)),
                 std::runtime_error);
}
