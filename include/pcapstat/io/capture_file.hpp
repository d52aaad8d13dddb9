#pragma once

#include <array>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace pcapstat::io {

/**
 * @brief Read a whole capture file into memory
 *
 * @param filepath Path to a pcap or pcapng file
 * @return File contents
 * @throws std::runtime_error if the file cannot be opened or read
 */
inline std::vector<uint8_t> load_capture_file(const std::string& filepath) {
    std::FILE* file = std::fopen(filepath.c_str(), "rb");
    if (!file) {
        throw std::runtime_error("Failed to open capture file: " + filepath + ": " +
                                 std::strerror(errno));
    }

    std::vector<uint8_t> contents;
    std::array<uint8_t, 65536> chunk{};
    while (true) {
        const size_t n = std::fread(chunk.data(), 1, chunk.size(), file);
        contents.insert(contents.end(), chunk.begin(), chunk.begin() + n);
        if (n < chunk.size()) {
            break;
        }
    }

    const bool failed = std::ferror(file) != 0;
    std::fclose(file);
    if (failed) {
        throw std::runtime_error("Failed to read capture file: " + filepath);
    }
    return contents;
}

/**
 * @brief Write a capture buffer to disk, truncating any existing file
 *
 * @throws std::runtime_error if the file cannot be created or fully written
 */
inline void write_capture_file(const std::string& filepath, std::span<const uint8_t> bytes) {
    int fd = ::open(filepath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw std::runtime_error("Failed to create capture file: " + filepath + ": " +
                                 std::strerror(errno));
    }

    size_t offset = 0;
    while (offset < bytes.size()) {
        ssize_t written = ::write(fd, bytes.data() + offset, bytes.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::close(fd);
            throw std::runtime_error("Failed to write capture file: " + filepath + ": " +
                                     std::strerror(errno));
        }
        offset += static_cast<size_t>(written);
    }

    if (::close(fd) != 0) {
        throw std::runtime_error("Failed to close capture file: " + filepath);
    }
}

} // namespace pcapstat::io
