#pragma once

#include <string>
#include <type_traits>
#include <variant>

#include <cstddef>
#include <cstdint>

namespace pcapstat {

/**
 * @brief Represents end-of-stream (no error, just no more frames)
 *
 * Returned when a container reader reaches a clean record boundary at the
 * end of the capture buffer.
 */
struct EndOfStream {};

/**
 * @brief Malformed or truncated capture container
 *
 * Carries the byte offset at which the problem was detected so corrupt
 * captures can be inspected with a hex dump.
 */
struct FormatError {
    enum class Kind : uint8_t {
        short_input,         ///< Fewer than 4 bytes, format cannot be detected
        bad_magic,           ///< Unknown file or byte-order magic
        unsupported_version, ///< Container major version not understood
        truncated_header,    ///< File/section header cut short
        truncated_record,    ///< Record or block cut short mid-way
        invalid_record,      ///< Record lengths contradict the file header
        malformed_block      ///< pcapng block structure is inconsistent
    };

    Kind kind;
    size_t offset{0}; ///< Byte offset of the offending header/record/block

    /**
     * @brief Get human-readable error message
     */
    [[nodiscard]] const char* message() const noexcept {
        switch (kind) {
            case Kind::short_input:
                return "Capture too short to detect format";
            case Kind::bad_magic:
                return "Unrecognized capture magic number";
            case Kind::unsupported_version:
                return "Unsupported capture format version";
            case Kind::truncated_header:
                return "Truncated capture header";
            case Kind::truncated_record:
                return "Truncated capture record";
            case Kind::invalid_record:
                return "Invalid capture record length";
            case Kind::malformed_block:
                return "Malformed pcapng block";
        }
        return "Unknown format error";
    }
};

/**
 * @brief Target address string did not parse as IPv4 or IPv6
 */
struct InvalidAddressError {
    std::string input;

    [[nodiscard]] const char* message() const noexcept { return "Invalid target address"; }
};

/**
 * @brief Container reader error type
 *
 * - EndOfStream: Normal end of data
 * - FormatError: Defective container, reading cannot continue
 */
using ReaderError = std::variant<EndOfStream, FormatError>;

/**
 * @brief Error returned by a failed analysis
 */
using AnalysisError = std::variant<InvalidAddressError, FormatError>;

[[nodiscard]] inline bool is_eof(const ReaderError& e) noexcept {
    return std::holds_alternative<EndOfStream>(e);
}

[[nodiscard]] inline bool is_format_error(const ReaderError& e) noexcept {
    return std::holds_alternative<FormatError>(e);
}

[[nodiscard]] inline bool is_format_error(const AnalysisError& e) noexcept {
    return std::holds_alternative<FormatError>(e);
}

[[nodiscard]] inline bool is_invalid_address(const AnalysisError& e) noexcept {
    return std::holds_alternative<InvalidAddressError>(e);
}

/**
 * @brief Get human-readable error message from any ReaderError
 */
[[nodiscard]] inline const char* error_message(const ReaderError& e) noexcept {
    return std::visit(
        [](auto&& err) -> const char* {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, EndOfStream>) {
                return "End of stream";
            } else {
                return err.message();
            }
        },
        e);
}

[[nodiscard]] inline const char* error_message(const AnalysisError& e) noexcept {
    return std::visit([](auto&& err) -> const char* { return err.message(); }, e);
}

/**
 * @brief Full diagnostic text, including the offset or offending input
 */
[[nodiscard]] inline std::string describe(const AnalysisError& e) {
    if (const auto* fmt = std::get_if<FormatError>(&e)) {
        return std::string(fmt->message()) + " at offset " + std::to_string(fmt->offset);
    }
    return std::string(error_message(e)) + ": '" + std::get<InvalidAddressError>(e).input + "'";
}

} // namespace pcapstat
