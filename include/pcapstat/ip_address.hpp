#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <arpa/inet.h>
#include <cstdint>
#include <netinet/in.h>

namespace pcapstat {

/**
 * @brief IPv4 or IPv6 network address
 *
 * Stored as 16 bytes. IPv4 addresses use the IPv4-mapped IPv6 form
 * (::ffff:a.b.c.d), so an IPv4 address and its mapped IPv6 spelling compare
 * equal and both print in dotted-quad form.
 *
 * Example usage:
 * @code
 * auto target = IpAddress::parse("192.168.1.5");
 * if (!target) {
 *     return;  // not an address
 * }
 * bool v4 = target->is_v4();               // true
 * std::string text = target->to_string();  // "192.168.1.5"
 * @endcode
 */
class IpAddress {
public:
    using Bytes = std::array<uint8_t, 16>;

    /// The unspecified address (::)
    constexpr IpAddress() noexcept = default;

    static IpAddress from_v4(std::span<const uint8_t, 4> octets) noexcept {
        IpAddress addr;
        addr.bytes_[10] = 0xff;
        addr.bytes_[11] = 0xff;
        std::copy(octets.begin(), octets.end(), addr.bytes_.begin() + 12);
        return addr;
    }

    static IpAddress from_v6(std::span<const uint8_t, 16> octets) noexcept {
        IpAddress addr;
        std::copy(octets.begin(), octets.end(), addr.bytes_.begin());
        return addr;
    }

    /**
     * @brief Parse dotted-quad IPv4 or textual IPv6 (RFC 4291) notation
     *
     * Leading zeros in IPv4 octets, zone identifiers, surrounding whitespace,
     * embedded NUL characters and CIDR suffixes are rejected.
     *
     * @return Parsed address, or std::nullopt if @p text is not an address
     */
    static std::optional<IpAddress> parse(std::string_view text) {
        if (text.empty() || text.size() >= INET6_ADDRSTRLEN ||
            text.find('\0') != std::string_view::npos) {
            return std::nullopt;
        }
        // inet_pton needs a NUL-terminated string
        const std::string buffer(text);

        std::array<uint8_t, 4> v4{};
        if (::inet_pton(AF_INET, buffer.c_str(), v4.data()) == 1) {
            return from_v4(v4);
        }
        Bytes v6{};
        if (::inet_pton(AF_INET6, buffer.c_str(), v6.data()) == 1) {
            return from_v6(v6);
        }
        return std::nullopt;
    }

    /**
     * @brief True for IPv4 (including IPv4-mapped IPv6) addresses
     */
    [[nodiscard]] bool is_v4() const noexcept {
        for (size_t i = 0; i < 10; ++i) {
            if (bytes_[i] != 0) {
                return false;
            }
        }
        return bytes_[10] == 0xff && bytes_[11] == 0xff;
    }

    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }

    /**
     * @brief Canonical text form: dotted-quad for IPv4, RFC 5952 style for IPv6
     */
    [[nodiscard]] std::string to_string() const {
        std::array<char, INET6_ADDRSTRLEN> text{};
        if (is_v4()) {
            ::inet_ntop(AF_INET, bytes_.data() + 12, text.data(), text.size());
        } else {
            ::inet_ntop(AF_INET6, bytes_.data(), text.data(), text.size());
        }
        return std::string(text.data());
    }

    friend bool operator==(const IpAddress&, const IpAddress&) = default;
    friend auto operator<=>(const IpAddress&, const IpAddress&) = default;

private:
    Bytes bytes_{};
};

} // namespace pcapstat
