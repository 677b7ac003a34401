#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace surveyor::net {

/**
 * @brief IPv4 or IPv6 address in network byte order
 *
 * IPv4 addresses occupy the first four bytes of the buffer.
 */
struct IPAddress
{
    bool v6 = false;
    std::array<std::uint8_t, 16> bytes{};

    static std::optional<IPAddress> Parse(const std::string& text);

    std::string ToString() const;
    int BitLength() const { return v6 ? 128 : 32; }

    // Bit i counted from the most significant bit of the first byte
    bool Bit(int i) const { return (bytes[static_cast<std::size_t>(i / 8)] >> (7 - i % 8)) & 1; }

    bool operator==(const IPAddress& other) const = default;
};

/**
 * @brief Network prefix; host bits are always cleared
 */
struct CIDR
{
    IPAddress network;
    int prefix_len = 0;

    static std::optional<CIDR> Parse(const std::string& text);

    std::string ToString() const;
    bool Contains(const IPAddress& addr) const;
    bool Contains(const CIDR& other) const;

    bool operator==(const CIDR& other) const = default;
};

} // namespace surveyor::net
