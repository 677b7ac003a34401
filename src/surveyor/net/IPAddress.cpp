#include "IPAddress.hpp"

#include <arpa/inet.h>

#include <charconv>
#include <cstring>

namespace surveyor::net {

std::optional<IPAddress> IPAddress::Parse(const std::string& text)
{
    IPAddress addr;
    if (text.find(':') == std::string::npos)
    {
        in_addr v4{};
        if (::inet_pton(AF_INET, text.c_str(), &v4) != 1)
            return std::nullopt;
        std::memcpy(addr.bytes.data(), &v4, 4);
        addr.v6 = false;
        return addr;
    }

    in6_addr v6{};
    if (::inet_pton(AF_INET6, text.c_str(), &v6) != 1)
        return std::nullopt;
    std::memcpy(addr.bytes.data(), &v6, 16);
    addr.v6 = true;
    return addr;
}

std::string IPAddress::ToString() const
{
    char buf[INET6_ADDRSTRLEN] = {};
    if (v6)
    {
        in6_addr a{};
        std::memcpy(&a, bytes.data(), 16);
        if (!::inet_ntop(AF_INET6, &a, buf, sizeof(buf)))
            return {};
    }
    else
    {
        in_addr a{};
        std::memcpy(&a, bytes.data(), 4);
        if (!::inet_ntop(AF_INET, &a, buf, sizeof(buf)))
            return {};
    }
    return buf;
}

std::optional<CIDR> CIDR::Parse(const std::string& text)
{
    auto slash = text.find('/');
    if (slash == std::string::npos)
        return std::nullopt;

    auto addr = IPAddress::Parse(text.substr(0, slash));
    if (!addr)
        return std::nullopt;

    int len = -1;
    const char* first = text.data() + slash + 1;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, len);
    if (ec != std::errc() || ptr != last || len < 0 || len > addr->BitLength())
        return std::nullopt;

    CIDR cidr;
    cidr.network = *addr;
    cidr.prefix_len = len;

    const int total = addr->BitLength() / 8;
    for (int i = 0; i < total; ++i)
    {
        const int bit_start = i * 8;
        if (bit_start >= len)
        {
            cidr.network.bytes[static_cast<std::size_t>(i)] = 0;
        }
        else if (bit_start + 8 > len)
        {
            const int keep = len - bit_start;
            const auto mask = static_cast<std::uint8_t>(0xFF << (8 - keep));
            cidr.network.bytes[static_cast<std::size_t>(i)] &= mask;
        }
    }
    return cidr;
}

std::string CIDR::ToString() const
{
    return network.ToString() + "/" + std::to_string(prefix_len);
}

bool CIDR::Contains(const IPAddress& addr) const
{
    if (addr.v6 != network.v6)
        return false;

    for (int i = 0; i < prefix_len; ++i)
    {
        if (addr.Bit(i) != network.Bit(i))
            return false;
    }
    return true;
}

bool CIDR::Contains(const CIDR& other) const
{
    return other.prefix_len >= prefix_len && Contains(other.network);
}

} // namespace surveyor::net
