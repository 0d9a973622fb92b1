#ifndef _LIB_IPAM_TYPE_IPV4_ADDRESS_HPP_
#define _LIB_IPAM_TYPE_IPV4_ADDRESS_HPP_

#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>

#include "tl/expected.hpp"

namespace libipam::type {

/**
 * Immutable IPv4 address, stored in host byte order
 */

class ipv4_address
{
    uint32_t m_addr;

public:
    constexpr ipv4_address() noexcept
        : m_addr(0)
    {}

    constexpr explicit ipv4_address(uint32_t addr) noexcept
        : m_addr(addr)
    {}

    ipv4_address(const char*);
    ipv4_address(const std::string&);
    ipv4_address(std::initializer_list<uint8_t>);

    constexpr uint32_t data() const noexcept { return (m_addr); }

    /* Octets are indexed in network order, e.g. 10 is octet 0 of 10.0.0.1 */
    constexpr uint8_t operator[](size_t idx) const noexcept
    {
        return (static_cast<uint8_t>(m_addr >> (24 - 8 * idx)));
    }

    uint8_t at(size_t idx) const;

    static constexpr uint32_t max_value = 0xffffffff;
};

tl::expected<ipv4_address, std::string> parse_ipv4_address(std::string_view);

std::string to_string(const ipv4_address&);

inline std::ostream& operator<<(std::ostream& os, const ipv4_address& addr)
{
    os << to_string(addr);
    return (os);
}

constexpr int compare(const ipv4_address& lhs, const ipv4_address& rhs)
{
    if (lhs.data() < rhs.data()) {
        return (-1);
    } else if (lhs.data() > rhs.data()) {
        return (1);
    } else {
        return (0);
    }
}

constexpr bool operator==(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) == 0;
}

constexpr bool operator!=(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) != 0;
}

constexpr bool operator<(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) < 0;
}

constexpr bool operator>(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) > 0;
}

constexpr bool operator<=(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) <= 0;
}

constexpr bool operator>=(const ipv4_address& lhs, const ipv4_address& rhs)
{
    return compare(lhs, rhs) >= 0;
}

} // namespace libipam::type

#endif /* _LIB_IPAM_TYPE_IPV4_ADDRESS_HPP_ */
