#ifndef _LIB_IPAM_TYPE_IPV4_MASK_HPP_
#define _LIB_IPAM_TYPE_IPV4_MASK_HPP_

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "tl/expected.hpp"

namespace libipam::type {

/**
 * Immutable IPv4 netmask, i.e. a prefix length and the left aligned
 * run of one bits it implies.
 */

class ipv4_mask
{
    uint32_t m_mask;
    uint8_t m_prefix;

public:
    ipv4_mask(unsigned prefix_length = max_prefix_length);

    uint8_t prefix_length() const noexcept { return (m_prefix); }
    uint32_t data() const noexcept { return (m_mask); }
    uint32_t hostmask() const noexcept { return (~m_mask); }

    /* Number of addresses covered; 0 stands in for 2^32 on a /0. */
    uint64_t count() const noexcept;

    constexpr static uint8_t max_prefix_length = 32;
};

/*
 * Accepts a prefix length ("24" or "/24") or a dotted netmask
 * ("255.255.255.0").
 */
tl::expected<ipv4_mask, std::string> parse_ipv4_mask(std::string_view);

std::string to_string(const ipv4_mask&);

std::string to_extended_string(const ipv4_mask&);

inline std::ostream& operator<<(std::ostream& os, const ipv4_mask& mask)
{
    os << to_string(mask);
    return (os);
}

/*
 * Masks compare by capacity: the mask covering more addresses (the
 * shorter prefix) is the greater one.
 */
int compare(const ipv4_mask&, const ipv4_mask&);

inline bool operator==(const ipv4_mask& lhs, const ipv4_mask& rhs)
{
    return compare(lhs, rhs) == 0;
}

inline bool operator!=(const ipv4_mask& lhs, const ipv4_mask& rhs)
{
    return compare(lhs, rhs) != 0;
}

inline bool operator<(const ipv4_mask& lhs, const ipv4_mask& rhs)
{
    return compare(lhs, rhs) < 0;
}

inline bool operator>(const ipv4_mask& lhs, const ipv4_mask& rhs)
{
    return compare(lhs, rhs) > 0;
}

inline bool operator<=(const ipv4_mask& lhs, const ipv4_mask& rhs)
{
    return compare(lhs, rhs) <= 0;
}

inline bool operator>=(const ipv4_mask& lhs, const ipv4_mask& rhs)
{
    return compare(lhs, rhs) >= 0;
}

} // namespace libipam::type

#endif /* _LIB_IPAM_TYPE_IPV4_MASK_HPP_ */
