#ifndef _LIB_IPAM_TYPE_IPV4_NETWORK_HPP_
#define _LIB_IPAM_TYPE_IPV4_NETWORK_HPP_

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ipam/type/ipv4_address.hpp"
#include "ipam/type/ipv4_mask.hpp"

namespace libipam::type {

/**
 * How one network relates to another, from the point of view of the
 * network asking. Unrelated networks have no relation at all, hence
 * ipv4_network::relationship returns an optional.
 */
enum class relation { subnet = -1, equal = 0, supernet = 1 };

/**
 * Immutable IPv4 Network
 *
 * The stored address is always the network address, i.e. any host bits
 * of the constructing address are cleared. Every "modifying" operation
 * returns a new network.
 */

class ipv4_network
{
    ipv4_address m_addr;
    ipv4_mask m_mask;

public:
    ipv4_network(const ipv4_address&, const ipv4_mask& = ipv4_mask());
    ipv4_network(const char*);
    ipv4_network(const std::string&);

    const ipv4_address& address() const noexcept { return (m_addr); }
    const ipv4_mask& netmask() const noexcept { return (m_mask); }
    uint8_t prefix_length() const noexcept { return (m_mask.prefix_length()); }

    /* Number of addresses in the network; 0 for a /0. */
    uint64_t length() const noexcept { return (m_mask.count()); }

    /* The address at the given offset from the network address */
    std::optional<ipv4_address> nth(uint64_t index) const;

    /*
     * Sibling navigation. Siblings share this network's prefix length;
     * next()/prev() also widen the result as far as its alignment allows.
     */
    std::optional<ipv4_network> next() const;
    std::optional<ipv4_network> next_sibling() const;
    std::optional<ipv4_network> prev() const;
    std::optional<ipv4_network> prev_sibling() const;
    std::optional<ipv4_network> nth_sibling(uint64_t nth,
                                            bool backward = false) const;

    /*
     * Widen the network as much as possible without changing its network
     * address, e.g. 10.0.0.128/27 grows to 10.0.0.128/25.
     */
    ipv4_network grow() const;

    /* Throws validation_error for prefix lengths larger than 32 */
    ipv4_network resize(unsigned prefix_length) const;

    /*
     * Number of /prefix_length subnets this network holds. Returns 0 if the
     * network can't be split that way or the count won't fit in 32 bits.
     */
    uint32_t subnet_count(unsigned prefix_length) const;

    std::optional<ipv4_network> nth_subnet(unsigned prefix_length,
                                           uint32_t index) const;

    /*
     * Merge two sibling networks into their common parent. A network
     * merged with itself also yields its parent.
     */
    std::optional<ipv4_network> summarize(const ipv4_network& other) const;

    std::optional<relation> relationship(const ipv4_network& other) const;

    /*
     * Partition this network using the given subnets, filling any gaps
     * between them with the largest possible blocks. Entries that are not
     * subnets of this network are ignored. An empty result is returned
     * when no entry is a subnet of this network.
     *
     * A non-zero max_blocks stops the walk as soon as the partition holds
     * more than max_blocks networks; the result is then incomplete and
     * exactly max_blocks + 1 long.
     */
    std::vector<ipv4_network> fill(const std::vector<ipv4_network>&,
                                   size_t max_blocks = 0) const;

    constexpr static uint8_t max_prefix_length = ipv4_mask::max_prefix_length;
};

/* Accepts "a.b.c.d/len", "a.b.c.d m.m.m.m" or a bare address (/32) */
tl::expected<ipv4_network, std::string> parse_ipv4_network(std::string_view);

std::string to_string(const ipv4_network&);

/* Network address followed by the dotted netmask, e.g. "10.0.0.0 255.0.0.0" */
std::string to_extended_string(const ipv4_network&);

inline std::ostream& operator<<(std::ostream& os, const ipv4_network& net)
{
    os << to_string(net);
    return (os);
}

/*
 * Order by network address, then by mask. Networks sharing an address
 * sort from smallest to largest, e.g. 10.0.0.0/26 < 10.0.0.0/24.
 */
int compare(const ipv4_network&, const ipv4_network&);

inline bool operator==(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) == 0;
}

inline bool operator!=(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) != 0;
}

inline bool operator<(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) < 0;
}

inline bool operator>(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) > 0;
}

inline bool operator<=(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) <= 0;
}

inline bool operator>=(const ipv4_network& lhs, const ipv4_network& rhs)
{
    return compare(lhs, rhs) >= 0;
}

} // namespace libipam::type

#endif /* _LIB_IPAM_TYPE_IPV4_NETWORK_HPP_ */
