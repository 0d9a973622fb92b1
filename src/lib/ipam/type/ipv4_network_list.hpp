#ifndef _LIB_IPAM_TYPE_IPV4_NETWORK_LIST_HPP_
#define _LIB_IPAM_TYPE_IPV4_NETWORK_LIST_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "tl/expected.hpp"

#include "ipam/type/ipv4_network.hpp"

namespace libipam::type {

/* Stable sort, see compare(const ipv4_network&, const ipv4_network&) */
void sort(std::vector<ipv4_network>&);

/*
 * Return a copy of the list without any network that is contained in
 * another one. Duplicates are dropped, too. Survivors keep their order.
 */
std::vector<ipv4_network> discard_subnets(const std::vector<ipv4_network>&);

/*
 * Reduce the list to the smallest set of networks covering exactly the
 * same addresses, merging sibling networks wherever possible. The result
 * is sorted.
 */
std::vector<ipv4_network> summarize(const std::vector<ipv4_network>&);

struct fill_limits
{
    size_t max_blocks = 0; /**< 0 == unbounded */
};

/*
 * Bounded version of ipv4_network::fill. The walk stops as soon as the
 * partition would need more than limits.max_blocks networks, and the
 * call fails without returning a partial partition.
 */
tl::expected<std::vector<ipv4_network>, std::string>
fill(const ipv4_network& parent,
     const std::vector<ipv4_network>& list,
     const fill_limits& limits);

} // namespace libipam::type

#endif /* _LIB_IPAM_TYPE_IPV4_NETWORK_LIST_HPP_ */
