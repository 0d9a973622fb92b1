#include <algorithm>
#include <limits>

#include "core/ipam_log.h"
#include "ipam/type/ipv4_network.hpp"
#include "ipam/type/ipv4_network_list.hpp"
#include "ipam/type/validation_error.hpp"

namespace libipam::type {

constexpr static std::string_view whitespace(" \t\r\n");

static std::string_view trim(std::string_view input)
{
    auto beg = input.find_first_not_of(whitespace);
    if (beg == std::string_view::npos) { return (std::string_view{}); }
    auto end = input.find_last_not_of(whitespace);
    return (input.substr(beg, end - beg + 1));
}

static ipv4_network from_string_or_throw(std::string_view input)
{
    auto net = parse_ipv4_network(input);
    if (!net) { throw validation_error(net.error()); }
    return (*net);
}

/* One past the last address of the network, hence the 64 bit type */
static uint64_t end_of(const ipv4_network& net)
{
    return (uint64_t{net.address().data()}
            + (uint64_t{1} << (ipv4_network::max_prefix_length
                               - net.prefix_length())));
}

ipv4_network::ipv4_network(const ipv4_address& addr, const ipv4_mask& mask)
    : m_addr(addr.data() & mask.data())
    , m_mask(mask)
{}

ipv4_network::ipv4_network(const char* input)
    : ipv4_network(from_string_or_throw(input))
{}

ipv4_network::ipv4_network(const std::string& input)
    : ipv4_network(from_string_or_throw(input))
{}

std::optional<ipv4_address> ipv4_network::nth(uint64_t index) const
{
    if (index >= length()) { return (std::nullopt); }
    return (ipv4_address(static_cast<uint32_t>(m_addr.data() + index)));
}

std::optional<ipv4_network> ipv4_network::next() const
{
    auto net = nth_sibling(1);
    if (!net) { return (std::nullopt); }
    return (net->grow());
}

std::optional<ipv4_network> ipv4_network::next_sibling() const
{
    return (nth_sibling(1));
}

std::optional<ipv4_network> ipv4_network::prev() const
{
    return (grow().nth_sibling(1, true));
}

std::optional<ipv4_network> ipv4_network::prev_sibling() const
{
    return (nth_sibling(1, true));
}

std::optional<ipv4_network> ipv4_network::nth_sibling(uint64_t nth,
                                                      bool backward) const
{
    /*
     * Work in units of this network's size: shift the host bits away,
     * step by nth and shift back. A /0 has a single position.
     */
    auto shift = max_prefix_length - prefix_length();
    auto index = uint64_t{m_addr.data()} >> shift;
    auto last = uint64_t{ipv4_address::max_value} >> shift;

    if (backward) {
        if (nth > index) { return (std::nullopt); }
        index -= nth;
    } else {
        if (nth > last - index) { return (std::nullopt); }
        index += nth;
    }

    return (ipv4_network(ipv4_address(static_cast<uint32_t>(index << shift)),
                         m_mask));
}

ipv4_network ipv4_network::grow() const
{
    auto addr = m_addr.data();
    auto mask = m_mask.data();
    auto prefix = prefix_length();

    /* Stop as soon as a wider mask would drop a one bit from the address */
    while (prefix > 0) {
        mask <<= 1;
        if ((addr | mask) != mask) { break; }
        prefix--;
    }

    return (ipv4_network(m_addr, ipv4_mask(prefix)));
}

ipv4_network ipv4_network::resize(unsigned prefix_length) const
{
    return (ipv4_network(m_addr, ipv4_mask(prefix_length)));
}

uint32_t ipv4_network::subnet_count(unsigned prefix_length) const
{
    if (prefix_length <= this->prefix_length()
        || prefix_length > max_prefix_length
        || prefix_length - this->prefix_length() >= 32) {
        return (0);
    }

    return (uint32_t{1} << (prefix_length - this->prefix_length()));
}

std::optional<ipv4_network> ipv4_network::nth_subnet(unsigned prefix_length,
                                                     uint32_t index) const
{
    auto count = subnet_count(prefix_length);
    if (count == 0 || index >= count) { return (std::nullopt); }

    auto first = ipv4_network(m_addr, ipv4_mask(prefix_length));
    return (first.nth_sibling(index));
}

std::optional<ipv4_network>
ipv4_network::summarize(const ipv4_network& other) const
{
    if (prefix_length() != other.prefix_length() || prefix_length() == 0) {
        return (std::nullopt);
    }

    /* Siblings only differ in the last bit of their prefix */
    auto shift = max_prefix_length - prefix_length() + 1;
    if ((uint64_t{m_addr.data()} >> shift)
        != (uint64_t{other.m_addr.data()} >> shift)) {
        return (std::nullopt);
    }

    return (resize(prefix_length() - 1));
}

std::optional<relation>
ipv4_network::relationship(const ipv4_network& other) const
{
    if (m_addr == other.m_addr) {
        return (static_cast<relation>(compare(m_mask, other.m_mask)));
    }

    /*
     * Or-ing in a hostmask yields the broadcast address of the network the
     * hostmask belongs to; related networks share it.
     */
    auto hostmask = m_mask.hostmask();
    auto other_hostmask = other.m_mask.hostmask();
    if ((m_addr.data() | hostmask) == (other.m_addr.data() | hostmask)) {
        return (relation::supernet);
    } else if ((m_addr.data() | other_hostmask)
               == (other.m_addr.data() | other_hostmask)) {
        return (relation::subnet);
    }

    return (std::nullopt);
}

/*
 * Collect at most budget blocks between limit and the start network,
 * walking down from start. The result is in ascending order.
 */
static std::vector<ipv4_network>
backfill(const ipv4_network& start, uint32_t limit, size_t budget)
{
    auto nets = std::vector<ipv4_network>{};
    auto cur = start;
    while (nets.size() < budget) {
        auto net = cur.prev();
        if (!net || net->address().data() < limit) { break; }
        nets.push_back(*net);
        cur = *net;
    }

    std::reverse(std::begin(nets), std::end(nets));
    return (nets);
}

/*
 * Append the blocks between the start network and limit to the output,
 * until the output holds budget networks. A grown block that would reach
 * past limit is narrowed until it fits.
 */
static void fwdfill(const ipv4_network& start,
                    uint64_t limit,
                    size_t budget,
                    std::vector<ipv4_network>& output)
{
    auto cur = start;
    while (output.size() < budget) {
        auto net = cur.next();
        if (!net || net->address().data() >= limit) { break; }
        while (end_of(*net) > limit) {
            net = net->resize(net->prefix_length() + 1);
        }
        output.push_back(*net);
        cur = *net;
    }
}

std::vector<ipv4_network>
ipv4_network::fill(const std::vector<ipv4_network>& list,
                   size_t max_blocks) const
{
    auto subnets = std::vector<ipv4_network>{};
    for (const auto& net : discard_subnets(list)) {
        if (relationship(net) == relation::supernet) {
            subnets.push_back(net);
        }
    }

    IPAM_LOG(IPAM_LOG_DEBUG,
             "Filling %s with %zu of %zu candidate networks\n",
             to_string(*this).c_str(),
             subnets.size(),
             list.size());

    if (subnets.empty()) { return {}; }

    sort(subnets);

    /* One block over the limit is enough to tell the caller it was hit */
    auto budget = (max_blocks && max_blocks < std::numeric_limits<size_t>::max()
                       ? max_blocks + 1
                       : std::numeric_limits<size_t>::max());

    auto filled = std::vector<ipv4_network>{};
    if (subnets.front().address() != m_addr) {
        filled = backfill(subnets.front(), m_addr.data(), budget);
    }

    auto ceiling = end_of(*this);
    for (size_t idx = 0; idx < subnets.size() && filled.size() < budget;
         idx++) {
        filled.push_back(subnets[idx]);
        auto limit = (idx + 1 < subnets.size()
                          ? uint64_t{subnets[idx + 1].address().data()}
                          : ceiling);
        fwdfill(subnets[idx], limit, budget, filled);
    }

    IPAM_LOG(IPAM_LOG_TRACE,
             "Filled %s with %zu networks\n",
             to_string(*this).c_str(),
             filled.size());

    return (filled);
}

tl::expected<ipv4_network, std::string> parse_ipv4_network(std::string_view input)
{
    auto text = trim(input);
    auto addr_text = text;
    auto mask_text = std::string_view("32");

    if (auto pos = text.find('/'); pos != std::string_view::npos) {
        addr_text = text.substr(0, pos);
        mask_text = text.substr(pos + 1);
    } else if (pos = text.find_first_of(whitespace);
               pos != std::string_view::npos) {
        addr_text = text.substr(0, pos);
        mask_text = trim(text.substr(pos));
    }

    auto addr = parse_ipv4_address(addr_text);
    if (!addr) {
        IPAM_LOG(IPAM_LOG_DEBUG, "%s\n", addr.error().c_str());
        return (tl::make_unexpected(addr.error()));
    }

    auto mask = parse_ipv4_mask(mask_text);
    if (!mask) {
        IPAM_LOG(IPAM_LOG_DEBUG, "%s\n", mask.error().c_str());
        return (tl::make_unexpected(mask.error()));
    }

    return (ipv4_network(*addr, *mask));
}

std::string to_string(const ipv4_network& network)
{
    return (to_string(network.address()) + to_string(network.netmask()));
}

std::string to_extended_string(const ipv4_network& network)
{
    return (to_string(network.address()) + " "
            + to_extended_string(network.netmask()));
}

int compare(const ipv4_network& lhs, const ipv4_network& rhs)
{
    if (auto result = compare(lhs.address(), rhs.address()); result != 0) {
        return (result);
    }
    return (compare(lhs.netmask(), rhs.netmask()));
}

} // namespace libipam::type
