#include <algorithm>
#include <iterator>

#include "core/ipam_log.h"
#include "ipam/type/ipv4_network_list.hpp"

namespace libipam::type {

void sort(std::vector<ipv4_network>& list)
{
    std::stable_sort(
        std::begin(list), std::end(list), [](const auto& lhs, const auto& rhs) {
            return (compare(lhs, rhs) < 0);
        });
}

std::vector<ipv4_network>
discard_subnets(const std::vector<ipv4_network>& list)
{
    auto redundant = [&](size_t idx) {
        const auto& net = list[idx];
        for (size_t other = 0; other < list.size(); other++) {
            if (other == idx) { continue; }

            auto rel = list[other].relationship(net);
            if (rel == relation::supernet) { return (true); }
            /* Keep the first of any duplicates */
            if (rel == relation::equal && other < idx) { return (true); }
        }
        return (false);
    };

    auto keepers = std::vector<ipv4_network>{};
    for (size_t idx = 0; idx < list.size(); idx++) {
        if (!redundant(idx)) { keepers.push_back(list[idx]); }
    }

    return (keepers);
}

std::vector<ipv4_network> summarize(const std::vector<ipv4_network>& list)
{
    auto nets = discard_subnets(list);
    sort(nets);

    /*
     * Merging a pair may create a network that can be merged with its
     * predecessor, so keep going until a pass changes nothing.
     */
    auto merged = true;
    while (merged) {
        merged = false;

        auto output = std::vector<ipv4_network>{};
        for (auto& net : nets) {
            if (!output.empty()) {
                if (auto parent = output.back().summarize(net)) {
                    output.back() = *parent;
                    merged = true;
                    continue;
                }
            }
            output.push_back(net);
        }

        nets.swap(output);
    }

    return (nets);
}

tl::expected<std::vector<ipv4_network>, std::string>
fill(const ipv4_network& parent,
     const std::vector<ipv4_network>& list,
     const fill_limits& limits)
{
    auto filled = parent.fill(list, limits.max_blocks);
    if (limits.max_blocks && filled.size() > limits.max_blocks) {
        IPAM_LOG(IPAM_LOG_WARNING,
                 "Partition of %s needs more than %zu networks\n",
                 to_string(parent).c_str(),
                 limits.max_blocks);
        return (tl::make_unexpected("Partition of " + to_string(parent)
                                    + " needs more than "
                                    + std::to_string(limits.max_blocks)
                                    + " networks"));
    }

    return (filled);
}

} // namespace libipam::type
