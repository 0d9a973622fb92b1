#ifndef _IPAM_CONFIG_LIMITS_HPP_
#define _IPAM_CONFIG_LIMITS_HPP_

#include <string>

#include "tl/expected.hpp"

#include "ipam/type/ipv4_network_list.hpp"

namespace ipam::config {

/*
 * Build fill limits from the `ipam.fill.max-blocks` configuration value.
 * Missing values leave the corresponding limit unbounded.
 */
tl::expected<libipam::type::fill_limits, std::string> fill_limits_from_config();

} // namespace ipam::config

#endif /* _IPAM_CONFIG_LIMITS_HPP_ */
