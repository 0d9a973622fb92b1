#ifndef _LIB_IPAM_TYPE_NET_TYPES_HPP_
#define _LIB_IPAM_TYPE_NET_TYPES_HPP_

#include "ipam/type/ipv4_address.hpp"
#include "ipam/type/ipv4_mask.hpp"
#include "ipam/type/ipv4_network.hpp"
#include "ipam/type/ipv4_network_list.hpp"
#include "ipam/type/validation_error.hpp"

#endif /* _LIB_IPAM_TYPE_NET_TYPES_HPP_ */
