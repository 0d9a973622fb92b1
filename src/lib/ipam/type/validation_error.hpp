#ifndef _LIB_IPAM_TYPE_VALIDATION_ERROR_HPP_
#define _LIB_IPAM_TYPE_VALIDATION_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace libipam::type {

/**
 * Thrown for malformed address/mask/network text and for prefix
 * lengths outside of [0, 32].
 */
class validation_error : public std::runtime_error
{
public:
    explicit validation_error(const std::string& what)
        : std::runtime_error(what)
    {}
};

} // namespace libipam::type

#endif /* _LIB_IPAM_TYPE_VALIDATION_ERROR_HPP_ */
