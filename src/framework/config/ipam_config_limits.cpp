#include "ipam_config_file.hpp"
#include "ipam_config_limits.hpp"

namespace ipam::config {

constexpr static std::string_view max_blocks_path("ipam.fill.max-blocks");

tl::expected<libipam::type::fill_limits, std::string> fill_limits_from_config()
{
    auto limits = libipam::type::fill_limits{};

    try {
        auto max_blocks = file::ipam_config_get_param<long>(max_blocks_path);
        if (max_blocks) {
            if (*max_blocks < 0) {
                return (tl::make_unexpected(std::string(max_blocks_path)
                                            + " must not be negative"));
            }
            limits.max_blocks = static_cast<size_t>(*max_blocks);
        }
    } catch (const YAML::BadConversion& e) {
        return (tl::make_unexpected(std::string(max_blocks_path)
                                    + " is not an integer: " + e.what()));
    }

    return (limits);
}

} // namespace ipam::config
