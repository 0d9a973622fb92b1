#ifndef _IPAM_CONFIG_FILE_HPP_
#define _IPAM_CONFIG_FILE_HPP_

#ifdef __cplusplus
#include <optional>
#include <string>
#include <string_view>
#include "tl/expected.hpp"
#include "yaml-cpp/yaml.h"
#endif /* ifdef __cplusplus */

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Find configuration file CLI argument and, if found, load it.
 * Function will load, parse, and run some sanity checks on the file.
 *
 * @param[in] argc
 *   number of cli arguments
 * @param[in] argv
 *   array of cli strings
 *
 * @return
 *  If no errors occur return 0, an errno value otherwise.
 *
 * @note users are allowed to not specify a configuration file.
 *   In this case the function returns 0.
 */
int ipam_config_file_find(int argc, char* const argv[]);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus
namespace ipam::config::file {

/*
 * Get configuration file name.
 *
 * @return
 *  name of the currently loaded configuration file, if any.
 */
std::string_view ipam_config_get_file_name();

/*
 * Load and check the given configuration file. A valid `core.log.level`
 * value is applied to the logging subsystem.
 *
 * @return
 *  nothing on success, a description of the problem otherwise.
 */
tl::expected<void, std::string> ipam_config_load(std::string_view file_name);

/*
 * Forget any loaded configuration.
 */
void ipam_config_clear();

/*
 * Get configuration parameter(s) for the specified path.
 * @param[in]  period-deliniated path to the requested parameter node
 *
 * @return
 *  a YAML::Node object representing configuration prameters, if any.
 *
 */
std::optional<YAML::Node> ipam_config_get_param(std::string_view param);

/*
 * Get a specific configuration parameter.
 * @param[in]  period-deliniated path to the requested parameter.
 *
 * @note this will throw on any type conversion error. YAML::BadConversion.
 *
 * @return
 *  std::optional<> object that contains the requested value if it exists,
 *  otherwise empty.
 *
 */
template <typename T>
std::optional<T> ipam_config_get_param(std::string_view param)
{
    auto res = ipam_config_get_param(param);
    if (!res) { return (std::nullopt); }

    auto node = *res;
    if (node.IsNull()) { return (std::nullopt); }

    /* This can throw a YAML::BadConversion exception. */
    return (std::make_optional(node.as<T>()));
}

} // namespace ipam::config::file
#endif /* ifdef __cplusplus */

#endif /* _IPAM_CONFIG_FILE_HPP_ */
