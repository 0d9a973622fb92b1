#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>

#include <unistd.h>

#include "core/ipam_log.h"
#include "ipam_config_file.hpp"

namespace ipam::config::file {

using path_iterator = std::vector<std::string>::const_iterator;

static std::string config_file_name;
static YAML::Node config_root;
constexpr static std::string_view path_delimiter(".");

std::string_view ipam_config_get_file_name() { return (config_file_name); }

static std::vector<std::string> split_string(std::string_view input,
                                             std::string_view delimiters)
{
    std::vector<std::string> output;
    size_t beg = 0, pos = 0;
    while ((beg = input.find_first_not_of(delimiters, pos))
           != std::string::npos) {
        pos = input.find_first_of(delimiters, beg + 1);

        output.emplace_back(input.substr(beg, pos - beg));
    }
    return (output);
}

static std::optional<YAML::Node> get_param_by_path(
    const YAML::Node& parent_node, path_iterator pos, const path_iterator end)
{
    if (pos == end) { return (parent_node); }

    if (parent_node.IsMap() && parent_node[*pos]) {
        const YAML::Node child_node = parent_node[*pos];
        return (get_param_by_path(child_node, ++pos, end));
    }

    return (std::nullopt);
}

std::optional<YAML::Node> ipam_config_get_param(std::string_view path)
{
    auto path_components = split_string(path, path_delimiter);

    return (get_param_by_path(
        config_root, path_components.begin(), path_components.end()));
}

static std::optional<enum ipam_log_level>
find_log_level(const YAML::Node& root_node)
{
    auto path = split_string("core.log.level", path_delimiter);
    auto node = get_param_by_path(root_node, path.begin(), path.end());
    if (!node || !node->IsScalar()) { return (std::nullopt); }

    return (parse_log_optarg(node->Scalar().c_str()));
}

tl::expected<void, std::string> ipam_config_load(std::string_view file_name)
{
    auto name = std::string(file_name);

    // Make sure the file exists and is readable.
    if (access(name.c_str(), R_OK) == -1) {
        return (tl::make_unexpected("Error (" + std::string(strerror(errno))
                                    + ") while attempting to access config "
                                      "file: "
                                    + name));
    }

    // yaml-cpp throws exceptions when the parser runs into invalid YAML.
    YAML::Node root_node;
    try {
        root_node = YAML::LoadFile(name);
    } catch (const YAML::Exception& e) {
        return (tl::make_unexpected("Error parsing configuration file: "
                                    + std::string(e.what())));
    }

    if (!root_node.IsNull() && !root_node.IsMap()) {
        return (tl::make_unexpected("Configuration file " + name
                                    + " does not contain a YAML map"));
    }

    auto level = find_log_level(root_node);
    if (level && *level == IPAM_LOG_NONE) {
        return (tl::make_unexpected("Configuration file " + name
                                    + " contains an invalid log level"));
    }

    // We currently support two top level nodes: `core` and `ipam`.
    // Anything else is most likely a typo, so warn about it.
    auto top_level_nodes =
        std::initializer_list<std::string_view>{"core", "ipam"};

    for (const auto& node : root_node) {
        auto key = node.first.as<std::string>();
        if (std::find(std::begin(top_level_nodes),
                      std::end(top_level_nodes),
                      key)
            == std::end(top_level_nodes)) {
            IPAM_LOG(IPAM_LOG_WARNING,
                     "Configuration file %s contains unrecognized top level "
                     "node: %s\n",
                     name.c_str(),
                     key.c_str());
        }
    }

    config_file_name = name;
    config_root.reset(root_node);
    if (level) { ipam_log_level_set(*level); }

    IPAM_LOG(IPAM_LOG_DEBUG, "Reading from configuration file %s\n", name.c_str());

    return {};
}

void ipam_config_clear()
{
    config_file_name.clear();
    config_root.reset();
}

static char* find_config_file_option(int argc, char* const argv[])
{
    for (int idx = 0; idx < argc - 1; idx++) {
        if (strcmp(argv[idx], "--config") == 0
            || strcmp(argv[idx], "-c") == 0) {
            return (argv[idx + 1]);
        }
    }

    return (nullptr);
}

} // namespace ipam::config::file

extern "C" {
int ipam_config_file_find(int argc, char* const argv[])
{
    using namespace ipam::config::file;

    char* file_name = find_config_file_option(argc, argv);

    if (!file_name) { return (0); }

    if (access(file_name, R_OK) == -1) {
        auto error = errno;
        std::cerr << "Error (" << strerror(error)
                  << ") while attempting to access config file: " << file_name
                  << std::endl;
        return (error);
    }

    if (auto result = ipam_config_load(file_name); !result) {
        std::cerr << result.error() << std::endl;
        return (EINVAL);
    }

    return (0);
}
}
