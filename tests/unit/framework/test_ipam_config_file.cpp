#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <unistd.h>

#include "catch.hpp"

#include "config/ipam_config_file.hpp"
#include "config/ipam_config_limits.hpp"
#include "core/ipam_log.h"

using namespace ipam::config::file;

/* Scratch YAML file that is removed when it goes out of scope */
struct temp_config
{
    std::string path;

    explicit temp_config(const std::string& contents)
    {
        char name[] = "/tmp/ipam_config_XXXXXX";
        auto fd = mkstemp(name);
        REQUIRE(fd != -1);
        REQUIRE(write(fd, contents.data(), contents.size())
                == static_cast<ssize_t>(contents.size()));
        close(fd);
        path = name;
    }

    ~temp_config() { unlink(path.c_str()); }
};

TEST_CASE("check config file loading", "[config file]")
{
    auto original = ipam_log_level_get();
    ipam_config_clear();

    SECTION("load valid configuration")
    {
        temp_config config("core:\n"
                           "  log:\n"
                           "    level: debug\n"
                           "ipam:\n"
                           "  fill:\n"
                           "    max-blocks: 16\n");

        auto result = ipam_config_load(config.path);
        REQUIRE(result);
        REQUIRE(ipam_config_get_file_name() == config.path);
        REQUIRE(ipam_log_level_get() == IPAM_LOG_DEBUG);

        auto level = ipam_config_get_param<std::string>("core.log.level");
        REQUIRE(level);
        REQUIRE(*level == "debug");

        auto blocks = ipam_config_get_param<int>("ipam.fill.max-blocks");
        REQUIRE(blocks);
        REQUIRE(*blocks == 16);

        auto fill = ipam_config_get_param("ipam.fill");
        REQUIRE(fill);
        REQUIRE(fill->IsMap());

        REQUIRE(!ipam_config_get_param("ipam.fill.max-depth"));
        REQUIRE(!ipam_config_get_param("ipam.fill.max-blocks.value"));
        REQUIRE(!ipam_config_get_param<int>("core.log.stream"));
        REQUIRE_THROWS_AS(ipam_config_get_param<int>("core.log.level"),
                          YAML::BadConversion);
    }

    SECTION("unknown top level nodes are tolerated")
    {
        temp_config config("ipam:\n"
                           "  fill:\n"
                           "    max-blocks: 4\n"
                           "resources:\n"
                           "  pool: 10.0.0.0/8\n");

        REQUIRE(ipam_config_load(config.path));
        REQUIRE(ipam_config_get_param<std::string>("resources.pool")
                == "10.0.0.0/8");
    }

    SECTION("empty file is a valid configuration")
    {
        temp_config config("");
        REQUIRE(ipam_config_load(config.path));
        REQUIRE(!ipam_config_get_param("core"));
    }

    SECTION("reject unusable files")
    {
        REQUIRE(!ipam_config_load("/nonexistent/ipam/config.yaml"));

        temp_config invalid_yaml("core: [unterminated\n");
        auto result = ipam_config_load(invalid_yaml.path);
        REQUIRE(!result);
        REQUIRE(result.error().find("Error parsing") != std::string::npos);

        temp_config not_a_map("- 10.0.0.0/8\n- 192.168.0.0/16\n");
        REQUIRE(!ipam_config_load(not_a_map.path));

        temp_config bad_level("core:\n"
                              "  log:\n"
                              "    level: loud\n");
        REQUIRE(!ipam_config_load(bad_level.path));
        REQUIRE(ipam_log_level_get() == original);
    }

    SECTION("failed load keeps the previous configuration")
    {
        temp_config good("ipam:\n"
                         "  fill:\n"
                         "    max-blocks: 8\n");
        REQUIRE(ipam_config_load(good.path));

        temp_config bad("ipam: {fill: [\n");
        REQUIRE(!ipam_config_load(bad.path));

        REQUIRE(ipam_config_get_file_name() == good.path);
        REQUIRE(ipam_config_get_param<int>("ipam.fill.max-blocks") == 8);
    }

    SECTION("clear forgets everything")
    {
        temp_config config("ipam:\n"
                           "  fill:\n"
                           "    max-blocks: 8\n");
        REQUIRE(ipam_config_load(config.path));

        ipam_config_clear();
        REQUIRE(ipam_config_get_file_name().empty());
        REQUIRE(!ipam_config_get_param("ipam"));
    }

    ipam_config_clear();
    ipam_log_level_set(original);
}

TEST_CASE("check config file command line parsing", "[config file]")
{
    auto original = ipam_log_level_get();
    ipam_config_clear();

    /*
     * We need the const_cast to silence the compiler warning about
     * the string literal to char * const conversion.
     */
    SECTION("no config option is not an error")
    {
        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>("-l"),
                                   const_cast<char*>("info"), nullptr};
        REQUIRE(ipam_config_file_find(args.size() - 1, args.data()) == 0);
        REQUIRE(ipam_config_get_file_name().empty());
    }

    SECTION("long and short options load the file")
    {
        temp_config config("ipam:\n"
                           "  fill:\n"
                           "    max-blocks: 3\n");

        auto option = GENERATE(as<std::string>{}, "--config", "-c");
        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>(option.c_str()),
                                   const_cast<char*>(config.path.c_str()),
                                   nullptr};
        REQUIRE(ipam_config_file_find(args.size() - 1, args.data()) == 0);
        REQUIRE(ipam_config_get_file_name() == config.path);
    }

    SECTION("missing and invalid files are reported")
    {
        std::vector<char*> missing = {
            const_cast<char*>("test_program"),
            const_cast<char*>("--config"),
            const_cast<char*>("/nonexistent/ipam/config.yaml"),
            nullptr};
        REQUIRE(ipam_config_file_find(missing.size() - 1, missing.data())
                == ENOENT);

        temp_config config("core: [unterminated\n");
        std::vector<char*> invalid = {const_cast<char*>("test_program"),
                                      const_cast<char*>("-c"),
                                      const_cast<char*>(config.path.c_str()),
                                      nullptr};
        REQUIRE(ipam_config_file_find(invalid.size() - 1, invalid.data())
                == EINVAL);
    }

    ipam_config_clear();
    ipam_log_level_set(original);
}

TEST_CASE("check fill limits from configuration", "[config file]")
{
    ipam_config_clear();

    SECTION("no configuration means no limit")
    {
        auto limits = ipam::config::fill_limits_from_config();
        REQUIRE(limits);
        REQUIRE(limits->max_blocks == 0);
    }

    SECTION("configured limit")
    {
        temp_config config("ipam:\n"
                           "  fill:\n"
                           "    max-blocks: 64\n");
        REQUIRE(ipam_config_load(config.path));

        auto limits = ipam::config::fill_limits_from_config();
        REQUIRE(limits);
        REQUIRE(limits->max_blocks == 64);
    }

    SECTION("negative limit")
    {
        temp_config config("ipam:\n"
                           "  fill:\n"
                           "    max-blocks: -1\n");
        REQUIRE(ipam_config_load(config.path));

        auto limits = ipam::config::fill_limits_from_config();
        REQUIRE(!limits);
        REQUIRE(limits.error().find("must not be negative")
                != std::string::npos);
    }

    SECTION("non-numeric limit")
    {
        temp_config config("ipam:\n"
                           "  fill:\n"
                           "    max-blocks: plenty\n");
        REQUIRE(ipam_config_load(config.path));

        auto limits = ipam::config::fill_limits_from_config();
        REQUIRE(!limits);
        REQUIRE(limits.error().find("is not an integer") != std::string::npos);
    }

    ipam_config_clear();
}
