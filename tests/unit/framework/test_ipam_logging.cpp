#include <array>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "catch.hpp"

#include "core/ipam_log.h"

/*
 * Points the logger at a scratch file for the lifetime of the object.
 * The destructor restores stderr and the log level even when a REQUIRE
 * bails out of the test early.
 */
struct log_capture
{
    FILE* file;
    enum ipam_log_level level;

    log_capture()
        : file(tmpfile())
        , level(ipam_log_level_get())
    {
        if (file) { ipam_log_init(file); }
    }

    log_capture(const log_capture&) = delete;
    log_capture& operator=(const log_capture&) = delete;

    ~log_capture()
    {
        ipam_log_level_set(level);
        ipam_log_finish();
        ipam_log_init(nullptr);
        if (file) { fclose(file); }
    }

    std::string contents() const
    {
        fflush(file);
        rewind(file);

        auto output = std::string{};
        auto buffer = std::array<char, 256>{};
        size_t length = 0;
        while ((length = fread(buffer.data(), 1, buffer.size(), file)) > 0) {
            output.append(buffer.data(), length);
        }
        return (output);
    }
};

TEST_CASE("check log level setter/getter", "[logging]")
{
    auto original = ipam_log_level_get();
    for (int level = IPAM_LOG_NONE; level <= IPAM_LOG_MAX; level++) {
        ipam_log_level_set(static_cast<enum ipam_log_level>(level));
        REQUIRE(ipam_log_level_get() == level);
    }
    ipam_log_level_set(original);
}

TEST_CASE("exercise logging functionality", "[logging]")
{
    log_capture capture;
    REQUIRE(capture.file);

    SECTION("verify log message submission")
    {
        REQUIRE(ipam_log(IPAM_LOG_CRITICAL, __PRETTY_FUNCTION__,
                         "This is a critical message\n")
                == 0);
        REQUIRE(ipam_log(IPAM_LOG_ERROR, __PRETTY_FUNCTION__,
                         "This is a error message\n")
                == 0);
        REQUIRE(ipam_log(IPAM_LOG_WARNING, __PRETTY_FUNCTION__,
                         "This is a warning message\n")
                == 0);
        REQUIRE(ipam_log(IPAM_LOG_INFO, __PRETTY_FUNCTION__,
                         "This is a info message\n")
                == 0);
        REQUIRE(ipam_log(IPAM_LOG_DEBUG, __PRETTY_FUNCTION__,
                         "This is a debug message\n")
                == 0);
        REQUIRE(ipam_log(IPAM_LOG_TRACE, __PRETTY_FUNCTION__,
                         "This is a trace message\n")
                == 0);

        REQUIRE(ipam_log(IPAM_LOG_NONE, "tag", "Not a real level\n") != 0);
        REQUIRE(ipam_log(IPAM_LOG_MAX, "tag", "Not a real level\n") != 0);

        auto output = capture.contents();
        REQUIRE(output.find("critical") != std::string::npos);
        REQUIRE(output.find("This is a trace message\n") != std::string::npos);
        REQUIRE(output.find("Not a real level") == std::string::npos);
    }

    SECTION("verify macro honors the log level")
    {
        ipam_log_level_set(IPAM_LOG_WARNING);
        IPAM_LOG(IPAM_LOG_INFO, "hidden %d\n", 1);
        IPAM_LOG(IPAM_LOG_ERROR, "shown %d\n", 2);

        auto output = capture.contents();
        REQUIRE(output.find("hidden 1") == std::string::npos);
        REQUIRE(output.find("error") != std::string::npos);
        REQUIRE(output.find("shown 2\n") != std::string::npos);
    }

    SECTION("verify stream and level are restored after capture")
    {
        {
            log_capture inner;
            REQUIRE(inner.file);
            ipam_log_level_set(IPAM_LOG_TRACE);
            REQUIRE(ipam_log(IPAM_LOG_INFO, "tag", "inner message\n") == 0);
            REQUIRE(inner.contents().find("inner message\n")
                    != std::string::npos);
        }

        REQUIRE(ipam_log_level_get() == capture.level);
        REQUIRE(capture.contents().find("inner message") == std::string::npos);
    }
}

TEST_CASE("check logging command line parsing function", "[logging]")
{
    /*
     * We need the const_cast to silence the compiler warning about
     * the string literal to char * const conversion.
     */
    SECTION("check long cli argument by number")
    {
        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>("--core.log.level"),
                                   const_cast<char*>("2"), nullptr};
        REQUIRE(ipam_log_level_find(args.size() - 1, args.data())
                == IPAM_LOG_ERROR);
    }

    SECTION("check long cli argument by name")
    {
        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>("--core.log.level"),
                                   const_cast<char*>("warning"), nullptr};
        REQUIRE(ipam_log_level_find(args.size() - 1, args.data())
                == IPAM_LOG_WARNING);
    }

    SECTION("check short cli argument by number")
    {
        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>("-l"),
                                   const_cast<char*>("4"), nullptr};
        REQUIRE(ipam_log_level_find(args.size() - 1, args.data())
                == IPAM_LOG_INFO);
    }

    SECTION("check short cli argument by name")
    {
        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>("-l"),
                                   const_cast<char*>("DEBUG"), nullptr};
        REQUIRE(ipam_log_level_find(args.size() - 1, args.data())
                == IPAM_LOG_DEBUG);
    }

    SECTION("check invalid and missing arguments")
    {
        REQUIRE(parse_log_optarg("verbose") == IPAM_LOG_NONE);
        REQUIRE(parse_log_optarg("7") == IPAM_LOG_NONE);
        REQUIRE(parse_log_optarg("") == IPAM_LOG_NONE);

        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>("-l"), nullptr};
        REQUIRE(ipam_log_level_find(args.size() - 1, args.data())
                == IPAM_LOG_NONE);
    }
}

TEST_CASE("check logging function signature --> string function", "[logging]")
{
    /* input, expected output pairs */
    std::vector<std::pair<const char*, const char*>> signatures = {
        {"int simple_function()", "simple_function"},
        {"unsigned int ns::simple()", "ns::simple"},
        {"std::vector<int>& crazy()", "crazy"},
        {"void some::class<some::type_a, some::type_b>::function(int x)",
         "some::class<some::type_a, some::type_b>::function"},
        {"void some::class<some::type_a, some::type_b>::function(int x) [CLASS "
         "= some::other_class]",
         "some::class<some::type_a, some::type_b>::function"},
        {"std::vector<libipam::type::ipv4_network> "
         "libipam::type::ipv4_network::fill(const "
         "std::vector<libipam::type::ipv4_network>&) const",
         "libipam::type::ipv4_network::fill"},
        {"tl::expected<std::vector<libipam::type::ipv4_network>, "
         "std::__cxx11::basic_string<char> > "
         "libipam::type::fill(const libipam::type::ipv4_network&, const "
         "std::vector<libipam::type::ipv4_network>&, const "
         "libipam::type::fill_limits&)",
         "libipam::type::fill"}};

    for (auto& pair : signatures) {
        char output[strlen(pair.first) + 1];
        ipam_log_function_name(pair.first, output);
        REQUIRE(strcmp(output, pair.second) == 0);
    }
}
