#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>
#include <string_view>

#include <strings.h>

#include "core/ipam_log.h"

namespace ipam::log {

static std::atomic<int> log_level{IPAM_LOG_INFO};
static std::atomic<FILE*> log_stream{nullptr};
static std::mutex log_mutex;

constexpr static std::array<std::string_view, IPAM_LOG_MAX> level_names = {
    "none", "critical", "error", "warning", "info", "debug", "trace"};

static FILE* stream()
{
    auto s = log_stream.load(std::memory_order_relaxed);
    return (s ? s : stderr);
}

/* e.g. 2026-10-19T18:51:03.117Z */
static std::string timestamp()
{
    using namespace std::chrono;
    auto now = system_clock::now();
    auto secs = system_clock::to_time_t(now);
    auto msecs =
        duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    auto tm = std::tm{};
    gmtime_r(&secs, &tm);

    auto buffer = std::array<char, 32>{};
    auto length = strftime(buffer.data(), buffer.size(), "%FT%T", &tm);
    snprintf(buffer.data() + length,
             buffer.size() - length,
             ".%03dZ",
             static_cast<int>(msecs));
    return (std::string(buffer.data()));
}

} // namespace ipam::log

extern "C" {

enum ipam_log_level ipam_log_level_get(void)
{
    return (static_cast<enum ipam_log_level>(
        ipam::log::log_level.load(std::memory_order_relaxed)));
}

void ipam_log_level_set(enum ipam_log_level level)
{
    ipam::log::log_level.store(level, std::memory_order_relaxed);
}

enum ipam_log_level parse_log_optarg(const char* arg)
{
    if (!arg || !*arg) { return (IPAM_LOG_NONE); }

    char* end = nullptr;
    auto value = strtol(arg, &end, 10);
    if (*end == '\0') {
        return (value > IPAM_LOG_NONE && value < IPAM_LOG_MAX
                    ? static_cast<enum ipam_log_level>(value)
                    : IPAM_LOG_NONE);
    }

    for (int level = IPAM_LOG_CRITICAL; level < IPAM_LOG_MAX; level++) {
        if (strcasecmp(arg, ipam::log::level_names[level].data()) == 0) {
            return (static_cast<enum ipam_log_level>(level));
        }
    }

    return (IPAM_LOG_NONE);
}

enum ipam_log_level ipam_log_level_find(int argc, char* const argv[])
{
    for (int idx = 0; idx < argc - 1; idx++) {
        if (strcmp(argv[idx], "--core.log.level") == 0
            || strcmp(argv[idx], "-l") == 0) {
            return (parse_log_optarg(argv[idx + 1]));
        }
    }

    return (IPAM_LOG_NONE);
}

void ipam_log_function_name(const char* signature, char* function)
{
    auto input = std::string_view(signature);

    /* The argument list starts at the first parenthesis outside of <> */
    auto end = input.size();
    int depth = 0;
    for (size_t idx = 0; idx < input.size(); idx++) {
        if (input[idx] == '<') {
            depth++;
        } else if (input[idx] == '>') {
            depth--;
        } else if (input[idx] == '(' && depth == 0) {
            end = idx;
            break;
        }
    }

    /* ...and the name starts after the last space outside of <> before it */
    auto begin = size_t{0};
    depth = 0;
    for (auto idx = end; idx > 0; idx--) {
        auto c = input[idx - 1];
        if (c == '>') {
            depth++;
        } else if (c == '<') {
            depth--;
        } else if (c == ' ' && depth == 0) {
            begin = idx;
            break;
        }
    }

    auto name = input.substr(begin, end - begin);
    memcpy(function, name.data(), name.size());
    function[name.size()] = '\0';
}

int ipam_vlog(enum ipam_log_level level,
              const char* tag,
              const char* format,
              va_list argp)
{
    if (level <= IPAM_LOG_NONE || level >= IPAM_LOG_MAX) { return (EINVAL); }

    auto stamp = ipam::log::timestamp();

    auto guard = std::lock_guard<std::mutex>(ipam::log::log_mutex);
    auto s = ipam::log::stream();
    if (fprintf(s,
                "[%s] %s %s: ",
                stamp.c_str(),
                ipam::log::level_names[level].data(),
                tag ? tag : "")
            < 0
        || vfprintf(s, format, argp) < 0) {
        return (EIO);
    }

    return (0);
}

int ipam_log(enum ipam_log_level level, const char* tag, const char* format, ...)
{
    va_list argp;
    va_start(argp, format);
    auto error = ipam_vlog(level, tag, format, argp);
    va_end(argp);

    return (error);
}

int ipam_log_init(FILE* stream)
{
    ipam::log::log_stream.store(stream, std::memory_order_relaxed);
    return (0);
}

void ipam_log_finish(void)
{
    auto guard = std::lock_guard<std::mutex>(ipam::log::log_mutex);
    fflush(ipam::log::stream());
}

}
