#ifndef _IPAM_LOG_H_
#define _IPAM_LOG_H_

#ifdef __cplusplus
extern "C" {
#endif

#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>

enum ipam_log_level {
    IPAM_LOG_NONE = 0,
    IPAM_LOG_CRITICAL, /**< Fatal error condition */
    IPAM_LOG_ERROR,    /**< Non-fatal error condition */
    IPAM_LOG_WARNING,  /**< Unexpected event or condition */
    IPAM_LOG_INFO,     /**< Informational messages */
    IPAM_LOG_DEBUG,    /**< Debugging messages */
    IPAM_LOG_TRACE,    /**< Trace level messages */
    IPAM_LOG_MAX,
};

/**
 * Get the application log level
 *
 * @return
 *   The current system log level
 */
enum ipam_log_level ipam_log_level_get(void);

/**
 * Set the application log level
 *
 * @param level
 *   A value between IPAM_LOG_CRITICAL (1) and IPAM_LOG_TRACE (6)
 */
void ipam_log_level_set(enum ipam_log_level level);

/**
 * Retrieve the log level from the command line
 *
 * @param[in] argc
 *   The number of cli arguments
 * @param[in] argv
 *   Array of cli strings
 *
 * @return
 *   log level found in cli arguments (may be IPAM_LOG_NONE)
 */
enum ipam_log_level ipam_log_level_find(int argc, char* const argv[]);

/**
 * Parse a log level argument to the associated enum value.
 *
 * @param[in] arg
 *   Log level argument to parse, either a name or a number
 *
 * @return
 *   log level found in arg, IPAM_LOG_NONE otherwise
 */
enum ipam_log_level parse_log_optarg(const char* arg);

/**
 * Get the full function name from the full function signature string
 *
 * @param[in] signature
 *   The full function signature
 * @param[out] function
 *   Buffer for function name; should be at least as long as signature
 */
void ipam_log_function_name(const char* signature, char* function);

/**
 * Macro to possibly write a message to the log
 * Note: this is the preferred way to do logging, since logging arguments will
 * not be evaluated unless they will actually get logged.
 *
 * @param level
 *   The level of the message
 * @param format
 *   The printf format string, followed by variable arguments
 */
#define IPAM_LOG(level, format, ...)                                           \
    do {                                                                       \
        if (level <= ipam_log_level_get()) {                                   \
            char function_[strlen(__PRETTY_FUNCTION__) + 1];                   \
            ipam_log_function_name(__PRETTY_FUNCTION__, function_);            \
            ipam_log(level, function_, format, ##__VA_ARGS__);                 \
        }                                                                      \
    } while (0)

/**
 * Write a message to the log
 *
 * @param level
 *   The level of the message
 * @param tag
 *   Additional information to add to message
 * @param format
 *   The printf format string, followed by variable arguments
 * @return
 *   -  0: Success
 *   - !0: Error
 */
int ipam_log(enum ipam_log_level level, const char* tag, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

int ipam_vlog(enum ipam_log_level level,
              const char* tag,
              const char* format,
              va_list argp);

/**
 * Intialize the logging subsystem
 *
 * @param stream
 *   The stream log messages are written to; NULL selects stderr
 * @return
 *   - 0: Success
 *   -!0: Error
 */
int ipam_log_init(FILE* stream);

/**
 * Flush any buffered log messages
 */
void ipam_log_finish(void);

#ifdef __cplusplus
}
#endif

#endif
