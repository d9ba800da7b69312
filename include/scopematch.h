// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef SCOPEMATCH_H
#define SCOPEMATCH_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum SCOPEMATCH_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    SCOPEMATCH_LOG_TRACE,
    SCOPEMATCH_LOG_DEBUG,
    SCOPEMATCH_LOG_INFO,
    SCOPEMATCH_LOG_WARN,
    SCOPEMATCH_LOG_ERROR,
    SCOPEMATCH_LOG_OFF,
} SCOPEMATCH_LOG_LEVEL;

/**
 * @typedef scopematch_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*scopematch_log_cb)(
    SCOPEMATCH_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * scopematch_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *scopematch_get_version();

/**
 * scopematch_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool scopematch_set_log_cb(scopematch_log_cb cb, SCOPEMATCH_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* SCOPEMATCH_H */
