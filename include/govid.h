// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef GOVID_H
#define GOVID_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#define GOVID_DEFAULT_SEPARATOR '-'

/**
 * @enum GOVID_ID_KIND
 *
 * Identifier kinds supported by the library.
 **/
typedef enum
{
    // US Social Security Number, 123-45-6789
    GOVID_ID_US_SSN = 0,
    // Canadian Social Insurance Number, 123-456-789
    GOVID_ID_CA_SIN = 1,
} GOVID_ID_KIND;

/**
 * @enum GOVID_OUTCOME
 *
 * Result of validating an identifier. When a value violates more than one
 * rule, the outcome declared first is reported.
 **/
typedef enum
{
    GOVID_OUTCOME_VALIDATION_PASSED = 1,
    // Empty or whitespace only
    GOVID_OUTCOME_EMPTY,
    // Neither the digits-only nor the separated length
    GOVID_OUTCOME_INVALID_LENGTH,
    // Unexpected character in a separator position
    GOVID_OUTCOME_INVALID_SEPARATOR_ENCOUNTERED,
    // Character other than 0-9 outside of a separator position
    GOVID_OUTCOME_INVALID_CHARACTER_ENCOUNTERED,
    // SSN area number is 000, 666 or 900-999
    GOVID_OUTCOME_INVALID_AREA_NUMBER,
    // SSN group number is 00
    GOVID_OUTCOME_INVALID_GROUP_NUMBER,
    // SSN serial number is 0000
    GOVID_OUTCOME_INVALID_SERIAL_NUMBER,
    // SSN made of nine identical digits
    GOVID_OUTCOME_ALL_IDENTICAL_DIGITS,
    // SSN is 123456789
    GOVID_OUTCOME_INVALID_RUN,
    // SIN starts with 0 or 8
    GOVID_OUTCOME_INVALID_PROVINCE,
    // SIN Luhn check digit mismatch
    GOVID_OUTCOME_INVALID_CHECK_DIGIT,
} GOVID_OUTCOME;

/**
 * @enum GOVID_RET_CODE
 *
 * Codes returned by the library functions.
 **/
typedef enum
{
    GOVID_ERR_INTERNAL         = -4,
    GOVID_ERR_BUFFER_TOO_SMALL = -3,
    // The value didn't pass validation, the outcome provides the reason
    GOVID_ERR_INVALID_OBJECT   = -2,
    // Misuse of the API, e.g. null pointers, digit separator or blank mask
    GOVID_ERR_INVALID_ARGUMENT = -1,
    GOVID_OK                   = 0,
} GOVID_RET_CODE;

/**
 * @enum GOVID_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    GOVID_LOG_TRACE,
    GOVID_LOG_DEBUG,
    GOVID_LOG_INFO,
    GOVID_LOG_WARN,
    GOVID_LOG_ERROR,
    GOVID_LOG_OFF,
} GOVID_LOG_LEVEL;

/**
 * @typedef govid_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message, NUL-terminated.
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*govid_log_cb)(
    GOVID_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * govid_validate
 *
 * Validate an identifier.
 *
 * @param kind The identifier kind.
 * @param str The identifier, digits only or with separators. (nullable if len is 0)
 * @param len The length of str.
 * @param separator Expected separator character, must not be a digit.
 * @param outcome Validation outcome. (nonnull)
 *
 * @return GOVID_OK if the value was evaluated, regardless of the outcome,
 *         GOVID_ERR_INVALID_ARGUMENT on misuse.
 **/
GOVID_RET_CODE govid_validate(GOVID_ID_KIND kind, const char *str, size_t len, char separator,
    GOVID_OUTCOME *outcome);

/**
 * govid_canonicalize
 *
 * Validate an identifier and write its digits-only representation.
 *
 * @param kind The identifier kind.
 * @param str The identifier, digits only or with separators. (nullable if len is 0)
 * @param len The length of str.
 * @param separator Expected separator character, must not be a digit.
 * @param outcome Validation outcome. (nullable)
 * @param output Buffer receiving the NUL-terminated canonical value. (nonnull)
 * @param output_len Size of the output buffer on input, length of the
 *                   canonical value (excluding NUL terminator) on output. (nonnull)
 *
 * @return GOVID_OK on success, GOVID_ERR_INVALID_OBJECT if validation failed.
 **/
GOVID_RET_CODE govid_canonicalize(GOVID_ID_KIND kind, const char *str, size_t len,
    char separator, GOVID_OUTCOME *outcome, char *output, size_t *output_len);

/**
 * govid_format
 *
 * Format a digits-only identifier using a mask, '_' is replaced by the next
 * digit and '\' escapes the following mask character.
 *
 * @param kind The identifier kind.
 * @param canonical The digits-only identifier, it must pass validation.
 * @param len The length of canonical.
 * @param mask NUL-terminated mask, or NULL to use the default mask of the kind.
 * @param output Buffer receiving the NUL-terminated formatted value. (nonnull)
 * @param output_len Size of the output buffer on input, length of the
 *                   formatted value (excluding NUL terminator) on output. (nonnull)
 *
 * @return GOVID_OK on success.
 **/
GOVID_RET_CODE govid_format(GOVID_ID_KIND kind, const char *canonical, size_t len,
    const char *mask, char *output, size_t *output_len);

/**
 * govid_outcome_description
 *
 * @return Human readable description of the outcome, it should not be freed.
 **/
const char *govid_outcome_description(GOVID_OUTCOME outcome);

/**
 * govid_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *govid_get_version();

/**
 * govid_set_log_cb
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
bool govid_set_log_cb(govid_log_cb cb, GOVID_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* GOVID_H */
