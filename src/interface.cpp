// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "canonical_id.hpp"
#include "exception.hpp"
#include "govid.h"
#include "identifier_spec.hpp"
#include "log.hpp"
#include "mask_formatter.hpp"
#include "validation_outcome.hpp"
#include "validator.hpp"
#include "version.hpp"

using namespace govid;

// Outcome compatibility
static_assert(static_cast<uint8_t>(validation_outcome::validation_passed) ==
              GOVID_OUTCOME_VALIDATION_PASSED);
static_assert(static_cast<uint8_t>(validation_outcome::empty) == GOVID_OUTCOME_EMPTY);
static_assert(
    static_cast<uint8_t>(validation_outcome::invalid_length) == GOVID_OUTCOME_INVALID_LENGTH);
static_assert(static_cast<uint8_t>(validation_outcome::invalid_separator_encountered) ==
              GOVID_OUTCOME_INVALID_SEPARATOR_ENCOUNTERED);
static_assert(static_cast<uint8_t>(validation_outcome::invalid_character_encountered) ==
              GOVID_OUTCOME_INVALID_CHARACTER_ENCOUNTERED);
static_assert(static_cast<uint8_t>(validation_outcome::invalid_area_number) ==
              GOVID_OUTCOME_INVALID_AREA_NUMBER);
static_assert(static_cast<uint8_t>(validation_outcome::invalid_group_number) ==
              GOVID_OUTCOME_INVALID_GROUP_NUMBER);
static_assert(static_cast<uint8_t>(validation_outcome::invalid_serial_number) ==
              GOVID_OUTCOME_INVALID_SERIAL_NUMBER);
static_assert(static_cast<uint8_t>(validation_outcome::all_identical_digits) ==
              GOVID_OUTCOME_ALL_IDENTICAL_DIGITS);
static_assert(
    static_cast<uint8_t>(validation_outcome::invalid_run) == GOVID_OUTCOME_INVALID_RUN);
static_assert(
    static_cast<uint8_t>(validation_outcome::invalid_province) == GOVID_OUTCOME_INVALID_PROVINCE);
static_assert(static_cast<uint8_t>(validation_outcome::invalid_check_digit) ==
              GOVID_OUTCOME_INVALID_CHECK_DIGIT);

// Kind compatibility
static_assert(static_cast<uint8_t>(identifier_kind::us_ssn) == GOVID_ID_US_SSN);
static_assert(static_cast<uint8_t>(identifier_kind::ca_sin) == GOVID_ID_CA_SIN);

// Log level compatibility
static_assert(static_cast<uint32_t>(log_level::trace) == GOVID_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == GOVID_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == GOVID_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == GOVID_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == GOVID_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == GOVID_LOG_OFF);

namespace {

// The C enum may hold any integer, check it before narrowing to identifier_kind
identifier_kind to_kind(GOVID_ID_KIND kind)
{
    const auto value = static_cast<int64_t>(kind);
    if (value < GOVID_ID_US_SSN || value > GOVID_ID_CA_SIN) {
        throw invalid_kind(fmt::format("unknown identifier kind {}", value));
    }
    return static_cast<identifier_kind>(kind);
}

std::string_view to_view(const char *str, size_t len)
{
    return len == 0 ? std::string_view{} : std::string_view{str, len};
}

// Copies the value and a NUL terminator, output_len is updated with the
// length of the value.
GOVID_RET_CODE copy_output(std::string_view value, char *output, size_t *output_len)
{
    if (*output_len <= value.size()) {
        GOVID_WARN("output buffer of size {} too small, {} bytes required", *output_len,
            value.size() + 1);
        *output_len = value.size();
        return GOVID_ERR_BUFFER_TOO_SMALL;
    }

    std::memcpy(output, value.data(), value.size());
    output[value.size()] = '\0';
    *output_len = value.size();
    return GOVID_OK;
}

} // namespace

extern "C" {

GOVID_RET_CODE govid_validate(GOVID_ID_KIND kind, const char *str, size_t len, char separator,
    GOVID_OUTCOME *outcome)
{
    if ((str == nullptr && len > 0) || outcome == nullptr) {
        GOVID_WARN("Illegal call: str or outcome was null");
        return GOVID_ERR_INVALID_ARGUMENT;
    }

    try {
        auto res = validate(to_view(str, len), separator, to_kind(kind));
        *outcome = static_cast<GOVID_OUTCOME>(res);
        return GOVID_OK;
    } catch (const contract_violation &e) {
        GOVID_ERROR("{}", e.what());
        return GOVID_ERR_INVALID_ARGUMENT;
    } catch (const std::exception &e) {
        GOVID_ERROR("{}", e.what());
    } catch (...) {
        GOVID_ERROR("unknown exception");
    }

    return GOVID_ERR_INTERNAL;
}

GOVID_RET_CODE govid_canonicalize(GOVID_ID_KIND kind, const char *str, size_t len,
    char separator, GOVID_OUTCOME *outcome, char *output, size_t *output_len)
{
    if ((str == nullptr && len > 0) || output == nullptr || output_len == nullptr) {
        GOVID_WARN("Illegal call: str, output or output_len was null");
        return GOVID_ERR_INVALID_ARGUMENT;
    }

    try {
        auto res = try_parse(to_view(str, len), to_kind(kind), separator);
        if (outcome != nullptr) {
            *outcome = static_cast<GOVID_OUTCOME>(res.outcome);
        }

        if (!res.id.has_value()) {
            return GOVID_ERR_INVALID_OBJECT;
        }

        return copy_output(res.id->view(), output, output_len);
    } catch (const contract_violation &e) {
        GOVID_ERROR("{}", e.what());
        return GOVID_ERR_INVALID_ARGUMENT;
    } catch (const std::exception &e) {
        GOVID_ERROR("{}", e.what());
    } catch (...) {
        GOVID_ERROR("unknown exception");
    }

    return GOVID_ERR_INTERNAL;
}

GOVID_RET_CODE govid_format(GOVID_ID_KIND kind, const char *canonical, size_t len,
    const char *mask, char *output, size_t *output_len)
{
    if ((canonical == nullptr && len > 0) || output == nullptr || output_len == nullptr) {
        GOVID_WARN("Illegal call: canonical, output or output_len was null");
        return GOVID_ERR_INVALID_ARGUMENT;
    }

    try {
        auto res = try_parse(to_view(canonical, len), to_kind(kind));
        if (!res.id.has_value()) {
            GOVID_DEBUG("refusing to format invalid value: {}", to_string(res.outcome));
            return GOVID_ERR_INVALID_OBJECT;
        }

        auto formatted = mask == nullptr ? format(*res.id) : format(*res.id, mask);
        return copy_output(formatted, output, output_len);
    } catch (const contract_violation &e) {
        GOVID_ERROR("{}", e.what());
        return GOVID_ERR_INVALID_ARGUMENT;
    } catch (const std::exception &e) {
        GOVID_ERROR("{}", e.what());
    } catch (...) {
        GOVID_ERROR("unknown exception");
    }

    return GOVID_ERR_INTERNAL;
}

const char *govid_outcome_description(GOVID_OUTCOME outcome)
{
    const auto value = static_cast<int64_t>(outcome);
    if (value < GOVID_OUTCOME_VALIDATION_PASSED || value > GOVID_OUTCOME_INVALID_CHECK_DIGIT) {
        GOVID_WARN("unknown outcome {}", value);
        return "Unknown validation outcome.";
    }
    return describe(static_cast<validation_outcome>(outcome)).data();
}

const char *govid_get_version() { return govid::current_version; }

bool govid_set_log_cb(govid_log_cb cb, GOVID_LOG_LEVEL min_level)
{
    auto level = static_cast<log_level>(min_level);
    govid::logger::init(cb, level);
    GOVID_INFO("Sending log messages to binding, min level {}", log_level_to_str(level));
    return true;
}
}
