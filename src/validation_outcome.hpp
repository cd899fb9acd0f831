// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>

namespace govid {

// Declaration order is the failure priority: when an input violates several
// rules, the pipeline reports the one declared first. The values are part of
// the C interface, see GOVID_OUTCOME.
enum class validation_outcome : uint8_t {
    validation_passed = 1,
    empty,
    invalid_length,
    invalid_separator_encountered,
    invalid_character_encountered,
    // US Social Security Number
    invalid_area_number,
    invalid_group_number,
    invalid_serial_number,
    all_identical_digits,
    invalid_run,
    // Canadian Social Insurance Number
    invalid_province,
    invalid_check_digit,
};

std::string_view to_string(validation_outcome outcome);

// Human readable description of the outcome
std::string_view describe(validation_outcome outcome);

} // namespace govid
