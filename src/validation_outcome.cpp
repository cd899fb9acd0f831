// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string_view>

#include "validation_outcome.hpp"

namespace govid {

std::string_view to_string(validation_outcome outcome)
{
    switch (outcome) {
    case validation_outcome::validation_passed:
        return "validation_passed";
    case validation_outcome::empty:
        return "empty";
    case validation_outcome::invalid_length:
        return "invalid_length";
    case validation_outcome::invalid_separator_encountered:
        return "invalid_separator_encountered";
    case validation_outcome::invalid_character_encountered:
        return "invalid_character_encountered";
    case validation_outcome::invalid_area_number:
        return "invalid_area_number";
    case validation_outcome::invalid_group_number:
        return "invalid_group_number";
    case validation_outcome::invalid_serial_number:
        return "invalid_serial_number";
    case validation_outcome::all_identical_digits:
        return "all_identical_digits";
    case validation_outcome::invalid_run:
        return "invalid_run";
    case validation_outcome::invalid_province:
        return "invalid_province";
    case validation_outcome::invalid_check_digit:
        return "invalid_check_digit";
    }

    return "unknown";
}

std::string_view describe(validation_outcome outcome)
{
    switch (outcome) {
    case validation_outcome::validation_passed:
        return "The value does not contain any validation errors.";
    case validation_outcome::empty:
        return "The value is empty or consists only of whitespace characters.";
    case validation_outcome::invalid_length:
        return "The value must contain either only digits or digits with separators "
               "between each section.";
    case validation_outcome::invalid_separator_encountered:
        return "The value contains an unexpected character in a separator position.";
    case validation_outcome::invalid_character_encountered:
        return "The value contains a character that is not an ASCII digit (0-9).";
    case validation_outcome::invalid_area_number:
        return "The area number may not be 000, 666 or 900-999.";
    case validation_outcome::invalid_group_number:
        return "The group number may not be 00.";
    case validation_outcome::invalid_serial_number:
        return "The serial number may not be 0000.";
    case validation_outcome::all_identical_digits:
        return "The value may not consist of nine identical digits.";
    case validation_outcome::invalid_run:
        return "The value may not be the consecutive run 123456789.";
    case validation_outcome::invalid_province:
        return "The leading digit may not be 0 or 8.";
    case validation_outcome::invalid_check_digit:
        return "The check digit does not match the value.";
    }

    return "Unknown validation outcome.";
}

} // namespace govid
