// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <span>
#include <string_view>

#include "identifier_spec.hpp"

// Identifier-specific rules, evaluated once the input is known to have a
// valid length, valid separators and only digits elsewhere.
namespace govid::rule {

// Ordered rule tables
std::span<const semantic_rule> us_ssn_rules();
std::span<const semantic_rule> ca_sin_rules();

// Exposed for testing
bool valid_area_number(std::string_view input, identifier_form form, const identifier_spec &spec);
bool valid_group_number(std::string_view input, identifier_form form, const identifier_spec &spec);
bool valid_serial_number(
    std::string_view input, identifier_form form, const identifier_spec &spec);
bool not_identical_digits(
    std::string_view input, identifier_form form, const identifier_spec &spec);
bool not_consecutive_run(
    std::string_view input, identifier_form form, const identifier_spec &spec);

bool valid_province(std::string_view input, identifier_form form, const identifier_spec &spec);
bool valid_check_digit(std::string_view input, identifier_form form, const identifier_spec &spec);

} // namespace govid::rule
