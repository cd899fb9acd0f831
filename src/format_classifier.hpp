// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string_view>

#include "identifier_spec.hpp"
#include "validation_outcome.hpp"

namespace govid {

struct classification {
    // validation_passed, invalid_length or invalid_separator_encountered
    validation_outcome outcome;
    // Only meaningful when the outcome is validation_passed
    identifier_form form;
};

// Determines the form of the input from its length and, for the separated
// form, verifies that every separator position contains the separator.
// The separator is expected not to be a digit, this is enforced by validate.
classification classify(std::string_view input, char separator, const identifier_spec &spec);

// Whether every non-separator position holds an ASCII digit
bool has_only_digits(std::string_view input, identifier_form form, const identifier_spec &spec);

} // namespace govid
