// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <optional>
#include <span>
#include <string_view>

#include "canonical_id.hpp"
#include "identifier_spec.hpp"
#include "validation_outcome.hpp"

namespace govid {

// Runs the validation pipeline for the given identifier kind:
//   1. empty or whitespace only            -> empty
//   2. neither canonical nor separated     -> invalid_length
//   3. separator mismatch                  -> invalid_separator_encountered
//   4. non-digit outside separators        -> invalid_character_encountered
//   5. identifier specific rules, in order -> rule specific outcome
// The first failing check determines the outcome.
//
// Data problems are never reported through exceptions, however a separator
// which is an ASCII digit raises invalid_separator before the input is
// inspected.
validation_outcome validate(std::string_view input, char separator, identifier_kind kind);

inline validation_outcome validate(std::string_view input, identifier_kind kind)
{
    return validate(input, default_separator, kind);
}

// Evaluates the rules in order and returns the outcome of the first one
// failing, or validation_passed.
validation_outcome evaluate_rules(std::span<const semantic_rule> rules, std::string_view input,
    identifier_form form, const identifier_spec &spec);

struct parse_result {
    validation_outcome outcome;
    // Only set when the outcome is validation_passed
    std::optional<canonical_id> id;

    [[nodiscard]] bool ok() const noexcept
    {
        return outcome == validation_outcome::validation_passed;
    }
};

parse_result try_parse(
    std::string_view input, identifier_kind kind, char separator = default_separator);

} // namespace govid
