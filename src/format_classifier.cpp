// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <string_view>

#include "format_classifier.hpp"
#include "identifier_spec.hpp"
#include "utils.hpp"
#include "validation_outcome.hpp"

namespace govid {

classification classify(std::string_view input, char separator, const identifier_spec &spec)
{
    if (input.size() == spec.canonical_length) {
        return {validation_outcome::validation_passed, identifier_form::canonical};
    }

    if (input.size() != spec.separated_length()) {
        return {validation_outcome::invalid_length, identifier_form::canonical};
    }

    for (auto offset : spec.separator_offsets) {
        if (input[offset] != separator) {
            return {validation_outcome::invalid_separator_encountered, identifier_form::separated};
        }
    }

    return {validation_outcome::validation_passed, identifier_form::separated};
}

bool has_only_digits(std::string_view input, identifier_form form, const identifier_spec &spec)
{
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (form == identifier_form::separated && contains(spec.separator_offsets, i)) {
            continue;
        }

        if (!isdigit(input[i])) {
            return false;
        }
    }
    return true;
}

} // namespace govid
