// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

#include "checksum/luhn_checksum.hpp"
#include "identifier_spec.hpp"
#include "rule/semantic_rules.hpp"
#include "segment_extractor.hpp"
#include "validation_outcome.hpp"

namespace govid::rule {

namespace {

constexpr std::array<semantic_rule, 2> rules{{
    {.name = "province", .check = valid_province,
        .failure = validation_outcome::invalid_province},
    {.name = "check_digit", .check = valid_check_digit,
        .failure = validation_outcome::invalid_check_digit},
}};

} // namespace

std::span<const semantic_rule> ca_sin_rules() { return rules; }

// No province or territory issues numbers starting with 0 or 8
bool valid_province(std::string_view input, identifier_form form, const identifier_spec &spec)
{
    auto leading = segment_view(input, form, segment_id::leading_digit, spec).front();
    return leading != '0' && leading != '8';
}

bool valid_check_digit(std::string_view input, identifier_form form, const identifier_spec &spec)
{
    std::span<const std::size_t> skip;
    if (form == identifier_form::separated) {
        skip = spec.separator_offsets;
    }
    return luhn_checksum{}.validate(input, skip);
}

} // namespace govid::rule
