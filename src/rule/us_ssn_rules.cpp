// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

#include "identifier_spec.hpp"
#include "rule/semantic_rules.hpp"
#include "segment_extractor.hpp"
#include "validation_outcome.hpp"

using namespace std::literals;

namespace govid::rule {

namespace {

// Since the 2011 randomisation only these areas remain unassigned, 900-999
// being reserved for Individual Taxpayer Identification Numbers.
constexpr auto area_never_issued = "000"sv;
constexpr auto area_never_used = "666"sv;
constexpr char area_itin_prefix = '9';

constexpr auto group_never_issued = "00"sv;
constexpr auto serial_never_issued = "0000"sv;
constexpr auto consecutive_run = "123456789"sv;

constexpr std::array<semantic_rule, 5> rules{{
    {.name = "area_number", .check = valid_area_number,
        .failure = validation_outcome::invalid_area_number},
    {.name = "group_number", .check = valid_group_number,
        .failure = validation_outcome::invalid_group_number},
    {.name = "serial_number", .check = valid_serial_number,
        .failure = validation_outcome::invalid_serial_number},
    {.name = "identical_digits", .check = not_identical_digits,
        .failure = validation_outcome::all_identical_digits},
    {.name = "consecutive_run", .check = not_consecutive_run,
        .failure = validation_outcome::invalid_run},
}};

} // namespace

std::span<const semantic_rule> us_ssn_rules() { return rules; }

bool valid_area_number(std::string_view input, identifier_form form, const identifier_spec &spec)
{
    auto area = segment_view(input, form, segment_id::area, spec);
    return area.front() != area_itin_prefix && area != area_never_issued &&
           area != area_never_used;
}

bool valid_group_number(std::string_view input, identifier_form form, const identifier_spec &spec)
{
    return segment_view(input, form, segment_id::group, spec) != group_never_issued;
}

bool valid_serial_number(std::string_view input, identifier_form form, const identifier_spec &spec)
{
    return segment_view(input, form, segment_id::serial, spec) != serial_never_issued;
}

bool not_identical_digits(std::string_view input, identifier_form form, const identifier_spec &spec)
{
    const char first = digit_at(input, form, 0, spec);
    for (std::size_t i = 1; i < spec.canonical_length; ++i) {
        if (digit_at(input, form, i, spec) != first) {
            return true;
        }
    }
    return false;
}

bool not_consecutive_run(std::string_view input, identifier_form form, const identifier_spec &spec)
{
    if (spec.canonical_length != consecutive_run.size()) {
        return true;
    }

    for (std::size_t i = 0; i < consecutive_run.size(); ++i) {
        if (digit_at(input, form, i, spec) != consecutive_run[i]) {
            return true;
        }
    }
    return false;
}

} // namespace govid::rule
