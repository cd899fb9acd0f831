// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <span>
#include <string_view>

#include "canonicalizer.hpp"
#include "exception.hpp"
#include "format_classifier.hpp"
#include "identifier_spec.hpp"
#include "log.hpp"
#include "utils.hpp"
#include "validation_outcome.hpp"
#include "validator.hpp"

namespace govid {

namespace {

validation_outcome run_pipeline(std::string_view input, char separator, const identifier_spec &spec)
{
    if (is_blank(input)) {
        return validation_outcome::empty;
    }

    auto [outcome, form] = classify(input, separator, spec);
    if (outcome != validation_outcome::validation_passed) {
        return outcome;
    }

    if (!has_only_digits(input, form, spec)) {
        return validation_outcome::invalid_character_encountered;
    }

    return evaluate_rules(spec.rules, input, form, spec);
}

} // namespace

validation_outcome evaluate_rules(std::span<const semantic_rule> rules, std::string_view input,
    identifier_form form, const identifier_spec &spec)
{
    for (const auto &rule : rules) {
        if (!rule.check(input, form, spec)) {
            GOVID_TRACE("{} rule '{}' failed", spec.name, rule.name);
            return rule.failure;
        }
    }
    return validation_outcome::validation_passed;
}

validation_outcome validate(std::string_view input, char separator, identifier_kind kind)
{
    if (isdigit(separator)) {
        throw invalid_separator(separator);
    }

    const auto &spec = spec_for(kind);
    auto outcome = run_pipeline(input, separator, spec);
    if (outcome != validation_outcome::validation_passed) {
        // The value itself is never logged
        GOVID_DEBUG("{} value of length {} rejected: {}", spec.name, input.size(),
            to_string(outcome));
    }
    return outcome;
}

parse_result try_parse(std::string_view input, identifier_kind kind, char separator)
{
    auto outcome = validate(input, separator, kind);
    if (outcome != validation_outcome::validation_passed) {
        return {outcome, std::nullopt};
    }
    return {outcome, canonicalize(input, kind)};
}

} // namespace govid
