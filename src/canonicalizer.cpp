// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <string_view>

#include <fmt/format.h>

#include "canonical_id.hpp"
#include "canonicalizer.hpp"
#include "exception.hpp"
#include "identifier_spec.hpp"
#include "log.hpp"
#include "segment_extractor.hpp"
#include "utils.hpp"

namespace govid {

canonical_id canonicalize(std::string_view input, identifier_kind kind)
{
    const auto &spec = spec_for(kind);

    identifier_form form;
    if (input.size() == spec.canonical_length) {
        form = identifier_form::canonical;
    } else if (input.size() == spec.separated_length()) {
        form = identifier_form::separated;
    } else {
        throw contract_violation(fmt::format(
            "cannot canonicalize {} from a value of length {}", spec.name, input.size()));
    }

    canonical_id result{kind, spec.canonical_length};
    auto *out = result.digits_.data();
    if (form == identifier_form::canonical) {
        out = std::copy(input.begin(), input.end(), out);
    } else {
        for (auto id : spec.layout) {
            auto section = segment_view(input, form, id, spec);
            out = std::copy(section.begin(), section.end(), out);
        }
    }

    auto digits = result.view();
    if (static_cast<std::size_t>(out - result.digits_.data()) != spec.canonical_length ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return isdigit(c); })) {
        throw contract_violation(
            fmt::format("cannot canonicalize {} from a value which failed validation", spec.name));
    }

    GOVID_TRACE("canonicalized {} value from {} form", spec.name,
        form == identifier_form::canonical ? "canonical" : "separated");

    return result;
}

} // namespace govid
