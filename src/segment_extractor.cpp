// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <string_view>

#include <fmt/format.h>

#include "exception.hpp"
#include "identifier_spec.hpp"
#include "segment_extractor.hpp"

namespace govid {

std::size_t input_position(
    std::size_t canonical_pos, identifier_form form, const identifier_spec &spec) noexcept
{
    if (form == identifier_form::canonical) {
        return canonical_pos;
    }

    // Offsets are ascending and expressed in separated coordinates, so each
    // separator at or before the running position pushes it one step right.
    auto pos = canonical_pos;
    for (auto offset : spec.separator_offsets) {
        if (offset <= pos) {
            ++pos;
        }
    }
    return pos;
}

segment extract_segment(identifier_form form, segment_id id, const identifier_spec &spec)
{
    for (const auto &seg : spec.segments) {
        if (seg.id != id) {
            continue;
        }

        // Segments are never empty
        return {input_position(seg.start, form, spec), input_position(seg.end - 1, form, spec) + 1,
            form};
    }

    throw unknown_segment(
        fmt::format("segment '{}' is not defined for {}", to_string(id), spec.name));
}

std::string_view segment_view(
    std::string_view input, identifier_form form, segment_id id, const identifier_spec &spec)
{
    auto seg = extract_segment(form, id, spec);
    return input.substr(seg.start, seg.size());
}

} // namespace govid
