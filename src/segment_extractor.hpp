// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string_view>

#include "identifier_spec.hpp"

namespace govid {

// Half-open range [start, end) into the input as provided by the caller
struct segment {
    std::size_t start;
    std::size_t end;
    identifier_form form;

    [[nodiscard]] constexpr std::size_t size() const noexcept { return end - start; }
    bool operator==(const segment &other) const noexcept = default;
};

// Translates a position in canonical coordinates into the equivalent
// position of the input, skipping over any separator.
std::size_t input_position(
    std::size_t canonical_pos, identifier_form form, const identifier_spec &spec) noexcept;

// Throws unknown_segment if the identifier kind doesn't declare the segment
segment extract_segment(identifier_form form, segment_id id, const identifier_spec &spec);

// The slice of the input covered by the segment, no copies involved
std::string_view segment_view(
    std::string_view input, identifier_form form, segment_id id, const identifier_spec &spec);

inline char digit_at(std::string_view input, identifier_form form, std::size_t canonical_pos,
    const identifier_spec &spec)
{
    return input[input_position(canonical_pos, form, spec)];
}

} // namespace govid
