// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "canonical_id.hpp"

namespace govid {

inline constexpr char mask_escape = '\\';
inline constexpr char mask_placeholder = '_';

// Applies the mask one character at a time, from left to right:
//   - '_' is replaced by the next character of str, or dropped if str has
//     been exhausted.
//   - '\' outputs the following mask character as a literal, "\_" and "\\"
//     produce '_' and '\' respectively.
//   - anything else is output as a literal.
//
// e.g.
//   ("012345678", "___-__-____")     -> "012-34-5678"
//   ("8005551212", "(___) ___-____") -> "(800) 555-1212"
//   ("abc", "__.__.__")              -> "ab.c."
//
// An empty or whitespace-only mask, or one ending in an unpaired escape,
// raises invalid_mask.
std::string format_with_mask(std::string_view str, std::string_view mask);

std::string format(const canonical_id &id, std::string_view mask);

// Uses the default mask of the identifier kind
std::string format(const canonical_id &id);

} // namespace govid
