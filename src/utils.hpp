// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// (string, length), only for literals
#define STRL(value) value, sizeof(value) - 1
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace govid {

// Locale-independent classification, only ASCII characters are recognised
// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isspace(char c)
{
    return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}
inline uint8_t to_digit(char c) { return static_cast<uint8_t>(c - '0'); }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

inline bool is_blank(std::string_view str)
{
    return std::all_of(str.begin(), str.end(), [](char c) { return isspace(c); });
}

inline bool contains(std::span<const std::size_t> positions, std::size_t idx)
{
    return std::find(positions.begin(), positions.end(), idx) != positions.end();
}

} // namespace govid
