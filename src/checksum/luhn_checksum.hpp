// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace govid {

// Positions listed in skip are ignored, which allows computing the checksum
// directly over a separated identifier. Any other position must be a digit.
class luhn_checksum {
public:
    // Check digit for a payload which doesn't contain one, or nullopt if the
    // payload has no digits or contains a non-digit character.
    [[nodiscard]] std::optional<uint8_t> compute(
        std::string_view payload, std::span<const std::size_t> skip = {}) const noexcept;

    // The last digit of str is its check digit
    [[nodiscard]] bool validate(
        std::string_view str, std::span<const std::size_t> skip = {}) const noexcept;
};

} // namespace govid
