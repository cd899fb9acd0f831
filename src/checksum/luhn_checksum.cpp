// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "checksum/luhn_checksum.hpp"
#include "utils.hpp"

namespace govid {

std::optional<uint8_t> luhn_checksum::compute(
    std::string_view payload, std::span<const std::size_t> skip) const noexcept
{
    // Precomputed doubled values
    //   for num from 0 to 9: (2 * num) / 10 + (2 * num) % 10
    static constexpr std::array<uint8_t, 10> lut = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

    uint32_t sum = 0;
    // The rightmost payload digit sits next to the check digit, so it's doubled
    bool should_double = true;
    bool digits_seen = false;
    for (std::size_t i = payload.size(); i > 0; --i) {
        if (contains(skip, i - 1)) {
            continue;
        }

        const auto c = payload[i - 1];
        if (!isdigit(c)) {
            return std::nullopt;
        }

        digits_seen = true;
        const auto d = to_digit(c);
        sum += should_double ? lut[d] : d;
        should_double = !should_double;
    }

    if (!digits_seen) {
        return std::nullopt;
    }

    return static_cast<uint8_t>((10U - (sum % 10U)) % 10U);
}

bool luhn_checksum::validate(std::string_view str, std::span<const std::size_t> skip) const noexcept
{
    std::size_t i = str.size();
    for (; i > 0 && contains(skip, i - 1); --i) {}

    if (i == 0 || !isdigit(str[i - 1])) {
        return false;
    }

    auto expected = compute(str.substr(0, i - 1), skip);
    return expected.has_value() && *expected == to_digit(str[i - 1]);
}

} // namespace govid
