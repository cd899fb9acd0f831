// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "identifier_spec.hpp"

namespace govid {

// Digits-only representation of a validated identifier. The digits are stored
// inline, a canonical_id never allocates and can't be modified once created.
class canonical_id {
public:
    canonical_id(const canonical_id &) = default;
    canonical_id &operator=(const canonical_id &) = default;
    canonical_id(canonical_id &&) noexcept = default;
    canonical_id &operator=(canonical_id &&) noexcept = default;
    ~canonical_id() = default;

    [[nodiscard]] identifier_kind kind() const noexcept { return kind_; }
    [[nodiscard]] std::size_t size() const noexcept { return length_; }
    [[nodiscard]] std::string_view view() const noexcept { return {digits_.data(), length_}; }
    [[nodiscard]] std::string to_canonical_string() const { return std::string{view()}; }

    bool operator==(const canonical_id &other) const noexcept = default;

protected:
    canonical_id(identifier_kind kind, std::size_t length)
        : kind_(kind), length_(static_cast<uint8_t>(length))
    {}

    identifier_kind kind_;
    uint8_t length_;
    std::array<char, max_canonical_length> digits_{};

    friend canonical_id canonicalize(std::string_view input, identifier_kind kind);
};

inline std::ostream &operator<<(std::ostream &os, const canonical_id &id)
{
    return os << to_string(id.kind()) << ":" << id.view();
}

} // namespace govid
