// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <stdexcept>
#include <string>

namespace govid {

// Misuse of the API by the calling code, never caused by the identifier
// being validated. Data problems are reported through validation_outcome.
class contract_violation : public std::invalid_argument {
public:
    explicit contract_violation(const std::string &what) : std::invalid_argument(what) {}
};

// The separator supplied by the caller is an ASCII digit
class invalid_separator : public contract_violation {
public:
    explicit invalid_separator(char separator)
        : contract_violation(
              std::string{"separator must not be an ASCII digit, got '"} + separator + "'"),
          separator_(separator)
    {}

    [[nodiscard]] char separator() const noexcept { return separator_; }

protected:
    char separator_;
};

class invalid_mask : public contract_violation {
public:
    using contract_violation::contract_violation;
};

class unknown_segment : public contract_violation {
public:
    using contract_violation::contract_violation;
};

class invalid_kind : public contract_violation {
public:
    using contract_violation::contract_violation;
};

} // namespace govid
