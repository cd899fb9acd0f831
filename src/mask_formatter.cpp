// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>

#include "canonical_id.hpp"
#include "exception.hpp"
#include "identifier_spec.hpp"
#include "mask_formatter.hpp"
#include "utils.hpp"

namespace govid {

std::string format_with_mask(std::string_view str, std::string_view mask)
{
    if (is_blank(mask)) {
        throw invalid_mask("mask must not be empty or whitespace only");
    }

    std::string output;
    output.reserve(mask.size());

    std::size_t str_idx = 0;
    for (std::size_t mask_idx = 0; mask_idx < mask.size(); ++mask_idx) {
        const auto c = mask[mask_idx];
        switch (c) {
        case mask_escape:
            if (++mask_idx == mask.size()) {
                throw invalid_mask("mask ends with an unpaired escape character");
            }
            output.push_back(mask[mask_idx]);
            break;
        case mask_placeholder:
            if (str_idx < str.size()) {
                output.push_back(str[str_idx++]);
            }
            break;
        default:
            output.push_back(c);
            break;
        }
    }

    return output;
}

std::string format(const canonical_id &id, std::string_view mask)
{
    return format_with_mask(id.view(), mask);
}

std::string format(const canonical_id &id)
{
    return format_with_mask(id.view(), spec_for(id.kind()).default_mask);
}

} // namespace govid
