// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string_view>

#include "canonical_id.hpp"
#include "identifier_spec.hpp"

namespace govid {

// Merges the segments of a validated input into its canonical form. Only the
// separator positions of the kind are taken into account, the separator
// character itself is irrelevant at this point.
//
// The input must have passed validate() for the same kind, a contract
// violation is raised if the result wouldn't be a well-formed identifier.
canonical_id canonicalize(std::string_view input, identifier_kind kind);

} // namespace govid
