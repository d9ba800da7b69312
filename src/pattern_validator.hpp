// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "scope_types.hpp"

namespace scopematch {

// Returns the trimmed pattern, or nullopt when the pattern is empty, longer
// than pattern_limits::max_pattern_length or has more than
// pattern_limits::max_wildcards wildcards. The returned view aliases the input.
std::optional<std::string_view> validate_pattern(std::string_view pattern);

// Dialect-specific syntax checks applied when loading a ruleset, returns an
// error message describing the first problem found.
std::optional<std::string> validate_target_pattern(target_type type, std::string_view pattern);

} // namespace scopematch
