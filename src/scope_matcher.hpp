// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <span>
#include <string>
#include <string_view>

#include "scope_types.hpp"

namespace scopematch {

struct match_verdict {
    bool matches{false};
    match_type type{match_type::exact};
};

// Evaluates a single rule against an asset: pattern validation, type
// compatibility and dispatch to the dialect matcher of the rule type.
match_verdict matches_scope_target(target_type type, std::string_view pattern, const asset &a);

inline match_verdict matches_scope_target(const scope_target &target, const asset &a)
{
    return matches_scope_target(target.type, target.pattern, a);
}

// Collects every active target and exclusion matching the asset. The asset is
// in scope when at least one target and no exclusion matched.
scope_match_result get_scope_matches_for_asset(const asset &a,
    std::span<const scope_target> targets, std::span<const scope_exclusion> exclusions);

// One-line summary suitable for display.
std::string format_scope_match(const scope_match_result &result);

} // namespace scopematch
