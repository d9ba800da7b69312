// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <span>
#include <string>

#include "scope_types.hpp"

namespace scopematch {

// Classifies every asset as excluded, in scope or uncovered (in that order of
// precedence) and aggregates the counts overall and per asset type.
scope_coverage calculate_scope_coverage(std::span<const asset> assets,
    std::span<const scope_target> targets, std::span<const scope_exclusion> exclusions);

// Identity of a coverage computation: the id lists of the three collections,
// each sorted independently. Rule contents are not part of the key.
std::string coverage_cache_key(std::span<const asset> assets,
    std::span<const scope_target> targets, std::span<const scope_exclusion> exclusions);

} // namespace scopematch
