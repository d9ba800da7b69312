// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "coverage.hpp"
#include "log.hpp"
#include "scope_matcher.hpp"
#include "scope_types.hpp"

namespace scopematch {

namespace {

template <typename T> std::string sorted_ids(std::span<const T> items)
{
    std::vector<std::string_view> ids;
    ids.reserve(items.size());
    for (const auto &item : items) { ids.emplace_back(item.id); }
    std::sort(ids.begin(), ids.end());
    return fmt::format("{}", fmt::join(ids, ","));
}

// Math.round semantics for a non-negative ratio, without floating point
unsigned rounded_percent(std::size_t part, std::size_t total)
{
    if (total == 0) {
        return 0;
    }
    return static_cast<unsigned>((part * 200 + total) / (total * 2));
}

} // namespace

scope_coverage calculate_scope_coverage(std::span<const asset> assets,
    std::span<const scope_target> targets, std::span<const scope_exclusion> exclusions)
{
    scope_coverage coverage;

    for (const auto &a : assets) {
        auto &type_stats = coverage.by_type[a.type];
        ++type_stats.total;

        auto match = get_scope_matches_for_asset(a, targets, exclusions);
        if (!match.matched_exclusions.empty()) {
            ++coverage.excluded_assets;
            ++type_stats.excluded;
        } else if (!match.matched_targets.empty()) {
            ++coverage.in_scope_assets;
            ++type_stats.in_scope;
        }
    }

    coverage.total_assets = assets.size();
    coverage.uncovered_assets =
        coverage.total_assets - coverage.in_scope_assets - coverage.excluded_assets;
    coverage.coverage_percent = rounded_percent(coverage.in_scope_assets, coverage.total_assets);

    SCOPEMATCH_DEBUG("Coverage over {} assets: {} in scope, {} excluded, {} uncovered ({}%)",
        coverage.total_assets, coverage.in_scope_assets, coverage.excluded_assets,
        coverage.uncovered_assets, coverage.coverage_percent);

    return coverage;
}

std::string coverage_cache_key(std::span<const asset> assets,
    std::span<const scope_target> targets, std::span<const scope_exclusion> exclusions)
{
    return fmt::format(
        "{}:{}:{}", sorted_ids(assets), sorted_ids(targets), sorted_ids(exclusions));
}

} // namespace scopematch
