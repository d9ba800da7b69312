// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "log.hpp"
#include "matcher/cidr_match.hpp"
#include "matcher/cloud_account_match.hpp"
#include "matcher/domain_match.hpp"
#include "matcher/repository_match.hpp"
#include "matcher/wildcard_match.hpp"
#include "pattern_validator.hpp"
#include "scope_matcher.hpp"
#include "scope_types.hpp"
#include "type_compatibility.hpp"
#include "utils.hpp"

namespace scopematch {

namespace {

std::string_view metadata_value(const asset &a, std::string_view key)
{
    auto it = a.metadata.find(key);
    if (it == a.metadata.end()) {
        return {};
    }
    return it->second;
}

// The asset name is the natural candidate, metadata keys are tried in order
// when the name is empty.
std::string_view candidate_value(const asset &a, std::initializer_list<std::string_view> keys)
{
    if (!a.name.empty()) {
        return a.name;
    }

    for (auto key : keys) {
        auto value = metadata_value(a, key);
        if (!value.empty()) {
            return value;
        }
    }
    return {};
}

std::string repository_candidate(const asset &a)
{
    auto provider = metadata_value(a, "repoProvider");
    if (provider.empty()) {
        provider = "github";
    }
    return fmt::format("{}.com/{}/{}", provider, metadata_value(a, "org"), a.name);
}

std::string cloud_account_candidate(const asset &a)
{
    auto account = metadata_value(a, "accountId");
    if (account.empty()) {
        account = a.name;
    }
    return fmt::format("{}:{}", to_upper(metadata_value(a, "cloudProvider")), account);
}

match_type glob_match_type(std::string_view pattern)
{
    return pattern.find('*') != std::string_view::npos ? match_type::wildcard : match_type::exact;
}

} // namespace

match_verdict matches_scope_target(target_type type, std::string_view pattern, const asset &a)
{
    auto valid = validate_pattern(pattern);
    if (!valid.has_value()) {
        SCOPEMATCH_TRACE("Ignoring invalid {} pattern for asset {}", to_string(type), a.id);
        return {};
    }

    if (!is_type_compatible(type, a.type)) {
        return {};
    }

    auto p = *valid;
    switch (type) {
    case target_type::domain:
    case target_type::subdomain:
    case target_type::certificate:
    case target_type::email_domain:
        if (matcher::match_domain(p, candidate_value(a, {"domain"}))) {
            return {true, glob_match_type(p)};
        }
        break;
    case target_type::ip_address:
        if (p == candidate_value(a, {"ip"})) {
            return {true, match_type::exact};
        }
        break;
    case target_type::ip_range:
        if (matcher::match_cidr(p, candidate_value(a, {"ip", "privateIp", "publicIp"}))) {
            return {true, match_type::cidr};
        }
        break;
    case target_type::repository:
        if (matcher::match_repository(p, repository_candidate(a))) {
            return {true, glob_match_type(p)};
        }
        break;
    case target_type::cloud_account:
        if (matcher::match_cloud_account(p, cloud_account_candidate(a))) {
            return {true, match_type::exact};
        }
        break;
    case target_type::api:
    case target_type::website:
    case target_type::path:
        if (matcher::match_wildcard(p, candidate_value(a, {"url"}))) {
            return {true, glob_match_type(p)};
        }
        break;
    case target_type::container:
        if (matcher::match_wildcard(p, candidate_value(a, {"image"}))) {
            return {true, glob_match_type(p)};
        }
        break;
    case target_type::database:
    case target_type::host:
        if (matcher::match_wildcard(p, candidate_value(a, {"host"}))) {
            return {true, glob_match_type(p)};
        }
        break;
    }

    return {};
}

scope_match_result get_scope_matches_for_asset(const asset &a,
    std::span<const scope_target> targets, std::span<const scope_exclusion> exclusions)
{
    scope_match_result result{
        .asset_id = a.id, .asset_name = a.name, .asset_type = a.type, .matched_targets = {},
        .matched_exclusions = {}, .in_scope = false};

    for (const auto &target : targets) {
        if (target.status != target_status::active) {
            continue;
        }

        auto verdict = matches_scope_target(target, a);
        if (verdict.matches) {
            result.matched_targets.emplace_back(target_match{
                .target_id = target.id, .pattern = target.pattern, .type = verdict.type});
        }
    }

    for (const auto &exclusion : exclusions) {
        if (exclusion.status != target_status::active) {
            continue;
        }

        if (matches_scope_target(exclusion.type, exclusion.pattern, a).matches) {
            result.matched_exclusions.emplace_back(exclusion_match{.exclusion_id = exclusion.id,
                .pattern = exclusion.pattern,
                .reason = exclusion.reason});
        }
    }

    result.in_scope = !result.matched_targets.empty() && result.matched_exclusions.empty();

    SCOPEMATCH_TRACE("Asset {} matched {} targets and {} exclusions", a.id,
        result.matched_targets.size(), result.matched_exclusions.size());

    return result;
}

std::string format_scope_match(const scope_match_result &result)
{
    if (!result.matched_exclusions.empty()) {
        return fmt::format("Excluded: {}", result.matched_exclusions.front().reason);
    }

    if (!result.matched_targets.empty()) {
        std::vector<std::string_view> patterns;
        patterns.reserve(result.matched_targets.size());
        for (const auto &match : result.matched_targets) { patterns.emplace_back(match.pattern); }
        return fmt::format("In scope: {}", fmt::join(patterns, ", "));
    }

    return "Not in scope";
}

} // namespace scopematch
