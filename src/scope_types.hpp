// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scopematch {

enum class target_type : uint8_t {
    domain,
    subdomain,
    certificate,
    email_domain,
    ip_address,
    ip_range,
    repository,
    cloud_account,
    api,
    website,
    path,
    container,
    database,
    host,
};

enum class target_status : uint8_t { active, inactive };

enum class target_priority : uint8_t { none, low, medium, high, critical };

// How a target matched an asset; regex is reserved and never produced.
enum class match_type : uint8_t { exact, wildcard, cidr, regex };

std::string_view to_string(target_type type);
std::string_view to_string(target_status status);
std::string_view to_string(target_priority priority);
std::string_view to_string(match_type type);

std::optional<target_type> target_type_from_string(std::string_view str);
std::optional<target_status> target_status_from_string(std::string_view str);
std::optional<target_priority> target_priority_from_string(std::string_view str);

struct scope_target {
    std::string id;
    target_type type{target_type::domain};
    std::string pattern;
    target_status status{target_status::active};
    std::string description{};
    target_priority priority{target_priority::none};
};

struct scope_exclusion {
    std::string id;
    target_type type{target_type::domain};
    std::string pattern;
    target_status status{target_status::active};
    std::string reason{};
};

// Read-only projection of an inventory asset
struct asset {
    using metadata_map = std::map<std::string, std::string, std::less<>>;

    std::string id;
    std::string type;
    std::string name;
    metadata_map metadata{};
};

struct target_match {
    std::string target_id;
    std::string pattern;
    match_type type{match_type::exact};

    bool operator==(const target_match &) const = default;
};

struct exclusion_match {
    std::string exclusion_id;
    std::string pattern;
    std::string reason;

    bool operator==(const exclusion_match &) const = default;
};

struct scope_match_result {
    std::string asset_id;
    std::string asset_name;
    std::string asset_type;
    std::vector<target_match> matched_targets;
    std::vector<exclusion_match> matched_exclusions;
    bool in_scope{false};
};

struct type_coverage {
    std::size_t total{0};
    std::size_t in_scope{0};
    std::size_t excluded{0};

    bool operator==(const type_coverage &) const = default;
};

struct scope_coverage {
    std::size_t total_assets{0};
    std::size_t in_scope_assets{0};
    std::size_t excluded_assets{0};
    std::size_t uncovered_assets{0};
    unsigned coverage_percent{0};
    std::map<std::string, type_coverage, std::less<>> by_type;

    bool operator==(const scope_coverage &) const = default;
};

} // namespace scopematch
