// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <optional>
#include <string>
#include <string_view>

#include "ip_utils.hpp"
#include "limits.hpp"
#include "pattern_validator.hpp"
#include "scope_types.hpp"
#include "utils.hpp"

namespace scopematch {

namespace {

std::optional<std::string> validate_domain_pattern(std::string_view pattern)
{
    if (pattern.starts_with("*.")) {
        pattern.remove_prefix(2);
    }

    if (pattern.empty()) {
        return "domain pattern has no base domain";
    }

    for (auto c : pattern) {
        if (c == '*') {
            return "wildcards are only supported as a leading '*.' label";
        }

        if (!isalnum(c) && c != '-' && c != '.') {
            return "invalid character in domain pattern";
        }
    }

    if (pattern.front() == '.' || pattern.back() == '.' ||
        pattern.find("..") != std::string_view::npos) {
        return "empty label in domain pattern";
    }

    return std::nullopt;
}

std::optional<std::string> validate_ip_pattern(std::string_view pattern, bool is_range)
{
    auto slash_idx = pattern.find('/');
    if (slash_idx != std::string_view::npos && !is_range) {
        return "invalid IPv4 address";
    }

    if (!parse_ipv4(pattern.substr(0, slash_idx)).has_value()) {
        return "IP octets must be between 0-255";
    }

    if (slash_idx != std::string_view::npos && !parse_ipv4_cidr(pattern).has_value()) {
        return "CIDR must be between 0-32";
    }

    return std::nullopt;
}

std::optional<std::string> validate_cloud_account_pattern(std::string_view pattern)
{
    auto colon_idx = pattern.find(':');
    if (colon_idx == std::string_view::npos || colon_idx == 0 ||
        colon_idx == pattern.size() - 1) {
        return "cloud account must be formatted as PROVIDER:account";
    }

    if (pattern.find('*') != std::string_view::npos) {
        return "wildcards are not supported in cloud account patterns";
    }

    return std::nullopt;
}

} // namespace

std::optional<std::string_view> validate_pattern(std::string_view pattern)
{
    if (pattern.empty() || pattern.size() > pattern_limits::max_pattern_length) {
        return std::nullopt;
    }

    if (count_char(pattern, '*') > pattern_limits::max_wildcards) {
        return std::nullopt;
    }

    auto trimmed = trim(pattern);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    return trimmed;
}

std::optional<std::string> validate_target_pattern(target_type type, std::string_view pattern)
{
    if (trim(pattern).empty()) {
        return "pattern is required";
    }

    auto valid = validate_pattern(pattern);
    if (!valid.has_value()) {
        return "pattern exceeds limits";
    }

    switch (type) {
    case target_type::domain:
    case target_type::subdomain:
    case target_type::certificate:
    case target_type::email_domain:
        return validate_domain_pattern(*valid);
    case target_type::ip_address:
        return validate_ip_pattern(*valid, false);
    case target_type::ip_range:
        return validate_ip_pattern(*valid, true);
    case target_type::cloud_account:
        return validate_cloud_account_pattern(*valid);
    case target_type::repository:
        for (auto c : *valid) {
            if (isspace(c)) {
                return "whitespace is not allowed in repository patterns";
            }
        }
        break;
    case target_type::api:
    case target_type::website:
    case target_type::path:
    case target_type::container:
    case target_type::database:
    case target_type::host:
        break;
    }

    return std::nullopt;
}

} // namespace scopematch
