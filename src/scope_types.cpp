// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include "scope_types.hpp"

namespace scopematch {

namespace {

constexpr std::array<std::pair<std::string_view, target_type>, 14> target_type_names{{
    {"domain", target_type::domain},
    {"subdomain", target_type::subdomain},
    {"certificate", target_type::certificate},
    {"email_domain", target_type::email_domain},
    {"ip_address", target_type::ip_address},
    {"ip_range", target_type::ip_range},
    {"repository", target_type::repository},
    {"cloud_account", target_type::cloud_account},
    {"api", target_type::api},
    {"website", target_type::website},
    {"path", target_type::path},
    {"container", target_type::container},
    {"database", target_type::database},
    {"host", target_type::host},
}};

} // namespace

std::string_view to_string(target_type type)
{
    for (const auto &[name, value] : target_type_names) {
        if (value == type) {
            return name;
        }
    }
    return "unknown";
}

std::string_view to_string(target_status status)
{
    switch (status) {
    case target_status::active:
        return "active";
    case target_status::inactive:
        return "inactive";
    }
    return "unknown";
}

std::string_view to_string(target_priority priority)
{
    switch (priority) {
    case target_priority::none:
        return "none";
    case target_priority::low:
        return "low";
    case target_priority::medium:
        return "medium";
    case target_priority::high:
        return "high";
    case target_priority::critical:
        return "critical";
    }
    return "unknown";
}

std::string_view to_string(match_type type)
{
    switch (type) {
    case match_type::exact:
        return "exact";
    case match_type::wildcard:
        return "wildcard";
    case match_type::cidr:
        return "cidr";
    case match_type::regex:
        return "regex";
    }
    return "unknown";
}

std::optional<target_type> target_type_from_string(std::string_view str)
{
    for (const auto &[name, value] : target_type_names) {
        if (name == str) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<target_status> target_status_from_string(std::string_view str)
{
    if (str == "active") {
        return target_status::active;
    }
    if (str == "inactive") {
        return target_status::inactive;
    }
    return std::nullopt;
}

std::optional<target_priority> target_priority_from_string(std::string_view str)
{
    if (str == "none") {
        return target_priority::none;
    }
    if (str == "low") {
        return target_priority::low;
    }
    if (str == "medium") {
        return target_priority::medium;
    }
    if (str == "high") {
        return target_priority::high;
    }
    if (str == "critical") {
        return target_priority::critical;
    }
    return std::nullopt;
}

} // namespace scopematch
