// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <array>
#include <span>
#include <string_view>

#include "scope_types.hpp"
#include "type_compatibility.hpp"

namespace scopematch {

namespace {

using namespace std::literals;

constexpr std::array domain_assets{"domain"sv, "subdomain"sv, "website"sv, "api"sv, "certificate"sv};
constexpr std::array subdomain_assets{"domain"sv, "subdomain"sv, "website"sv, "api"sv};
constexpr std::array certificate_assets{"certificate"sv, "domain"sv, "website"sv};
constexpr std::array email_domain_assets{"domain"sv, "email_domain"sv};
constexpr std::array ip_assets{"ip_address"sv, "ip"sv, "host"sv, "service"sv};
constexpr std::array repository_assets{"repository"sv};
constexpr std::array cloud_account_assets{"cloud"sv, "cloud_account"sv};
constexpr std::array api_assets{"api"sv, "website"sv, "service"sv};
constexpr std::array website_assets{"website"sv, "domain"sv, "api"sv};
constexpr std::array path_assets{"website"sv, "api"sv};
constexpr std::array container_assets{"container"sv};
constexpr std::array database_assets{"database"sv, "service"sv};
constexpr std::array host_assets{"host"sv, "ip_address"sv, "ip"sv, "service"sv, "database"sv};

} // namespace

std::span<const std::string_view> compatible_asset_types(target_type type)
{
    switch (type) {
    case target_type::domain:
        return domain_assets;
    case target_type::subdomain:
        return subdomain_assets;
    case target_type::certificate:
        return certificate_assets;
    case target_type::email_domain:
        return email_domain_assets;
    case target_type::ip_address:
    case target_type::ip_range:
        return ip_assets;
    case target_type::repository:
        return repository_assets;
    case target_type::cloud_account:
        return cloud_account_assets;
    case target_type::api:
        return api_assets;
    case target_type::website:
        return website_assets;
    case target_type::path:
        return path_assets;
    case target_type::container:
        return container_assets;
    case target_type::database:
        return database_assets;
    case target_type::host:
        return host_assets;
    }
    return {};
}

bool is_type_compatible(target_type type, std::string_view asset_type)
{
    auto allowed = compatible_asset_types(type);
    return std::find(allowed.begin(), allowed.end(), asset_type) != allowed.end();
}

} // namespace scopematch
