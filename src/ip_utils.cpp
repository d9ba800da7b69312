// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

#include "ip_utils.hpp"
#include "utils.hpp"

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
namespace scopematch {

namespace {

std::optional<unsigned> parse_decimal(std::string_view str, std::size_t max_digits)
{
    if (str.empty() || str.size() > max_digits) {
        return std::nullopt;
    }

    for (auto c : str) {
        if (!isdigit(c)) {
            return std::nullopt;
        }
    }

    unsigned value = 0;
    const char *end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<uint32_t> parse_ipv4(std::string_view str)
{
    uint32_t address = 0;
    for (unsigned i = 0; i < 4; ++i) {
        std::string_view octet_str;
        if (i < 3) {
            auto dot_idx = str.find('.');
            if (dot_idx == std::string_view::npos) {
                return std::nullopt;
            }
            octet_str = str.substr(0, dot_idx);
            str.remove_prefix(dot_idx + 1);
        } else {
            octet_str = str;
        }

        auto octet = parse_decimal(octet_str, 3);
        if (!octet.has_value() || *octet > 255) {
            return std::nullopt;
        }

        address = (address << 8U) | *octet;
    }

    return address;
}

std::optional<ipv4_network> parse_ipv4_cidr(std::string_view str, bool allow_bare)
{
    auto slash_idx = str.find('/');
    if (slash_idx == std::string_view::npos) {
        if (!allow_bare) {
            return std::nullopt;
        }

        auto address = parse_ipv4(str);
        if (!address.has_value()) {
            return std::nullopt;
        }
        return ipv4_network{*address, 32};
    }

    auto address = parse_ipv4(str.substr(0, slash_idx));
    if (!address.has_value()) {
        return std::nullopt;
    }

    auto bits = parse_decimal(str.substr(slash_idx + 1), 2);
    if (!bits.has_value() || *bits > 32) {
        return std::nullopt;
    }

    return ipv4_network{*address, static_cast<uint8_t>(*bits)};
}

} // namespace scopematch
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
