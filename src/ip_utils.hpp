// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace scopematch {

// Only IPv4 networks are supported, the address is stored in host order.
struct ipv4_network {
    uint32_t address;
    uint8_t prefix_length;

    [[nodiscard]] uint32_t mask() const
    {
        return prefix_length == 0 ? 0U : (~uint32_t{0} << (32U - prefix_length));
    }
};

// Strict dotted-quad parser: exactly four groups of one to three digits,
// each in [0, 255]. No shorthand, no whitespace, no signs.
std::optional<uint32_t> parse_ipv4(std::string_view str);

// Parses "a.b.c.d/bits" with 0 <= bits <= 32. When allow_bare is true an
// address without a prefix is accepted as a /32 network.
std::optional<ipv4_network> parse_ipv4_cidr(std::string_view str, bool allow_bare = false);

} // namespace scopematch
