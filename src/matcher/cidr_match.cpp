// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string_view>

#include "ip_utils.hpp"
#include "limits.hpp"
#include "matcher/cidr_match.hpp"

namespace scopematch::matcher {

bool match_cidr(std::string_view cidr, std::string_view ip)
{
    if (cidr.empty() || ip.empty() || cidr.size() > pattern_limits::max_cidr_length ||
        ip.size() > pattern_limits::max_cidr_length) {
        return false;
    }

    auto network = parse_ipv4_cidr(cidr);
    if (!network.has_value()) {
        return false;
    }

    auto address = parse_ipv4(ip);
    if (!address.has_value()) {
        return false;
    }

    const auto mask = network->mask();
    return (network->address & mask) == (*address & mask);
}

} // namespace scopematch::matcher
