// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string_view>

#include "limits.hpp"
#include "matcher/cloud_account_match.hpp"
#include "pattern_validator.hpp"
#include "utils.hpp"

namespace scopematch::matcher {

bool match_cloud_account(std::string_view pattern, std::string_view account)
{
    if (pattern.empty() || account.empty() ||
        account.size() > pattern_limits::max_value_length) {
        return false;
    }

    auto valid = validate_pattern(pattern);
    if (!valid.has_value()) {
        return false;
    }

    return to_upper(*valid) == to_upper(trim(account));
}

} // namespace scopematch::matcher
