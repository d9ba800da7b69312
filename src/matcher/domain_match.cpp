// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <string_view>

#include "limits.hpp"
#include "matcher/domain_match.hpp"
#include "pattern_validator.hpp"
#include "utils.hpp"

namespace scopematch::matcher {

bool match_domain(std::string_view pattern, std::string_view domain)
{
    if (pattern.empty() || domain.empty() || domain.size() > pattern_limits::max_value_length) {
        return false;
    }

    auto valid = validate_pattern(pattern);
    if (!valid.has_value()) {
        return false;
    }

    const std::string normalized_pattern = to_lower(*valid);
    const std::string normalized_domain = to_lower(trim(domain));

    if (normalized_pattern == normalized_domain) {
        return true;
    }

    if (!normalized_pattern.starts_with("*.")) {
        return false;
    }

    const std::string_view base = std::string_view{normalized_pattern}.substr(2);
    const std::string_view candidate{normalized_domain};
    if (candidate == base) {
        return true;
    }

    return candidate.size() > base.size() && candidate.ends_with(base) &&
           candidate[candidate.size() - base.size() - 1] == '.';
}

} // namespace scopematch::matcher
