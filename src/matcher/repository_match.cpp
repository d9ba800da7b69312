// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <string_view>

#include "limits.hpp"
#include "matcher/repository_match.hpp"
#include "matcher/wildcard_match.hpp"
#include "pattern_validator.hpp"
#include "utils.hpp"

namespace scopematch::matcher {

bool match_repository(std::string_view pattern, std::string_view repo)
{
    if (pattern.empty() || repo.empty() || repo.size() > pattern_limits::max_value_length) {
        return false;
    }

    auto valid = validate_pattern(pattern);
    if (!valid.has_value()) {
        return false;
    }

    const std::string normalized_pattern = to_lower(*valid);
    const std::string normalized_repo = to_lower(trim(repo));

    if (normalized_pattern == normalized_repo) {
        return true;
    }

    if (normalized_pattern.ends_with("/*")) {
        // Keep the trailing slash so that "org/*" doesn't match "organisation/..."
        const std::string_view prefix =
            std::string_view{normalized_pattern}.substr(0, normalized_pattern.size() - 1);
        return normalized_repo.starts_with(prefix);
    }

    return match_wildcard(normalized_pattern, normalized_repo);
}

} // namespace scopematch::matcher
