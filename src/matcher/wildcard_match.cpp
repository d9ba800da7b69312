// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>

#include "limits.hpp"
#include "matcher/wildcard_match.hpp"
#include "pattern_validator.hpp"
#include "utils.hpp"

namespace scopematch::matcher {

bool match_wildcard(std::string_view pattern, std::string_view value)
{
    if (pattern.empty() || value.empty() || value.size() > pattern_limits::max_value_length) {
        return false;
    }

    auto valid = validate_pattern(pattern);
    if (!valid.has_value()) {
        return false;
    }

    const std::string lowered_pattern = to_lower(*valid);
    const std::string lowered_value = to_lower(value);
    const std::string_view p{lowered_pattern};
    const std::string_view v{lowered_value};

    if (p.find('*') == std::string_view::npos) {
        return p == v;
    }

    const bool anchored_start = p.front() != '*';
    const bool anchored_end = p.back() != '*';

    std::size_t value_idx = 0;
    std::size_t segment_start = 0;
    bool first = true;
    while (segment_start <= p.size()) {
        auto segment_end = p.find('*', segment_start);
        const bool last = segment_end == std::string_view::npos;
        if (last) {
            segment_end = p.size();
        }

        auto segment = p.substr(segment_start, segment_end - segment_start);
        segment_start = segment_end + 1;

        if (segment.empty()) {
            first = false;
            if (last) {
                break;
            }
            continue;
        }

        if (first && anchored_start) {
            if (!v.starts_with(segment)) {
                return false;
            }
            value_idx = segment.size();
        } else if (last && anchored_end) {
            if (!v.ends_with(segment)) {
                return false;
            }
            value_idx = v.size();
        } else {
            auto found = v.find(segment, value_idx);
            if (found == std::string_view::npos) {
                return false;
            }
            value_idx = found + segment.size();
        }

        first = false;
        if (last) {
            break;
        }
    }

    return true;
}

} // namespace scopematch::matcher
