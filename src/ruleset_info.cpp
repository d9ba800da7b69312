// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <string_view>
#include <vector>

#include "ruleset_info.hpp"

namespace scopematch {

void ruleset_info::section_info::add_failed(std::string_view id, std::string_view error)
{
    failed_.emplace_back(id);

    auto it = errors_.find(error);
    if (it == errors_.end()) {
        auto [new_it, res] = errors_.emplace(std::string{error}, std::vector<std::string>{});
        it = new_it;
    }
    it->second.emplace_back(id);
}

ruleset_info_state ruleset_info::state() const noexcept
{
    if (!error_.empty()) {
        return ruleset_info_state::invalid;
    }

    auto final_state = ruleset_info_state::empty;
    for (const auto &[_, section] : sections_) {
        switch (section.state()) {
        case ruleset_info_state::valid:
            return ruleset_info_state::valid;
        case ruleset_info_state::invalid:
            final_state = ruleset_info_state::invalid;
            break;
        default:
            break;
        }
    }
    return final_state;
}

} // namespace scopematch
