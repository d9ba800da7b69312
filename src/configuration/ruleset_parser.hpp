// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "limits.hpp"
#include "ruleset_info.hpp"
#include "scope_types.hpp"

namespace scopematch {

struct scope_ruleset {
    std::vector<scope_target> targets;
    std::vector<scope_exclusion> exclusions;
    engine_settings settings;
};

// Parses a ruleset document. Individual targets and exclusions which fail to
// parse are reported in the diagnostics and left out, structural problems
// with the document itself throw parsing_error.
scope_ruleset parse_ruleset(const YAML::Node &root, ruleset_info &info);

// Accepts either a sequence of assets or a map with an "assets" sequence.
std::vector<asset> parse_assets(const YAML::Node &root, ruleset_info::section_info &info);

// Wraps YAML::Load, converting syntax errors into parsing_error
YAML::Node load_document(std::string_view contents);

} // namespace scopematch
