// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <span>
#include <string>

#include <yaml-cpp/yaml.h>

#include "ruleset_info.hpp"
#include "scope_types.hpp"

namespace scopematch {

YAML::Node to_yaml(const scope_match_result &result);
YAML::Node to_yaml(const scope_coverage &coverage);
YAML::Node to_yaml(const ruleset_info &info);
// Listing of the loaded targets, including their reporting fields
YAML::Node to_yaml(std::span<const scope_target> targets);

std::string to_json(const scope_match_result &result);
std::string to_json(const scope_coverage &coverage);

} // namespace scopematch
