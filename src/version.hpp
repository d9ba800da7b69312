// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>

namespace scopematch {

constexpr std::string_view current_version{"1.0.0"};

// Major version of the ruleset document format understood by the loader
constexpr unsigned ruleset_schema_major = 1;

} // namespace scopematch
