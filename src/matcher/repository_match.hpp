// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>

namespace scopematch::matcher {

// Repository paths such as "github.com/org/repo". A trailing "/*" matches
// every repository under that prefix, other wildcards follow glob semantics.
bool match_repository(std::string_view pattern, std::string_view repo);

} // namespace scopematch::matcher
