// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>

namespace scopematch::matcher {

// Case-insensitive glob where '*' matches any sequence of characters. The
// pattern is scanned once, left to right, without backtracking.
bool match_wildcard(std::string_view pattern, std::string_view value);

} // namespace scopematch::matcher
