// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>

namespace scopematch::matcher {

// Exact domain comparison, or "*.base" matching base itself and any of its
// subdomains. Other wildcard placements never match.
bool match_domain(std::string_view pattern, std::string_view domain);

} // namespace scopematch::matcher
