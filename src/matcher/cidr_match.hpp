// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>

namespace scopematch::matcher {

// Whether the IPv4 address ip belongs to the a.b.c.d/bits network cidr.
bool match_cidr(std::string_view cidr, std::string_view ip);

} // namespace scopematch::matcher
