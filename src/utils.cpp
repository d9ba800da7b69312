// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

#include "utils.hpp"

namespace scopematch {

std::string_view trim(std::string_view str)
{
    while (!str.empty() && isspace(str.front())) { str.remove_prefix(1); }
    while (!str.empty() && isspace(str.back())) { str.remove_suffix(1); }
    return str;
}

std::string to_lower(std::string_view str)
{
    std::string result;
    result.reserve(str.size());
    for (auto c : str) { result.push_back(tolower(c)); }
    return result;
}

std::string to_upper(std::string_view str)
{
    std::string result;
    result.reserve(str.size());
    for (auto c : str) { result.push_back(toupper(c)); }
    return result;
}

std::size_t count_char(std::string_view str, char c)
{
    return static_cast<std::size_t>(std::count(str.begin(), str.end(), c));
}

} // namespace scopematch
