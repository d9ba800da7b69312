// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace scopematch {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isalpha(char c) { return (static_cast<unsigned>(c) | 32) - 'a' < 26; }
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isspace(char c)
{
    return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}
inline bool isupper(char c) { return static_cast<unsigned>(c) - 'A' < 26; }
inline bool islower(char c) { return static_cast<unsigned>(c) - 'a' < 26; }
inline bool isalnum(char c) { return isalpha(c) || isdigit(c); }
inline char tolower(char c) { return isupper(c) ? static_cast<char>(c | 32) : c; }
inline char toupper(char c) { return islower(c) ? static_cast<char>(c & ~32) : c; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

std::string_view trim(std::string_view str);
std::string to_lower(std::string_view str);
std::string to_upper(std::string_view str);
std::size_t count_char(std::string_view str, char c);

} // namespace scopematch
