// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "utils.hpp"

#include "common/gtest_utils.hpp"

using namespace scopematch;

namespace {

TEST(TestUtils, Trim)
{
    EXPECT_STR(trim("  acme.com \t\n"), "acme.com");
    EXPECT_STR(trim("acme.com"), "acme.com");
    EXPECT_STR(trim(" \r\n "), "");
    EXPECT_STR(trim(""), "");
    EXPECT_STR(trim(" a b "), "a b");
}

TEST(TestUtils, CaseConversion)
{
    EXPECT_EQ(to_lower("API.Acme.COM-1"), "api.acme.com-1");
    EXPECT_EQ(to_upper("aws:prod-1"), "AWS:PROD-1");
    EXPECT_EQ(to_lower(""), "");
}

TEST(TestUtils, CountChar)
{
    EXPECT_EQ(count_char("*.*.acme.*", '*'), 3U);
    EXPECT_EQ(count_char("acme.com", '*'), 0U);
    EXPECT_EQ(count_char("", '*'), 0U);
}

} // namespace
