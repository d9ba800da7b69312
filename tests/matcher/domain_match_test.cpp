// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>

#include "matcher/domain_match.hpp"

#include "common/gtest_utils.hpp"

using namespace scopematch::matcher;

namespace {

TEST(TestDomainMatch, Exact)
{
    EXPECT_TRUE(match_domain("acme.com", "acme.com"));
    EXPECT_TRUE(match_domain("ACME.com", "acme.COM"));
    EXPECT_TRUE(match_domain("acme.com", "  acme.com "));

    EXPECT_FALSE(match_domain("acme.com", "api.acme.com"));
    EXPECT_FALSE(match_domain("acme.com", "acme.co"));
}

TEST(TestDomainMatch, WildcardMatchesBaseAndSubdomains)
{
    EXPECT_TRUE(match_domain("*.acme.com", "acme.com"));
    EXPECT_TRUE(match_domain("*.acme.com", "api.acme.com"));
    EXPECT_TRUE(match_domain("*.acme.com", "v2.api.acme.com"));
    EXPECT_TRUE(match_domain("*.ACME.com", "Api.Acme.Com"));
}

TEST(TestDomainMatch, WildcardRequiresLabelBoundary)
{
    EXPECT_FALSE(match_domain("*.acme.com", "evilacme.com"));
    EXPECT_FALSE(match_domain("*.acme.com", "acme.com.evil.org"));
    EXPECT_FALSE(match_domain("*.acme.com", "cme.com"));
}

TEST(TestDomainMatch, InteriorWildcardIsLiteral)
{
    EXPECT_FALSE(match_domain("api.*.com", "api.acme.com"));
    EXPECT_TRUE(match_domain("api.*.com", "api.*.com"));
}

TEST(TestDomainMatch, InvalidInputs)
{
    EXPECT_FALSE(match_domain("", "acme.com"));
    EXPECT_FALSE(match_domain("acme.com", ""));
    EXPECT_FALSE(match_domain("   ", "acme.com"));
    EXPECT_FALSE(match_domain("*.acme.com", std::string(1992, 'a') + ".acme.com"));
    EXPECT_FALSE(match_domain(std::string(501, 'a'), std::string(501, 'a')));
}

} // namespace
