// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "scope_types.hpp"

#include "common/gtest_utils.hpp"

using namespace scopematch;

namespace {

TEST(TestScopeTypes, TargetTypeNames)
{
    for (auto type : {target_type::domain, target_type::subdomain, target_type::certificate,
             target_type::email_domain, target_type::ip_address, target_type::ip_range,
             target_type::repository, target_type::cloud_account, target_type::api,
             target_type::website, target_type::path, target_type::container,
             target_type::database, target_type::host}) {
        auto parsed = target_type_from_string(to_string(type));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(*parsed, type);
    }

    EXPECT_STR(to_string(target_type::email_domain), "email_domain");
    EXPECT_FALSE(target_type_from_string("Domain"));
    EXPECT_FALSE(target_type_from_string("ip"));
    EXPECT_FALSE(target_type_from_string(""));
}

TEST(TestScopeTypes, StatusAndPriority)
{
    EXPECT_EQ(target_status_from_string("active"), target_status::active);
    EXPECT_EQ(target_status_from_string("inactive"), target_status::inactive);
    EXPECT_FALSE(target_status_from_string("paused"));

    EXPECT_EQ(target_priority_from_string("critical"), target_priority::critical);
    EXPECT_EQ(target_priority_from_string("none"), target_priority::none);
    EXPECT_FALSE(target_priority_from_string("urgent"));

    EXPECT_STR(to_string(target_status::inactive), "inactive");
    EXPECT_STR(to_string(target_priority::medium), "medium");
}

TEST(TestScopeTypes, MatchTypeNames)
{
    EXPECT_STR(to_string(match_type::exact), "exact");
    EXPECT_STR(to_string(match_type::wildcard), "wildcard");
    EXPECT_STR(to_string(match_type::cidr), "cidr");
    EXPECT_STR(to_string(match_type::regex), "regex");
}

} // namespace
