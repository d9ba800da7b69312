// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <vector>

#include "coverage.hpp"

#include "common/gtest_utils.hpp"

using namespace scopematch;
using namespace scopematch::test;

namespace {

TEST(TestCoverage, EndToEnd)
{
    std::vector<scope_target> targets{make_target("t1", target_type::domain, "*.acme.com")};
    std::vector<scope_exclusion> exclusions{
        make_exclusion("e1", target_type::domain, "status.acme.com", "third-party")};
    std::vector<asset> assets{
        make_asset("a1", "website", "api.acme.com"),
        make_asset("a2", "website", "status.acme.com"),
    };

    auto coverage = calculate_scope_coverage(assets, targets, exclusions);
    EXPECT_EQ(coverage.total_assets, 2);
    EXPECT_EQ(coverage.in_scope_assets, 1);
    EXPECT_EQ(coverage.excluded_assets, 1);
    EXPECT_EQ(coverage.uncovered_assets, 0);
    EXPECT_EQ(coverage.coverage_percent, 50);

    ASSERT_EQ(coverage.by_type.size(), 1);
    EXPECT_EQ(coverage.by_type.at("website"),
        (type_coverage{.total = 2, .in_scope = 1, .excluded = 1}));
}

TEST(TestCoverage, NoAssets)
{
    std::vector<scope_target> targets{make_target("t1", target_type::domain, "*.acme.com")};

    auto coverage = calculate_scope_coverage({}, targets, {});
    EXPECT_EQ(coverage, scope_coverage{});
    EXPECT_EQ(coverage.coverage_percent, 0);
}

TEST(TestCoverage, CountsAddUp)
{
    std::vector<scope_target> targets{
        make_target("t1", target_type::domain, "*.acme.com"),
        make_target("t2", target_type::ip_range, "10.0.0.0/8"),
        make_target("t3", target_type::repository, "github.com/acme/*"),
    };
    std::vector<scope_exclusion> exclusions{
        make_exclusion("e1", target_type::ip_address, "10.0.0.13", "honeypot"),
        make_exclusion("e2", target_type::domain, "legacy.acme.com", "decommissioned"),
    };
    std::vector<asset> assets{
        make_asset("a1", "domain", "acme.com"),
        make_asset("a2", "domain", "legacy.acme.com"),
        make_asset("a3", "domain", "acme.org"),
        make_asset("a4", "ip", "10.0.0.1"),
        make_asset("a5", "ip", "10.0.0.13"),
        make_asset("a6", "ip", "192.168.1.1"),
        make_asset("a7", "repository", "api", {{"org", "acme"}}),
        make_asset("a8", "repository", "api", {{"org", "other"}}),
        make_asset("a9", "mainframe", "acme.com"),
    };

    auto coverage = calculate_scope_coverage(assets, targets, exclusions);
    EXPECT_EQ(coverage.total_assets, 9);
    EXPECT_EQ(coverage.in_scope_assets, 3);
    EXPECT_EQ(coverage.excluded_assets, 2);
    EXPECT_EQ(coverage.uncovered_assets, 4);
    EXPECT_EQ(coverage.in_scope_assets + coverage.excluded_assets + coverage.uncovered_assets,
        coverage.total_assets);
    EXPECT_EQ(coverage.coverage_percent, 33);

    EXPECT_EQ(coverage.by_type.at("domain"),
        (type_coverage{.total = 3, .in_scope = 1, .excluded = 1}));
    EXPECT_EQ(
        coverage.by_type.at("ip"), (type_coverage{.total = 3, .in_scope = 1, .excluded = 1}));
    EXPECT_EQ(coverage.by_type.at("repository"),
        (type_coverage{.total = 2, .in_scope = 1, .excluded = 0}));
    EXPECT_EQ(coverage.by_type.at("mainframe"),
        (type_coverage{.total = 1, .in_scope = 0, .excluded = 0}));

    std::size_t by_type_total = 0;
    for (const auto &[type, stats] : coverage.by_type) { by_type_total += stats.total; }
    EXPECT_EQ(by_type_total, coverage.total_assets);
}

TEST(TestCoverage, PercentIsRounded)
{
    std::vector<scope_target> targets{make_target("t1", target_type::domain, "acme.com")};

    // 2 of 3 in scope, 66.67% rounds up
    std::vector<asset> assets{
        make_asset("a1", "domain", "acme.com"),
        make_asset("a2", "domain", "acme.com"),
        make_asset("a3", "domain", "acme.org"),
    };
    EXPECT_EQ(calculate_scope_coverage(assets, targets, {}).coverage_percent, 67);

    // 1 of 8 in scope, 12.5% rounds half up
    assets = {make_asset("a1", "domain", "acme.com")};
    for (unsigned i = 2; i <= 8; ++i) {
        assets.emplace_back(make_asset("a" + std::to_string(i), "domain", "acme.org"));
    }
    EXPECT_EQ(calculate_scope_coverage(assets, targets, {}).coverage_percent, 13);

    assets = {make_asset("a1", "domain", "acme.com")};
    EXPECT_EQ(calculate_scope_coverage(assets, targets, {}).coverage_percent, 100);
}

TEST(TestCoverage, CacheKeyIsOrderIndependent)
{
    std::vector<asset> assets{make_asset("b", "domain", "b.com"), make_asset("a", "domain", "a.com")};
    std::vector<scope_target> targets{make_target("t2", target_type::domain, "b.com"),
        make_target("t1", target_type::domain, "a.com")};
    std::vector<scope_exclusion> exclusions{
        make_exclusion("e1", target_type::domain, "a.com", "")};

    EXPECT_EQ(coverage_cache_key(assets, targets, exclusions), "a,b:t1,t2:e1");

    std::vector<asset> reversed{assets.rbegin(), assets.rend()};
    EXPECT_EQ(coverage_cache_key(reversed, targets, exclusions),
        coverage_cache_key(assets, targets, exclusions));

    EXPECT_EQ(coverage_cache_key({}, {}, {}), "::");
}

TEST(TestCoverage, CacheKeyIgnoresRuleContents)
{
    std::vector<asset> assets{make_asset("a", "domain", "a.com")};
    std::vector<scope_target> first{make_target("t1", target_type::domain, "a.com")};
    std::vector<scope_target> second{make_target("t1", target_type::domain, "b.com")};

    EXPECT_EQ(coverage_cache_key(assets, first, {}), coverage_cache_key(assets, second, {}));
}

} // namespace
