// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <chrono>
#include <memory>
#include <span>
#include <vector>

#include "coverage_cache.hpp"
#include "coverage_calculator.hpp"

#include "common/gtest_utils.hpp"

using namespace scopematch;
using namespace scopematch::test;
using namespace std::literals;

namespace {

struct manual_clock {
    using duration = std::chrono::milliseconds;
    using rep = duration::rep;
    using period = duration::period;
    using time_point = std::chrono::time_point<manual_clock, duration>;
    static constexpr bool is_steady = true;

    static time_point now() { return current; }
    static void advance(duration d) { current += d; }
    static void reset() { current = time_point{}; }

    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline time_point current{};
};

std::shared_ptr<const scope_coverage> make_coverage(std::size_t total)
{
    scope_coverage coverage;
    coverage.total_assets = total;
    coverage.uncovered_assets = total;
    return std::make_shared<const scope_coverage>(coverage);
}

TEST(TestCoverageCache, FindUnknownKey)
{
    manual_clock::reset();
    coverage_cache<manual_clock> cache;

    EXPECT_EQ(cache.find("a:t:e"), nullptr);
    EXPECT_EQ(cache.size(), 0);
    EXPECT_EQ(cache.ttl(), 5000ms);
    EXPECT_EQ(cache.capacity(), 100);
}

TEST(TestCoverageCache, InsertAndFind)
{
    manual_clock::reset();
    coverage_cache<manual_clock> cache;

    auto coverage = make_coverage(3);
    cache.insert("a:t:e", coverage);
    EXPECT_EQ(cache.size(), 1);
    EXPECT_EQ(cache.find("a:t:e"), coverage);
    EXPECT_EQ(cache.find("b:t:e"), nullptr);
}

TEST(TestCoverageCache, EntriesExpireAfterTtl)
{
    manual_clock::reset();
    coverage_cache<manual_clock> cache{1000ms, 10};

    auto coverage = make_coverage(1);
    cache.insert("key", coverage);

    manual_clock::advance(999ms);
    EXPECT_EQ(cache.find("key"), coverage);

    // Accessing the entry doesn't extend its lifetime
    manual_clock::advance(1ms);
    EXPECT_EQ(cache.find("key"), nullptr);
}

TEST(TestCoverageCache, ReinsertRefreshesEntry)
{
    manual_clock::reset();
    coverage_cache<manual_clock> cache{1000ms, 10};

    cache.insert("key", make_coverage(1));
    manual_clock::advance(900ms);

    auto updated = make_coverage(2);
    cache.insert("key", updated);
    EXPECT_EQ(cache.size(), 1);

    manual_clock::advance(900ms);
    EXPECT_EQ(cache.find("key"), updated);
}

TEST(TestCoverageCache, EvictsLeastRecentlyUsed)
{
    manual_clock::reset();
    coverage_cache<manual_clock> cache{10000ms, 2};

    auto first = make_coverage(1);
    auto second = make_coverage(2);
    auto third = make_coverage(3);

    cache.insert("first", first);
    manual_clock::advance(1ms);
    cache.insert("second", second);
    manual_clock::advance(1ms);

    EXPECT_EQ(cache.find("first"), first);
    manual_clock::advance(1ms);

    cache.insert("third", third);
    EXPECT_EQ(cache.size(), 2);
    EXPECT_EQ(cache.find("first"), first);
    EXPECT_EQ(cache.find("second"), nullptr);
    EXPECT_EQ(cache.find("third"), third);
}

TEST(TestCoverageCache, ZeroCapacityCachesNothing)
{
    manual_clock::reset();
    coverage_cache<manual_clock> cache{1000ms, 0};

    cache.insert("key", make_coverage(1));
    EXPECT_EQ(cache.size(), 0);
    EXPECT_EQ(cache.find("key"), nullptr);
}

TEST(TestCoverageCache, Clear)
{
    manual_clock::reset();
    coverage_cache<manual_clock> cache;

    cache.insert("first", make_coverage(1));
    cache.insert("second", make_coverage(2));
    EXPECT_EQ(cache.size(), 2);

    cache.clear();
    EXPECT_EQ(cache.size(), 0);
    EXPECT_EQ(cache.find("first"), nullptr);
}

class TestCoverageCalculator : public ::testing::Test {
public:
    void SetUp() override { manual_clock::reset(); }

protected:
    std::vector<scope_target> targets{make_target("t1", target_type::domain, "*.acme.com")};
    std::vector<scope_exclusion> exclusions{
        make_exclusion("e1", target_type::domain, "status.acme.com", "third-party")};
    std::vector<asset> assets{
        make_asset("a1", "website", "api.acme.com"),
        make_asset("a2", "website", "status.acme.com"),
    };
};

TEST_F(TestCoverageCalculator, RepeatedCallsAreServedFromCache)
{
    base_coverage_calculator<manual_clock> calculator;

    auto first = calculator.calculate(assets, targets, exclusions);
    EXPECT_EQ(calculator.scanned_assets(), 2);
    EXPECT_EQ(first->in_scope_assets, 1);
    EXPECT_EQ(first->excluded_assets, 1);
    EXPECT_EQ(first->coverage_percent, 50);

    manual_clock::advance(100ms);

    auto second = calculator.calculate(assets, targets, exclusions);
    EXPECT_EQ(calculator.scanned_assets(), 2);
    EXPECT_EQ(first, second);
    EXPECT_EQ(*first, *second);
}

TEST_F(TestCoverageCalculator, SameIdsInDifferentOrderHitTheCache)
{
    base_coverage_calculator<manual_clock> calculator;

    auto first = calculator.calculate(assets, targets, exclusions);

    std::vector<asset> reversed{assets.rbegin(), assets.rend()};
    auto second = calculator.calculate(reversed, targets, exclusions);
    EXPECT_EQ(calculator.scanned_assets(), 2);
    EXPECT_EQ(first, second);
}

TEST_F(TestCoverageCalculator, ExpiredResultIsRecomputed)
{
    base_coverage_calculator<manual_clock> calculator{
        engine_settings{.cache_ttl = 1000ms, .cache_capacity = 10}};

    auto first = calculator.calculate(assets, targets, exclusions);
    manual_clock::advance(1000ms);

    auto second = calculator.calculate(assets, targets, exclusions);
    EXPECT_EQ(calculator.scanned_assets(), 4);
    EXPECT_NE(first, second);
    EXPECT_EQ(*first, *second);
}

TEST_F(TestCoverageCalculator, DifferentInputsMissTheCache)
{
    base_coverage_calculator<manual_clock> calculator;

    calculator.calculate(assets, targets, exclusions);
    auto partial = calculator.calculate(std::span<const asset>{assets}.first(1), targets, exclusions);

    EXPECT_EQ(calculator.scanned_assets(), 3);
    EXPECT_EQ(partial->total_assets, 1);
    EXPECT_EQ(partial->in_scope_assets, 1);
    EXPECT_EQ(calculator.cache().size(), 2);
}

TEST_F(TestCoverageCalculator, ClearCacheForcesRecomputation)
{
    base_coverage_calculator<manual_clock> calculator;

    calculator.calculate(assets, targets, exclusions);
    calculator.clear_cache();
    EXPECT_EQ(calculator.cache().size(), 0);

    calculator.calculate(assets, targets, exclusions);
    EXPECT_EQ(calculator.scanned_assets(), 4);
}

TEST_F(TestCoverageCalculator, DisabledCache)
{
    base_coverage_calculator<manual_clock> calculator{
        engine_settings{.cache_ttl = 1000ms, .cache_capacity = 0}};

    calculator.calculate(assets, targets, exclusions);
    calculator.calculate(assets, targets, exclusions);
    EXPECT_EQ(calculator.scanned_assets(), 4);
}

} // namespace
