// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <span>

#include "coverage.hpp"
#include "coverage_cache.hpp"
#include "limits.hpp"
#include "log.hpp"
#include "scope_types.hpp"

namespace scopematch {

template <typename Clock = std::chrono::steady_clock> class base_coverage_calculator {
public:
    explicit base_coverage_calculator(const engine_settings &settings = {})
        : cache_(settings.cache_ttl, settings.cache_capacity)
    {}

    std::shared_ptr<const scope_coverage> calculate(std::span<const asset> assets,
        std::span<const scope_target> targets, std::span<const scope_exclusion> exclusions)
    {
        auto key = coverage_cache_key(assets, targets, exclusions);
        if (auto cached = cache_.find(key); cached) {
            SCOPEMATCH_DEBUG("Serving coverage of {} assets from cache", assets.size());
            return cached;
        }

        SCOPEMATCH_TRACE("Coverage cache miss, scanning {} assets", assets.size());

        auto result = std::make_shared<const scope_coverage>(
            calculate_scope_coverage(assets, targets, exclusions));
        scanned_assets_ += assets.size();

        cache_.insert(std::move(key), result);
        return result;
    }

    void clear_cache() { cache_.clear(); }

    // Number of assets evaluated by the matcher since construction, cache
    // hits don't contribute to it.
    [[nodiscard]] std::size_t scanned_assets() const { return scanned_assets_.load(); }

    [[nodiscard]] const coverage_cache<Clock> &cache() const { return cache_; }

protected:
    coverage_cache<Clock> cache_;
    std::atomic<std::size_t> scanned_assets_{0};
};

using coverage_calculator = base_coverage_calculator<>;

} // namespace scopematch
