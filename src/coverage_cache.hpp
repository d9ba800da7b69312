// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <boost/unordered_map.hpp>

#include "log.hpp"
#include "scope_types.hpp"

namespace scopematch {

// Memoizes coverage results for a bounded period of time. Entries expire
// ttl after insertion; when the cache is full the least recently served
// entry is evicted to make room for the new one.
template <typename Clock = std::chrono::steady_clock> class coverage_cache {
public:
    using clock_type = Clock;
    using time_point = typename Clock::time_point;
    using value_type = std::shared_ptr<const scope_coverage>;

    explicit coverage_cache(
        std::chrono::milliseconds ttl = std::chrono::milliseconds{5000}, std::size_t capacity = 100)
        : ttl_(ttl), capacity_(capacity)
    {}

    ~coverage_cache() = default;
    coverage_cache(const coverage_cache &) = delete;
    coverage_cache(coverage_cache &&) = delete;
    coverage_cache &operator=(const coverage_cache &) = delete;
    coverage_cache &operator=(coverage_cache &&) = delete;

    // Returns nullptr when the key is unknown or its entry has expired
    value_type find(const std::string &key)
    {
        const std::lock_guard<std::mutex> lock(mtx_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            return nullptr;
        }

        auto now = Clock::now();
        if (now - it->second.inserted >= ttl_) {
            SCOPEMATCH_TRACE("Coverage cache entry expired");
            return nullptr;
        }

        it->second.last_access = now;
        return it->second.data;
    }

    void insert(std::string key, value_type data)
    {
        const std::lock_guard<std::mutex> lock(mtx_);

        if (capacity_ == 0) {
            return;
        }

        auto now = Clock::now();
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second = cache_entry{now, now, std::move(data)};
            return;
        }

        if (index_.size() >= capacity_) {
            remove_least_recent_entry();
        }

        index_.emplace(std::move(key), cache_entry{now, now, std::move(data)});
    }

    void clear()
    {
        const std::lock_guard<std::mutex> lock(mtx_);
        index_.clear();
    }

    [[nodiscard]] std::size_t size() const
    {
        const std::lock_guard<std::mutex> lock(mtx_);
        return index_.size();
    }

    [[nodiscard]] std::chrono::milliseconds ttl() const { return ttl_; }
    [[nodiscard]] std::size_t capacity() const { return capacity_; }

protected:
    struct cache_entry {
        time_point inserted;
        time_point last_access;
        value_type data;
    };

    void remove_least_recent_entry()
    {
        auto oldest_it = index_.begin();
        for (auto it = index_.begin(); it != index_.end(); ++it) {
            if (it->second.last_access < oldest_it->second.last_access) {
                oldest_it = it;
            }
        }

        if (oldest_it != index_.end()) {
            SCOPEMATCH_DEBUG("Evicting coverage cache entry, capacity {} reached", capacity_);
            index_.erase(oldest_it);
        }
    }

    std::chrono::milliseconds ttl_;
    std::size_t capacity_;
    mutable std::mutex mtx_;
    boost::unordered_map<std::string, cache_entry> index_;
};

} // namespace scopematch
