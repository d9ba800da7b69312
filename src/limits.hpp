// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <chrono>
#include <cstddef>

namespace scopematch {

// Upper bounds applied to every pattern and candidate value before matching,
// these keep the cost of a single match linear in the candidate length.
struct pattern_limits {
    static constexpr std::size_t max_pattern_length = 500;
    static constexpr std::size_t max_value_length = 2000;
    static constexpr std::size_t max_wildcards = 10;
    static constexpr std::size_t max_cidr_length = 50;
};

struct engine_settings {
    std::chrono::milliseconds cache_ttl{5000};
    std::size_t cache_capacity{100};
};

} // namespace scopematch
