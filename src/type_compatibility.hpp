// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <span>
#include <string_view>

#include "scope_types.hpp"

namespace scopematch {

// Asset types a target of the given type is allowed to match against.
std::span<const std::string_view> compatible_asset_types(target_type type);

bool is_type_compatible(target_type type, std::string_view asset_type);

} // namespace scopematch
