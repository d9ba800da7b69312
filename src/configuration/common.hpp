// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <typeinfo>

#include <yaml-cpp/yaml.h>

#include "exception.hpp"

namespace scopematch {

template <typename T> struct yaml_traits {
    static const char *name() { return typeid(T).name(); }
};

template <> struct yaml_traits<std::string> {
    static const char *name() { return "string"; }
};

template <> struct yaml_traits<uint64_t> {
    static const char *name() { return "unsigned integer"; }
};

template <> struct yaml_traits<bool> {
    static const char *name() { return "boolean"; }
};

template <typename T> T at(const YAML::Node &map, const std::string &key)
{
    const YAML::Node value = map[key];
    if (!value.IsDefined() || value.IsNull()) {
        throw missing_key(key);
    }

    if (!value.IsScalar()) {
        throw invalid_type(key, yaml_traits<T>::name());
    }

    try {
        return value.as<T>();
    } catch (const YAML::BadConversion &) {
        throw invalid_type(key, yaml_traits<T>::name());
    }
}

template <typename T> T at(const YAML::Node &map, const std::string &key, const T &default_)
{
    const YAML::Node value = map[key];
    if (!value.IsDefined() || value.IsNull()) {
        return default_;
    }

    if (!value.IsScalar()) {
        throw invalid_type(key, yaml_traits<T>::name());
    }

    try {
        return value.as<T>();
    } catch (const YAML::BadConversion &) {
        throw invalid_type(key, yaml_traits<T>::name());
    }
}

} // namespace scopematch
