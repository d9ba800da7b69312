// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <exception>
#include <string>
#include <utility>

namespace scopematch {

class exception : public std::exception {
public:
    explicit exception(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    std::string what_;
};

class parsing_error : public exception {
public:
    explicit parsing_error(const std::string &what) : exception(what) {}
};

class missing_key : public parsing_error {
public:
    explicit missing_key(const std::string &key) : parsing_error("missing key '" + key + "'") {}
};

class invalid_type : public parsing_error {
public:
    invalid_type(const std::string &key, const std::string &expected)
        : parsing_error("invalid type for key '" + key + "', expected " + expected)
    {}
};

} // namespace scopematch
