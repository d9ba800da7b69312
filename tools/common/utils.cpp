// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include "common/utils.hpp"
#include "scopematch.h"

const char *level_to_str(SCOPEMATCH_LOG_LEVEL level)
{
    switch (level) {
    case SCOPEMATCH_LOG_TRACE:
        return "trace";
    case SCOPEMATCH_LOG_DEBUG:
        return "debug";
    case SCOPEMATCH_LOG_ERROR:
        return "error";
    case SCOPEMATCH_LOG_WARN:
        return "warn";
    case SCOPEMATCH_LOG_INFO:
        return "info";
    case SCOPEMATCH_LOG_OFF:
        break;
    }

    return "off";
}

void log_cb(SCOPEMATCH_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    std::cerr << "[" << level_to_str(level) << "][" << file << ":" << function << ":" << line
              << "]: " << message << '\n';
}

std::string read_file(std::string_view filename)
{
    std::ifstream file(std::string{filename}, std::ios::in);
    if (!file) {
        throw std::system_error(errno, std::generic_category());
    }

    // Create a buffer equal to the file size
    std::string buffer;
    file.seekg(0, std::ios::end);
    buffer.resize(file.tellg());
    file.seekg(0, std::ios::beg);

    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    file.close();
    return buffer;
}
