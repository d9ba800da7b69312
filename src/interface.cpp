// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>

#include "log.hpp"
#include "scopematch.h"
#include "version.hpp"

// The log levels of the C interface and the internal logger must stay aligned
static_assert(static_cast<uint32_t>(SCOPEMATCH_LOG_TRACE) ==
              static_cast<uint32_t>(scopematch::log_level::trace));
static_assert(static_cast<uint32_t>(SCOPEMATCH_LOG_OFF) ==
              static_cast<uint32_t>(scopematch::log_level::off));

extern "C" {

const char *scopematch_get_version() { return scopematch::current_version.data(); }

bool scopematch_set_log_cb(scopematch_log_cb cb, SCOPEMATCH_LOG_LEVEL min_level)
{
    scopematch::logger::init(cb, static_cast<scopematch::log_level>(min_level));
    SCOPEMATCH_INFO("Sending log messages to binding, min level {}",
        scopematch::log_level_to_str(static_cast<scopematch::log_level>(min_level)));
    return true;
}

} // extern "C"
