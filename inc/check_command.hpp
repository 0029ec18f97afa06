// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "check_config.hpp"
#include "http_request.hpp"
#include "verdict.hpp"

namespace checkhttp {

/**
 * @brief Run one HTTP check and produce its verdict.
 *
 * Stages, executed once with no retry:
 * 1. Pre-flight validation (UNKNOWN on configuration errors, no request made)
 * 2. Request stage (CRITICAL on timeout or transport failure)
 * 3. Response evaluation
 *
 * Never throws; every failure is reported through the returned verdict.
 *
 * @param config Check configuration
 * @param http_get Custom HTTP GET function for dependency injection/testing
 * @return Verdict for this invocation
 */
Verdict run_check(const CheckConfig& config, HttpGetFunction http_get = make_http_request);

} // namespace checkhttp
