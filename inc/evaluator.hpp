// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

#include "check_config.hpp"
#include "verdict.hpp"

namespace checkhttp {

/**
 * @brief Response data handed from the request stage to the evaluator.
 *
 * The body is only captured when the check has a pattern to search for.
 */
struct ResponseOutcome {
    int status_code = 0;
    std::optional<std::string> body;
};

/**
 * @brief Pre-flight validation of a check configuration.
 *
 * Runs before any network call. Rejects:
 * - an empty URL
 * - required and forbidden patterns set together
 * - a timeout below one second
 *
 * @return UNKNOWN verdict describing the problem, or std::nullopt if valid
 */
std::optional<Verdict> validate_config(const CheckConfig& config);

/**
 * @brief Map an HTTP response onto a verdict.
 *
 * Classification order:
 * 1. An explicit expected status (not 0 or 200) must match exactly.
 * 2. 200-226 is accepted.
 * 3. 300-308 is accepted with redirect_ok, otherwise WARNING.
 * 4. Anything else is CRITICAL.
 *
 * Accepted responses then go through body verification when a pattern is set.
 * Pure function of its inputs.
 */
Verdict evaluate(const CheckConfig& config, const ResponseOutcome& outcome);

} // namespace checkhttp
