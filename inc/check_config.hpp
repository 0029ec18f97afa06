// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

namespace checkhttp {

/// Default request deadline in seconds.
constexpr int DEFAULT_TIMEOUT_SECONDS = 15;

/**
 * @brief Expectations for a single HTTP check.
 *
 * Resolved once from the command line, environment and optional check
 * definition file, then passed by const reference to every stage.
 */
struct CheckConfig {
    std::string url;
    int timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
    bool redirect_ok = false;
    std::optional<int> expected_status; ///< Unset, 0 and 200 select the default 2xx/3xx policy
    std::string required_pattern;       ///< Must be present in the body (--query)
    std::string forbidden_pattern;      ///< Must be absent from the body (--negquery)

    /**
     * @brief True when an exact status code other than the default was requested.
     */
    [[nodiscard]] bool has_explicit_expectation() const {
        return expected_status.has_value() && *expected_status != 0 && *expected_status != 200;
    }

    /**
     * @brief Pattern to search for, required pattern first. Empty when none is set.
     */
    [[nodiscard]] const std::string& active_pattern() const {
        return required_pattern.empty() ? forbidden_pattern : required_pattern;
    }

    /**
     * @brief True when the active pattern must be absent from the body.
     */
    [[nodiscard]] bool pattern_forbidden() const {
        return required_pattern.empty() && !forbidden_pattern.empty();
    }
};

} // namespace checkhttp
