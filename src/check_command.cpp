// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "check_command.hpp"

#include "evaluator.hpp"
#include "logger.hpp"

#include <string>
#include <variant>

namespace checkhttp {

Verdict run_check(const CheckConfig& config, HttpGetFunction http_get) {
    if (!http_get) {
        return {Status::Unknown, "no HTTP client available"};
    }

    if (auto invalid = validate_config(config)) {
        LOG_WARN_ENTRY(LogEntry("Invalid check configuration")
                           .component("check")
                           .operation("validate")
                           .error({"ConfigurationError", invalid->message}));
        return *invalid;
    }

    auto response = perform_request(config, http_get);
    if (auto* failure = std::get_if<Verdict>(&response)) {
        return *failure;
    }

    const auto& outcome = std::get<ResponseOutcome>(response);
    Verdict verdict = evaluate(config, outcome);

    LOG_INFO_ENTRY(LogEntry("Check completed: " + std::string(to_string(verdict.status)))
                       .component("check")
                       .operation("evaluate")
                       .http({config.url, outcome.status_code, std::nullopt}));
    return verdict;
}

} // namespace checkhttp
