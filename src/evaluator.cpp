// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "evaluator.hpp"

#include "status_text.hpp"

namespace checkhttp {

namespace {

// Status code ranges, inclusive
constexpr int SUCCESS_FIRST = 200; // OK
constexpr int SUCCESS_LAST = 226;  // IM Used
constexpr int REDIRECT_FIRST = 300; // Multiple Choices
constexpr int REDIRECT_LAST = 308;  // Permanent Redirect

Verdict verify_body(const CheckConfig& config, const ResponseOutcome& outcome) {
    const std::string line = status_line(outcome.status_code);
    const std::string& pattern = config.active_pattern();

    if (pattern.empty()) {
        return {Status::Ok, line};
    }

    if (!outcome.body) {
        return {Status::Critical, "failed to read response body"};
    }

    const std::string& body = *outcome.body;
    const std::string length = std::to_string(body.size());
    const bool forbidden = config.pattern_forbidden();

    if (body.find(pattern) != std::string::npos) {
        return {forbidden ? Status::Critical : Status::Ok,
                line + " found /" + pattern + "/ in " + length + " bytes"};
    }

    return {forbidden ? Status::Ok : Status::Critical,
            "did not find /" + pattern + "/ in " + length + " bytes"};
}

} // namespace

std::optional<Verdict> validate_config(const CheckConfig& config) {
    if (config.url.empty()) {
        return Verdict{Status::Unknown, "no URL specified"};
    }

    if (!config.required_pattern.empty() && !config.forbidden_pattern.empty()) {
        return Verdict{Status::Unknown, "--query and --negquery can not be used simultaneously"};
    }

    if (config.timeout_seconds < 1) {
        return Verdict{Status::Unknown, "timeout must be a positive number of seconds"};
    }

    return std::nullopt;
}

Verdict evaluate(const CheckConfig& config, const ResponseOutcome& outcome) {
    const int code = outcome.status_code;

    // An explicit expectation takes precedence over the range checks below
    if (config.has_explicit_expectation()) {
        if (code == *config.expected_status) {
            return verify_body(config, outcome);
        }
        return {Status::Critical, "expected HTTP status " + status_line(*config.expected_status) +
                                      ", got " + status_line(code)};
    }

    if (code >= SUCCESS_FIRST && code <= SUCCESS_LAST) {
        return verify_body(config, outcome);
    }

    if (code >= REDIRECT_FIRST && code <= REDIRECT_LAST) {
        if (config.redirect_ok) {
            return verify_body(config, outcome);
        }
        return {Status::Warning, status_line(code) + ": unexpected redirection"};
    }

    return {Status::Critical, status_line(code)};
}

} // namespace checkhttp
