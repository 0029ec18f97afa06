// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>

#include <httplib.h>

#include "check_config.hpp"
#include "evaluator.hpp"
#include "verdict.hpp"

namespace checkhttp {

/**
 * @brief URL split into the parts cpp-httplib needs.
 */
struct RequestTarget {
    std::string scheme_host_port; ///< e.g. "https://example.com:8443"
    std::string path;             ///< Path and query, always starts with '/'
};

/**
 * @brief Split an absolute http(s) URL into client address and request path.
 *
 * The fragment is dropped and an empty path becomes "/".
 *
 * @return RequestTarget, or std::nullopt if the URL has no host or the scheme
 *         is not http/https
 */
std::optional<RequestTarget> parse_url(const std::string& url);

/**
 * @brief Function type for making the HTTP GET request (for dependency injection/mocking).
 *
 * @param target Address and path to request
 * @param config Check configuration (timeout, whether the body is needed)
 * @return httplib::Result containing response or error
 */
using HttpGetFunction =
    std::function<httplib::Result(const RequestTarget& target, const CheckConfig& config)>;

/**
 * @brief Default implementation of HttpGetFunction.
 *
 * Issues a single GET with redirect following disabled, so a 3xx response
 * is returned as-is. config.timeout_seconds bounds the connect step and each
 * read/write, and is also the overall deadline for the exchange once connected.
 *
 * The body is only read when a pattern is configured. Otherwise the exchange
 * ends as soon as the headers arrive and the returned response has an empty
 * body, so a streaming endpoint cannot hold the check open.
 *
 * @throws std::invalid_argument if cpp-httplib rejects the scheme (https
 *         without OpenSSL support)
 */
httplib::Result make_http_request(const RequestTarget& target, const CheckConfig& config);

/**
 * @brief Request stage: perform the GET and classify transport failures.
 *
 * Never throws. Returns either the response outcome or a CRITICAL verdict:
 * - "Request exceeded timeout of N seconds" when the deadline was hit
 * - "Request error: ..." for any other failure to obtain a response
 *
 * @param config Validated check configuration
 * @param http_get Function performing the HTTP exchange
 */
std::variant<ResponseOutcome, Verdict> perform_request(const CheckConfig& config,
                                                       const HttpGetFunction& http_get);

} // namespace checkhttp
