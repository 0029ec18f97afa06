// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "http_request.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <memory>

namespace checkhttp {

namespace {

// Socket timeouts can fire marginally before the nominal deadline
constexpr std::chrono::milliseconds TIMEOUT_SLACK{100};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

/**
 * @brief Decide whether a failed exchange ran into the configured deadline.
 */
bool is_timeout(httplib::Error error, std::chrono::steady_clock::duration elapsed,
                int timeout_seconds) {
    if (error == httplib::Error::ConnectionTimeout) {
        return true;
    }
    // Read and write timeouts surface as plain I/O errors once the deadline passed
    if (error == httplib::Error::Read || error == httplib::Error::Write) {
        return elapsed + TIMEOUT_SLACK >= std::chrono::seconds(timeout_seconds);
    }
    return false;
}

Verdict timeout_verdict(int timeout_seconds) {
    return {Status::Critical,
            "Request exceeded timeout of " + std::to_string(timeout_seconds) + " seconds"};
}

} // namespace

std::optional<RequestTarget> parse_url(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    const std::string scheme = to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    const auto authority_begin = scheme_end + 3;
    auto path_begin = url.find_first_of("/?#", authority_begin);
    if (path_begin == std::string::npos) {
        path_begin = url.size();
    }

    const std::string authority = url.substr(authority_begin, path_begin - authority_begin);
    if (authority.empty() || authority.front() == ':') {
        return std::nullopt;
    }

    std::string path = url.substr(path_begin);
    if (auto fragment = path.find('#'); fragment != std::string::npos) {
        path.erase(fragment);
    }
    if (path.empty() || path.front() != '/') {
        path.insert(0, "/");
    }

    return RequestTarget{scheme + "://" + authority, path};
}

httplib::Result make_http_request(const RequestTarget& target, const CheckConfig& config) {
    const auto timeout = std::chrono::seconds(config.timeout_seconds);

    httplib::Client client(target.scheme_host_port);
    client.set_follow_location(false);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_max_timeout(timeout);

    if (!config.active_pattern().empty()) {
        return client.Get(target.path);
    }

    // Without a pattern only the status line and headers are read
    std::optional<int> status;
    httplib::Headers headers;
    httplib::ResponseHandler on_headers = [&status, &headers](const httplib::Response& response) {
        status = response.status;
        headers = response.headers;
        return false;
    };
    httplib::ContentReceiver unused_body = [](const char*, size_t) { return false; };

    auto result = client.Get(target.path, on_headers, unused_body);
    if (result.error() != httplib::Error::Canceled || !status) {
        return result;
    }

    auto response = std::make_unique<httplib::Response>();
    response->status = *status;
    response->headers = std::move(headers);
    return httplib::Result(std::move(response), httplib::Error::Success, httplib::Headers());
}

std::variant<ResponseOutcome, Verdict> perform_request(const CheckConfig& config,
                                                       const HttpGetFunction& http_get) {
    auto target = parse_url(config.url);
    if (!target) {
        LOG_ERROR_ENTRY(LogEntry("Rejected URL")
                            .component("request")
                            .http({config.url, std::nullopt, std::nullopt})
                            .error({"InvalidUrl", "unsupported URL"}));
        return Verdict{Status::Critical, "Request error: unsupported URL \"" + config.url + "\""};
    }

    LOG_DEBUG("GET {}{} (timeout {}s)", target->scheme_host_port, target->path,
              config.timeout_seconds);

    const auto started = std::chrono::steady_clock::now();
    std::optional<httplib::Result> exchange;
    try {
        exchange.emplace(http_get(*target, config));
    } catch (const std::exception& e) {
        LOG_ERROR_ENTRY(LogEntry("HTTP client failed")
                            .component("request")
                            .http({config.url, std::nullopt, std::nullopt})
                            .error({"ClientError", e.what()}));
        return Verdict{Status::Critical, std::string("Request error: ") + e.what()};
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

    httplib::Result& result = *exchange;
    if (!result) {
        const httplib::Error error = result.error();
        const std::string error_text = httplib::to_string(error);
        LOG_WARN_ENTRY(LogEntry("Request failed")
                           .component("request")
                           .http({config.url, std::nullopt, elapsed_ms})
                           .error({"TransportError", error_text}));

        if (is_timeout(error, elapsed, config.timeout_seconds)) {
            return timeout_verdict(config.timeout_seconds);
        }
        return Verdict{Status::Critical, "Request error: " + error_text};
    }

    LOG_DEBUG_ENTRY(LogEntry("Response received")
                        .component("request")
                        .http({config.url, result->status, elapsed_ms}));

    ResponseOutcome outcome;
    outcome.status_code = result->status;
    if (!config.active_pattern().empty()) {
        outcome.body = std::move(result->body);
    }
    return outcome;
}

} // namespace checkhttp
