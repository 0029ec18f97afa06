// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cli.hpp"

#include "env_vars.hpp"
#include "verdict.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>

namespace checkhttp {

CliConfig parse_cli_args(int argc, char* argv[]) {
    CliConfig config;

    CLI::App app{"HTTP check v" + std::string(CHECK_HTTP_VERSION) + " (" +
                 CHECK_HTTP_GIT_COMMIT + ")"};
    app.set_version_flag("--version", std::string(CHECK_HTTP_VERSION));

    // Check options
    app.add_option("-u,--url", config.url, "URL to connect to")->envname(env::URL);

    app.add_option("-t,--timeout", config.timeout_seconds,
                   "Time limit, in seconds, for the request")
        ->envname(env::TIMEOUT)
        ->check(CLI::Range(1, 86400))
        ->default_str(std::to_string(DEFAULT_TIMEOUT_SECONDS));

    app.add_flag("-r,--redirect-ok", config.redirect_ok, "Accept redirection");

    app.add_option("--response-code", config.response_code, "Expected HTTP status code")
        ->check(CLI::Range(0, 999))
        ->default_str("200");

    app.add_option("-q,--query", config.query, "Query for pattern that must exist in response body");

    app.add_option("-n,--negquery", config.negquery,
                   "Query for pattern that must be absent in response body");

    // Configuration sources
    app.add_option("-c,--config", config.config_path, "JSON check definition file")
        ->envname(env::CONFIG);

    app.add_option("--schema", config.schema_path, "JSON schema for the check definition file")
        ->default_str(CHECK_HTTP_DEFAULT_SCHEMA_PATH);

    app.add_option("-l,--log-level", config.log_level, "Log level (trace|debug|info|warn|error)")
        ->envname(env::LOG_LEVEL)
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error"}))
        ->default_str("warn");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        std::exit(code == static_cast<int>(CLI::ExitCodes::Success) ? code
                                                                    : exit_code(Status::Unknown));
    }

    return config;
}

CheckConfig resolve_check_config(const CliConfig& cli, CheckConfig base) {
    if (cli.url) {
        base.url = *cli.url;
    }
    if (cli.timeout_seconds) {
        base.timeout_seconds = *cli.timeout_seconds;
    }
    if (cli.redirect_ok) {
        base.redirect_ok = true;
    }
    if (cli.response_code) {
        base.expected_status = *cli.response_code;
    }

    // A pattern given on the command line replaces both file patterns
    if (cli.query || cli.negquery) {
        base.required_pattern = cli.query.value_or("");
        base.forbidden_pattern = cli.negquery.value_or("");
    }

    return base;
}

} // namespace checkhttp
