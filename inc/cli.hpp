// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "check_config.hpp"
#include "version.hpp"

namespace checkhttp {

/**
 * @brief Command-line interface configuration result.
 *
 * Check options are optional so that unset flags fall through to the check
 * definition file.
 */
struct CliConfig {
    std::string log_level = "warn";
    std::filesystem::path config_path; ///< Empty when no check definition file was given
    std::filesystem::path schema_path = CHECK_HTTP_DEFAULT_SCHEMA_PATH;

    std::optional<std::string> url;
    std::optional<int> timeout_seconds;
    bool redirect_ok = false;
    std::optional<int> response_code;
    std::optional<std::string> query;
    std::optional<std::string> negquery;
};

/**
 * @brief Parse command-line arguments.
 *
 * Exits the process with code 0 for --help/--version and with the UNKNOWN
 * exit code (3) for invalid arguments.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return CliConfig Parsed configuration
 */
CliConfig parse_cli_args(int argc, char* argv[]);

/**
 * @brief Apply command-line and environment values on top of a base configuration.
 *
 * @param cli Parsed command line
 * @param base Defaults or values loaded from a check definition file
 * @return Resolved check configuration
 */
CheckConfig resolve_check_config(const CliConfig& cli, CheckConfig base = {});

} // namespace checkhttp
