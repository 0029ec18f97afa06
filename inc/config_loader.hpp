// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

#include "check_config.hpp"

namespace checkhttp {

/// JSON Pointer paths (RFC6901) for extracting CheckConfig values
namespace json {
constexpr char URL[] = "/url";
constexpr char TIMEOUT[] = "/timeout";
constexpr char REDIRECT_OK[] = "/redirect_ok";
constexpr char RESPONSE_CODE[] = "/response_code";
constexpr char QUERY[] = "/query";
constexpr char NEGQUERY[] = "/negquery";
} // namespace json

/**
 * @brief Load and validate a check definition from a JSON file.
 *
 * Example:
 * @code{.json}
 * {"url": "https://example.com/health", "timeout": 5, "query": "healthy"}
 * @endcode
 *
 * Keys that are absent keep their CheckConfig defaults. Command-line flags
 * and environment variables are applied on top by resolve_check_config().
 *
 * @param config_path Path to the JSON check definition
 * @param schema_path Path to the JSON schema file
 * @return CheckConfig with the file's values
 *
 * @throws std::runtime_error if a file is not found, is not valid JSON, or
 *         schema validation fails
 */
CheckConfig load_check_definition(const std::filesystem::path& config_path,
                                  const std::filesystem::path& schema_path);

} // namespace checkhttp
