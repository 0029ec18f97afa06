// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Environment variable names for runtime configuration.
//
// Environment values sit between command-line flags (higher priority) and the
// check definition file (lower priority).
// -----------------------------------------------------------------------------

namespace checkhttp::env {

/// URL to check
constexpr const char* URL = "CHECK_HTTP_URL";

/// Request timeout in seconds
constexpr const char* TIMEOUT = "CHECK_HTTP_TIMEOUT";

/// Path of a JSON check definition file
constexpr const char* CONFIG = "CHECK_HTTP_CONFIG";

/// Log level (trace/debug/info/warn/error)
constexpr const char* LOG_LEVEL = "CHECK_HTTP_LOG_LEVEL";

} // namespace checkhttp::env
