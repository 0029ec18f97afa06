// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

namespace checkhttp {

/**
 * @brief Standard reason phrase for an HTTP status code.
 *
 * Uses the cpp-httplib status table. Codes the table does not know map to
 * an empty string.
 *
 * @param code HTTP status code (e.g. 404)
 * @return Reason phrase (e.g. "Not Found") or "" for unknown codes
 */
std::string reason_phrase(int code);

/**
 * @brief Status line used in verdict messages: "{code} {reason phrase}".
 */
std::string status_line(int code);

} // namespace checkhttp
