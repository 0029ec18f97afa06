// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace checkhttp {

/// Name printed in front of every verdict line.
constexpr const char* CHECK_NAME = "CheckHTTP";

/**
 * @brief Health level reported to the monitoring system.
 *
 * Underlying values are the conventional plugin exit codes.
 */
enum class Status {
    Ok = 0,
    Warning = 1,
    Critical = 2,
    Unknown = 3
};

/**
 * @brief Final outcome of one check invocation.
 */
struct Verdict {
    Status status = Status::Unknown;
    std::string message;

    bool operator==(const Verdict&) const = default;
};

/**
 * @brief Upper-case name of a status ("OK", "WARNING", "CRITICAL", "UNKNOWN").
 */
std::string_view to_string(Status status);

/**
 * @brief Process exit code for a status (OK=0, WARNING=1, CRITICAL=2, UNKNOWN=3).
 */
int exit_code(Status status);

/**
 * @brief Print the verdict line and translate it into an exit code.
 *
 * Writes "CheckHTTP <LEVEL>: <message>" followed by a newline.
 *
 * @param verdict Verdict to report
 * @param out Stream receiving the verdict line (stdout in production)
 * @return Exit code for the verdict's status
 */
int report(const Verdict& verdict, std::ostream& out);

} // namespace checkhttp
