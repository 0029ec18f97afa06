// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "verdict.hpp"

namespace checkhttp {

std::string_view to_string(Status status) {
    switch (status) {
        case Status::Ok:
            return "OK";
        case Status::Warning:
            return "WARNING";
        case Status::Critical:
            return "CRITICAL";
        case Status::Unknown:
            break;
    }
    return "UNKNOWN";
}

int exit_code(Status status) {
    return static_cast<int>(status);
}

int report(const Verdict& verdict, std::ostream& out) {
    out << CHECK_NAME << " " << to_string(verdict.status) << ": " << verdict.message << std::endl;
    return exit_code(verdict.status);
}

} // namespace checkhttp
