// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include <exception>
#include <iostream>
#include <string>

#include "check_command.hpp"
#include "cli.hpp"
#include "config_loader.hpp"
#include "logger.hpp"
#include "verdict.hpp"

int main(int argc, char* argv[]) {
    auto cli_config = checkhttp::parse_cli_args(argc, argv);

    checkhttp::Logger::init(cli_config.log_level);

    // Resolve check configuration: defaults < definition file < environment < flags
    checkhttp::CheckConfig base;
    if (!cli_config.config_path.empty()) {
        try {
            base = checkhttp::load_check_definition(cli_config.config_path,
                                                    cli_config.schema_path);
        } catch (const std::exception& e) {
            LOG_ERROR("Configuration error: {}", e.what());
            checkhttp::Logger::shutdown();
            return checkhttp::report(
                {checkhttp::Status::Unknown, std::string("Configuration error: ") + e.what()},
                std::cout);
        }
    }
    const auto config = checkhttp::resolve_check_config(cli_config, base);

    const auto verdict = checkhttp::run_check(config);

    // Flush logs before the verdict line goes out
    checkhttp::Logger::shutdown();
    return checkhttp::report(verdict, std::cout);
}
