// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "logger.hpp"

#include "utils/json_schema_validator.hpp"
#include "utils/test_sink.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

namespace checkhttp {
namespace {

using test::get_log_schema_path;
using test::JsonSchemaValidator;
using test::TestSink;

/**
 * @brief Sink named after the running test so each test gets its own instance.
 */
std::shared_ptr<quill::Sink> make_test_sink() {
    auto test_info = testing::UnitTest::GetInstance()->current_test_info();
    std::string sink_name = std::string(test_info->test_suite_name()) + "_" + test_info->name();
    return quill::Frontend::create_or_get_sink<TestSink>(sink_name);
}

// =============================================================================
// Logger Lifecycle Tests
// =============================================================================

/**
 * @brief Tests Logger initialization, shutdown, and flush behavior.
 *
 * Checks:
 * - Pre-init state: is_initialized() == false, get() == nullptr
 * - Double-init is a no-op returning the same logger
 * - Shutdown flushes pending logs
 * - Double-shutdown is safe
 */
TEST(LoggerLifecycleTest, InitShutdownAndFlush) {
    auto sink = make_test_sink();
    auto* test_sink = static_cast<TestSink*>(sink.get());

    if (Logger::is_initialized()) {
        Logger::shutdown();
    }
    EXPECT_FALSE(Logger::is_initialized());
    EXPECT_EQ(Logger::get(), nullptr);

    Logger::init("info", sink);
    EXPECT_TRUE(Logger::is_initialized());
    EXPECT_NE(Logger::get(), nullptr);

    auto* logger1 = Logger::get();
    Logger::init("debug", sink);
    EXPECT_EQ(Logger::get(), logger1);

    LOG_INFO("Message before shutdown");

    Logger::shutdown();
    EXPECT_FALSE(Logger::is_initialized());

    auto statements = test_sink->get_statements();
    ASSERT_EQ(statements.size(), 1u) << "Shutdown must flush pending logs";
    EXPECT_NE(statements[0].find("Message before shutdown"), std::string::npos);

    Logger::shutdown();
    EXPECT_FALSE(Logger::is_initialized());
}

TEST(LoggerLifecycleTest, LogLevelConfiguration) {
    std::vector<std::string> levels = {"trace", "debug", "info", "warn", "warning", "error"};

    for (const auto& level : levels) {
        Logger::init(level, make_test_sink());
        EXPECT_TRUE(Logger::is_initialized()) << "Failed for level: " << level;
        Logger::shutdown();
    }

    // Unknown level falls back to the default
    Logger::init("unknown_level", make_test_sink());
    EXPECT_TRUE(Logger::is_initialized());
    Logger::shutdown();
}

/**
 * @brief The default "warn" level filters info and debug messages.
 */
TEST(LoggerLifecycleTest, DefaultLevelFiltersInfo) {
    auto sink = make_test_sink();
    auto* test_sink = static_cast<TestSink*>(sink.get());
    test_sink->clear();

    Logger::init("warn", sink);
    LOG_DEBUG("Debug message");
    LOG_INFO("Info message");
    LOG_WARN("Warning message");
    Logger::shutdown();

    auto statements = test_sink->get_statements();
    ASSERT_EQ(statements.size(), 1u);
    EXPECT_NE(statements[0].find("Warning message"), std::string::npos);
}

/**
 * @brief Log calls are silently dropped when the logger is not initialized.
 */
TEST(LoggerLifecycleTest, NullLoggerSafety) {
    if (Logger::is_initialized()) {
        Logger::shutdown();
    }

    LOG_INFO("Macro without logger {}", 1);
    Logger::log_trace(LogEntry("Test"));
    Logger::log_debug(LogEntry("Test"));
    Logger::log_info(LogEntry("Test"));
    Logger::log_warn(LogEntry("Test"));
    Logger::log_error(LogEntry("Test"));
    SUCCEED();
}

// =============================================================================
// JSON Output Validation Test
// =============================================================================

/**
 * @brief Every log line is valid JSON matching schema/log.schema.json.
 *
 * Value verification checks:
 * - Log levels map to TRACE_L1, DEBUG, INFO, WARNING, ERROR
 * - component, operation, http and error contexts propagate
 * - Special characters are JSON-escaped, other control characters as \u00XX
 */
TEST(LoggerJsonTest, ValidJsonOutput) {
    auto sink = make_test_sink();
    auto* test_sink = static_cast<TestSink*>(sink.get());
    test_sink->clear();

    Logger::init("trace", sink);
    JsonSchemaValidator validator{get_log_schema_path()};

    // --- All log levels ---
    LOG_TRACE("Trace message");
    LOG_DEBUG("Debug message");
    LOG_INFO("Info message");
    LOG_WARN("Warning message");
    LOG_ERROR("Error message");

    // --- Structured contexts ---
    LOG_INFO_ENTRY(LogEntry("Component test").component("request"));
    LOG_INFO_ENTRY(LogEntry("Operation test").operation("evaluate"));
    LOG_INFO_ENTRY(LogEntry("HTTP full").http({"http://localhost/healthz", 200, 42}));
    LOG_INFO_ENTRY(LogEntry("HTTP url only").http({"http://localhost/", std::nullopt, std::nullopt}));
    LOG_ERROR_ENTRY(LogEntry("Error context").error({"TransportError", "Connection refused"}));

    // --- All contexts combined ---
    LOG_WARN_ENTRY(LogEntry("All contexts")
                       .component("request")
                       .operation("get")
                       .http({"http://localhost/slow", std::nullopt, 1001})
                       .error({"TransportError", "Failed to read connection"}));

    // --- Special character escaping ---
    LOG_INFO_ENTRY(LogEntry("Quotes \"and\" \\backslash").component("test"));
    LOG_INFO_ENTRY(LogEntry("Newline\nand\ttab\rcarriage").component("test"));
    LOG_INFO_ENTRY(LogEntry("Control\x01" "chars")
                       .http({"http://localhost/\x02path\x1f", std::nullopt, std::nullopt}));

    Logger::get()->flush_log();
    auto statements = test_sink->get_statements();
    ASSERT_GE(statements.size(), 14u) << "Expected at least 14 log statements";

    for (const auto& stmt : statements) {
        EXPECT_TRUE(validator.validate(stmt))
            << "Invalid JSON: " << validator.get_error() << "\nLog: " << stmt;
    }

    using ::testing::Contains;
    using ::testing::HasSubstr;

    EXPECT_THAT(statements, Contains(HasSubstr("\"level\":\"TRACE_L1\"")));
    EXPECT_THAT(statements, Contains(HasSubstr("\"level\":\"DEBUG\"")));
    EXPECT_THAT(statements, Contains(HasSubstr("\"level\":\"INFO\"")));
    EXPECT_THAT(statements, Contains(HasSubstr("\"level\":\"WARNING\"")));
    EXPECT_THAT(statements, Contains(HasSubstr("\"level\":\"ERROR\"")));

    EXPECT_THAT(statements, Contains(HasSubstr("\"service\":\"" CHECK_HTTP_NAME "\"")));
    EXPECT_THAT(statements, Contains(HasSubstr("\"component\":\"request\"")));
    EXPECT_THAT(statements, Contains(HasSubstr("\"operation\":\"evaluate\"")));
    EXPECT_THAT(statements, Contains(HasSubstr("\"url\":\"http://localhost/healthz\"")));
    EXPECT_THAT(statements, Contains(HasSubstr("\"status_code\":200")));
    EXPECT_THAT(statements, Contains(HasSubstr("\"elapsed_ms\":1001")));
    EXPECT_THAT(statements, Contains(HasSubstr("\"type\":\"TransportError\"")));

    EXPECT_THAT(statements, Contains(HasSubstr("\\\"and\\\"")));
    EXPECT_THAT(statements, Contains(HasSubstr("\\\\backslash")));
    EXPECT_THAT(statements, Contains(HasSubstr("\\n")));
    EXPECT_THAT(statements, Contains(HasSubstr("\\t")));
    EXPECT_THAT(statements, Contains(HasSubstr("Control\\u0001chars")));
    EXPECT_THAT(statements, Contains(HasSubstr("localhost/\\u0002path\\u001f")));

    Logger::shutdown();
}

} // namespace
} // namespace checkhttp
