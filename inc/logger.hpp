// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Structured JSON Logger for check-http
//
// Design: Singleton pattern for state management, thin macros for compile-time
// format strings (required by Quill for zero-copy logging performance).
//
// Logs are written to stderr; stdout is reserved for the verdict line read by
// the monitoring system.
//
// Usage:
//   Logger::init("debug");
//
//   LOG_INFO("Check started");
//   LOG_DEBUG("Timeout is {} seconds", timeout);
//
//   LOG_DEBUG_ENTRY(LogEntry("Response received").component("request").http({...}));
//
//   Logger::shutdown();
//
// Output (JSON lines to stderr):
//   {"timestamp":"2026-01-15T10:30:00.123Z","level":"INFO","msg":"Check started",
//    "service":"check-http","version":"0.1.0","commit":"abc1234"}
// -----------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "version.hpp"

namespace checkhttp {

// -----------------------------------------------------------------------------
// Context structures for structured logging
// -----------------------------------------------------------------------------

struct HttpContext {
    std::string url;
    std::optional<int> status_code;
    std::optional<std::int64_t> elapsed_ms;
};

struct ErrorContext {
    std::string type;
    std::string message;
};

// -----------------------------------------------------------------------------
// LogEntry - Fluent builder for structured log messages
// -----------------------------------------------------------------------------

class LogEntry {
public:
    explicit LogEntry(std::string_view message) : msg_(message) {}

    LogEntry& component(std::string_view comp) {
        component_ = std::string(comp);
        return *this;
    }

    LogEntry& operation(std::string_view op) {
        operation_ = std::string(op);
        return *this;
    }

    LogEntry& http(const HttpContext& ctx) {
        http_ = ctx;
        return *this;
    }

    LogEntry& error(const ErrorContext& ctx) {
        error_ = ctx;
        return *this;
    }

    // Build the structured message payload
    [[nodiscard]] std::string build() const;

private:
    std::string msg_;
    std::optional<std::string> component_;
    std::optional<std::string> operation_;
    std::optional<HttpContext> http_;
    std::optional<ErrorContext> error_;
};

} // namespace checkhttp

// Include Quill headers after our declarations
#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/Sink.h>

#include <memory>
#include <mutex>

namespace checkhttp {

// -----------------------------------------------------------------------------
// BackendHandle - RAII handle for Quill backend lifecycle
//
// Uses weak_ptr/shared_ptr pattern for reference counting.
// First handle starts the backend, last handle stops it.
// -----------------------------------------------------------------------------

class BackendHandle {
public:
    ~BackendHandle() { quill::Backend::stop(); }

    BackendHandle(const BackendHandle&) = delete;
    BackendHandle& operator=(const BackendHandle&) = delete;

    /**
     * @brief Acquire a shared handle to the Quill backend.
     *
     * Starts the backend if this is the first handle.
     *
     * @return Shared pointer to backend handle
     */
    [[nodiscard]] static std::shared_ptr<BackendHandle> acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto handle = weak_instance_.lock();
        if (!handle) {
            handle = std::shared_ptr<BackendHandle>(new BackendHandle());
            weak_instance_ = handle;
        }
        return handle;
    }

private:
    BackendHandle() {
        quill::BackendOptions options;
        quill::Backend::start(options);
    }

    static std::mutex mutex_;
    static std::weak_ptr<BackendHandle> weak_instance_;
};

/**
 * @brief Console sink writing to stderr.
 */
std::shared_ptr<quill::Sink> stderr_sink();

// -----------------------------------------------------------------------------
// Logger - Singleton manager for Quill logger
// -----------------------------------------------------------------------------

class Logger {
public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Initialize logger with specified level and optional custom sink (for testing)
    static void init(std::string_view level = "warn",
                     std::shared_ptr<quill::Sink> sink = stderr_sink());

    // Shutdown logger and flush all pending messages
    static void shutdown();

    [[nodiscard]] static bool is_initialized();

    // Get underlying Quill logger (for macros)
    [[nodiscard]] static quill::Logger* get();

    // Structured logging methods (for LogEntry)
    static void log_trace(const LogEntry& entry);
    static void log_debug(const LogEntry& entry);
    static void log_info(const LogEntry& entry);
    static void log_warn(const LogEntry& entry);
    static void log_error(const LogEntry& entry);

private:
    Logger() = default;
    ~Logger() = default;

    static Logger& instance();

    std::shared_ptr<BackendHandle> backend_;
    quill::Logger* logger_ = nullptr;
    bool initialized_ = false;
};

} // namespace checkhttp

// -----------------------------------------------------------------------------
// Logging macros - thin wrappers for compile-time format strings
//
// The simple macros skip logging until Logger::init() has run, so the check
// code also runs uninitialized (e.g. in unit tests).
// -----------------------------------------------------------------------------

// Undefine Quill's shorthand macros to avoid conflicts
#ifdef LOG_TRACE
    #undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
    #undef LOG_DEBUG
#endif
#ifdef LOG_INFO
    #undef LOG_INFO
#endif
#ifdef LOG_WARN
    #undef LOG_WARN
#endif
#ifdef LOG_WARNING
    #undef LOG_WARNING
#endif
#ifdef LOG_ERROR
    #undef LOG_ERROR
#endif

#define CHECK_HTTP_LOG_IF_READY(macro, fmt, ...)                                                   \
    do {                                                                                           \
        if (auto* check_http_logger_ = checkhttp::Logger::get()) {                                 \
            macro(check_http_logger_, fmt, ##__VA_ARGS__);                                         \
        }                                                                                          \
    } while (0)

#define LOG_TRACE(fmt, ...) CHECK_HTTP_LOG_IF_READY(QUILL_LOG_TRACE_L1, fmt, ##__VA_ARGS__)

#define LOG_DEBUG(fmt, ...) CHECK_HTTP_LOG_IF_READY(QUILL_LOG_DEBUG, fmt, ##__VA_ARGS__)

#define LOG_INFO(fmt, ...) CHECK_HTTP_LOG_IF_READY(QUILL_LOG_INFO, fmt, ##__VA_ARGS__)

#define LOG_WARN(fmt, ...) CHECK_HTTP_LOG_IF_READY(QUILL_LOG_WARNING, fmt, ##__VA_ARGS__)

#define LOG_ERROR(fmt, ...) CHECK_HTTP_LOG_IF_READY(QUILL_LOG_ERROR, fmt, ##__VA_ARGS__)

// Structured logging macros (for LogEntry)
#define LOG_TRACE_ENTRY(entry) checkhttp::Logger::log_trace(entry)
#define LOG_DEBUG_ENTRY(entry) checkhttp::Logger::log_debug(entry)
#define LOG_INFO_ENTRY(entry) checkhttp::Logger::log_info(entry)
#define LOG_WARN_ENTRY(entry) checkhttp::Logger::log_warn(entry)
#define LOG_ERROR_ENTRY(entry) checkhttp::Logger::log_error(entry)
