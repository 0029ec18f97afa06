// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace checkhttp {

namespace {

quill::LogLevel to_quill_level(std::string_view level_str) {
    std::string lower(level_str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace")
        return quill::LogLevel::TraceL1;
    if (lower == "debug")
        return quill::LogLevel::Debug;
    if (lower == "info")
        return quill::LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return quill::LogLevel::Warning;
    if (lower == "error")
        return quill::LogLevel::Error;

    return quill::LogLevel::Warning; // Default
}

// Escape string for JSON
std::string json_escape(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    constexpr char HEX[] = "0123456789abcdef";
                    result += "\\u00";
                    result += HEX[(c >> 4) & 0x0f];
                    result += HEX[c & 0x0f];
                } else {
                    result += c;
                }
        }
    }
    return result;
}

} // namespace

// --------------------------------------------------------------------------
// BackendHandle static members
// --------------------------------------------------------------------------

std::mutex BackendHandle::mutex_;
std::weak_ptr<BackendHandle> BackendHandle::weak_instance_;

std::shared_ptr<quill::Sink> stderr_sink() {
    quill::ConsoleSinkConfig config;
    config.set_stream("stderr");
    return quill::Frontend::create_or_get_sink<quill::ConsoleSink>("stderr", config);
}

// --------------------------------------------------------------------------
// Logger singleton implementation
// --------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(std::string_view level, std::shared_ptr<quill::Sink> sink) {
    auto& inst = instance();
    if (inst.initialized_) {
        return; // Already initialized
    }

    inst.backend_ = BackendHandle::acquire();

    // Note: {{ and }} escape braces in Quill's pattern formatter
    static constexpr const char* json_pattern =
        "{{\"timestamp\":\"%(time)\",\"level\":\"%(log_level)\",\"msg\":\"%(message)\""
        ",\"service\":\"" CHECK_HTTP_NAME "\",\"version\":\"" CHECK_HTTP_VERSION
        "\",\"commit\":\"" CHECK_HTTP_GIT_COMMIT "\"}}";

    quill::PatternFormatterOptions formatter_options{
        json_pattern,
        "%Y-%m-%dT%H:%M:%S.%QmsZ", // RFC3339/ISO8601 UTC timestamp
        quill::Timezone::GmtTime};

    inst.logger_ =
        quill::Frontend::create_or_get_logger(CHECK_HTTP_NAME, std::move(sink), formatter_options);
    inst.logger_->set_log_level(to_quill_level(level));
    inst.initialized_ = true;
}

void Logger::shutdown() {
    auto& inst = instance();
    if (inst.logger_) {
        inst.logger_->flush_log();
        quill::Frontend::remove_logger(inst.logger_);
        inst.logger_ = nullptr;
    }
    // Release backend handle (stops backend if last user)
    inst.backend_.reset();
    inst.initialized_ = false;
}

bool Logger::is_initialized() {
    return instance().initialized_;
}

quill::Logger* Logger::get() {
    return instance().logger_;
}

void Logger::log_trace(const LogEntry& entry) {
    if (auto* l = instance().logger_) {
        QUILL_LOG_TRACE_L1(l, "{}", entry.build());
    }
}

void Logger::log_debug(const LogEntry& entry) {
    if (auto* l = instance().logger_) {
        QUILL_LOG_DEBUG(l, "{}", entry.build());
    }
}

void Logger::log_info(const LogEntry& entry) {
    if (auto* l = instance().logger_) {
        QUILL_LOG_INFO(l, "{}", entry.build());
    }
}

void Logger::log_warn(const LogEntry& entry) {
    if (auto* l = instance().logger_) {
        QUILL_LOG_WARNING(l, "{}", entry.build());
    }
}

void Logger::log_error(const LogEntry& entry) {
    if (auto* l = instance().logger_) {
        QUILL_LOG_ERROR(l, "{}", entry.build());
    }
}

// --------------------------------------------------------------------------
// LogEntry implementation
// --------------------------------------------------------------------------

std::string LogEntry::build() const {
    std::ostringstream extra;

    if (component_) {
        extra << ",\"component\":\"" << json_escape(*component_) << "\"";
    }
    if (operation_) {
        extra << ",\"operation\":\"" << json_escape(*operation_) << "\"";
    }
    if (http_) {
        extra << ",\"http\":{\"url\":\"" << json_escape(http_->url) << "\"";
        if (http_->status_code) {
            extra << ",\"status_code\":" << *http_->status_code;
        }
        if (http_->elapsed_ms) {
            extra << ",\"elapsed_ms\":" << *http_->elapsed_ms;
        }
        extra << "}";
    }
    if (error_) {
        extra << ",\"error\":{\"type\":\"" << json_escape(error_->type) << "\",\"message\":\""
              << json_escape(error_->message) << "\"}";
    }

    std::string extra_str = extra.str();
    if (extra_str.empty()) {
        return json_escape(msg_); // Pattern closes the quote
    }
    // Structured: add dummy field to absorb pattern's closing quote
    return json_escape(msg_) + "\"" + extra_str + ",\"_\":\"";
}

} // namespace checkhttp
