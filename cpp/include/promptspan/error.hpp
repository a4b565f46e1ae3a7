#pragma once

#include <stdexcept>
#include <string>

namespace promptspan {

/**
 * Structured error reporting for the extraction engine.
 *
 * Only ScanError is allowed to escape SpanExtractionService::extract_spans();
 * load and worker failures are caught at the tier boundary and logged.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    INTERNAL_ERROR = 2,

    // Configuration and resources
    CONFIG_INVALID = 100,
    RESOURCE_NOT_FOUND = 101,
    RESOURCE_PARSE_FAILED = 102,

    // Worker process
    WORKER_SPAWN_FAILED = 200,
    WORKER_FAILED = 201,
    WORKER_TIMEOUT = 202,
    WORKER_PROTOCOL = 203,

    // Text scanning
    SCAN_FAILED = 300
};

class PromptSpanException : public std::runtime_error {
public:
    explicit PromptSpanException(ErrorCode code, const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "promptspan error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public PromptSpanException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : PromptSpanException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class ConfigError : public PromptSpanException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : PromptSpanException(ErrorCode::CONFIG_INVALID, message, context, suggestion) {}
};

class IOError : public PromptSpanException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : PromptSpanException(ErrorCode::RESOURCE_NOT_FOUND, message, context, suggestion) {}
};

class WorkerError : public PromptSpanException {
public:
    explicit WorkerError(const std::string& message,
                         const std::string& context = "",
                         ErrorCode code = ErrorCode::WORKER_FAILED)
        : PromptSpanException(code, message, context) {}
};

class WorkerTimeoutError : public WorkerError {
public:
    explicit WorkerTimeoutError(const std::string& message,
                                const std::string& context = "")
        : WorkerError(message, context, ErrorCode::WORKER_TIMEOUT) {}
};

class ScanError : public PromptSpanException {
public:
    explicit ScanError(const std::string& message,
                       const std::string& context = "")
        : PromptSpanException(ErrorCode::SCAN_FAILED, message, context,
                              "Skip this request; the input cannot be scanned") {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw PromptSpanException(code, message, context, suggestion);
        }
    }

    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

#define PROMPTSPAN_CHECK(condition, code, message) \
    promptspan::ErrorHandler::check_condition(condition, code, message, __func__)

#define PROMPTSPAN_CHECK_ARGUMENT(condition, message) \
    promptspan::ErrorHandler::check_argument(condition, message, __func__)

#define PROMPTSPAN_THROW(code, message) \
    throw promptspan::PromptSpanException(code, message, __func__)

} // namespace promptspan
