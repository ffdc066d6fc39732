#pragma once

#include <optional>
#include <string>

namespace msghistory::core {

// Error codes organized by category
enum class ErrorCode {
    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,

    // History errors (100-199)
    MalformedState = 100,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // File system errors (700-799)
    FileNotFound = 700,
    FileReadFailed = 701,
    FileWriteFailed = 702,
};

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Additional context (file path, index, etc.)

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    // Get full error message
    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        return result;
    }
};

}  // namespace msghistory::core
