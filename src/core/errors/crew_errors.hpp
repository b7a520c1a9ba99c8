#pragma once
#include <string>
#include <variant>

namespace crew::core::errors {

    // Typed error categories
    enum class ErrorCategory {
        Input,       // Bad CLI flag, bad setting, bad tool arguments
        Protocol,    // Malformed tool response or planning payload
        Capability,  // Planning payload asked for a tool we don't have
        Lifecycle,   // Agent or bridge used before it was provisioned
        Process,     // Spawn failure, broken pipe, response timeout
        Provider,    // Planning service unreachable or returned an error
        Internal     // Logic bug
    };

    struct CrewError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a value of type T or a CrewError.
    template <typename T>
    using Result = std::variant<T, CrewError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<CrewError>(result);
    }

    template <typename T>
    const CrewError& get_error(const Result<T>& result) {
        return std::get<CrewError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:      return "input";
            case ErrorCategory::Protocol:   return "protocol";
            case ErrorCategory::Capability: return "capability";
            case ErrorCategory::Lifecycle:  return "lifecycle";
            case ErrorCategory::Process:    return "process";
            case ErrorCategory::Provider:   return "provider";
            case ErrorCategory::Internal:   return "internal";
            default: return "unknown";
        }
    }

} // namespace crew::core::errors
