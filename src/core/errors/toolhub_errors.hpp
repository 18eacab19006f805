#pragma once
#include <optional>
#include <string>
#include <variant>

namespace toolhub::core::errors {

    // Typed error categories, one per failure class of the provider core
    enum class ErrorCategory {
        Input,          // E.g., a malformed CLI flag or config value
        Configuration,  // E.g., unknown provider id, malformed definition
        Launch,         // E.g., executable not found, fork/exec failed
        Handshake,      // E.g., initialize answered with an error
        ProbeTimeout,   // E.g., provider never became healthy
        RequestTimeout, // E.g., no response within the request deadline
        Transport,      // E.g., connection refused, stream closed
        Protocol,       // E.g., a well-formed JSON-RPC error object
        Internal        // E.g., request id collision
    };

    // The standardized error payload
    struct ToolhubError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        std::optional<int> remote_code;  // JSON-RPC error code for Protocol errors
    };

    // A Result holds either a successful value of type T, OR a ToolhubError.
    template <typename T>
    using Result = std::variant<T, ToolhubError>;

    // Value type for operations that only succeed or fail.
    using Unit = std::monostate;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ToolhubError>(result);
    }

    template <typename T>
    const ToolhubError& get_error(const Result<T>& result) {
        return std::get<ToolhubError>(result);
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
            case ErrorCategory::Input:          return "input";
            case ErrorCategory::Configuration:  return "configuration";
            case ErrorCategory::Launch:         return "launch";
            case ErrorCategory::Handshake:      return "handshake";
            case ErrorCategory::ProbeTimeout:   return "probe_timeout";
            case ErrorCategory::RequestTimeout: return "request_timeout";
            case ErrorCategory::Transport:      return "transport";
            case ErrorCategory::Protocol:       return "protocol";
            case ErrorCategory::Internal:       return "internal";
            default: return "unknown";
        }
    }

} // namespace toolhub::core::errors
