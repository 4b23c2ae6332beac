#pragma once
#include <string>
#include <variant>

namespace gemini_mcp::core::errors {

    // 1. Typed error categories; each maps onto one JSON-RPC error code
    enum class ErrorCategory {
        Protocol,   // E.g., Unknown JSON-RPC method
        Input,      // E.g., Unknown tool name or malformed params
        Execution,  // E.g., The gemini process failed or timed out
        Internal    // E.g., pipe()/fork() failure or an unexpected exception
    };

    // The standardized error payload
    struct ServerError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a ServerError.
    template <typename T>
    using Result = std::variant<T, ServerError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ServerError>(result);
    }

    template <typename T>
    const ServerError& get_error(const Result<T>& result) {
        return std::get<ServerError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Protocol:  return "protocol";
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace gemini_mcp::core::errors
