#pragma once
#include <string>
#include <variant>

namespace mcptools::core::errors {

    // Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., a tool argument failed schema validation
        Execution,  // E.g., a subprocess or file read failed
        Provider,   // E.g., a search API answered with a non-2xx status
        Policy,     // E.g., a path escaped the working root
        Internal    // E.g., a pipe could not be created
    };

    struct ToolError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a value of type T or a ToolError.
    template <typename T>
    using Result = std::variant<T, ToolError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ToolError>(result);
    }

    template <typename T>
    const ToolError& get_error(const Result<T>& result) {
        return std::get<ToolError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Provider:  return "provider";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace mcptools::core::errors
