#pragma once

#include <stdexcept>
#include <string>

namespace grassmann {

/**
 * Structured error reporting for the Grassmann median solver.
 * Every failure carries a code, the raising function and an optional hint.
 */

enum class ErrorCode {
    SUCCESS = 0,

    // Input errors
    MISSING_INPUT = 1,
    INVALID_DIMENSION = 2,
    INVALID_ARGUMENT = 3,

    // Numerical errors
    DEGENERATE_SUBSPACE = 200,

    // Internal errors
    INTERNAL_ERROR = 500
};

inline const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:             return "success";
        case ErrorCode::MISSING_INPUT:       return "missing required input";
        case ErrorCode::INVALID_DIMENSION:   return "invalid dimensionality";
        case ErrorCode::INVALID_ARGUMENT:    return "invalid argument";
        case ErrorCode::DEGENERATE_SUBSPACE: return "degenerate subspace";
        case ErrorCode::INTERNAL_ERROR:      return "internal error";
    }
    return "unknown error";
}

class GrassmannException : public std::runtime_error {
public:
    explicit GrassmannException(ErrorCode code, const std::string& message,
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
        std::string result = std::string("grassmann_median: ") + error_code_name(code) + ": " + message;
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

// Data argument absent (null pointer or empty matrix)
class MissingInputError : public GrassmannException {
public:
    explicit MissingInputError(const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : GrassmannException(ErrorCode::MISSING_INPUT, message, context, suggestion) {}
};

// Requested number of basis vectors is non-positive or exceeds D
class InvalidDimensionError : public GrassmannException {
public:
    explicit InvalidDimensionError(const std::string& message,
                                   const std::string& context = "",
                                   const std::string& suggestion = "")
        : GrassmannException(ErrorCode::INVALID_DIMENSION, message, context, suggestion) {}
};

class InvalidArgumentError : public GrassmannException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : GrassmannException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// A direction collapsed to zero norm and cannot be renormalized
class DegenerateSubspaceError : public GrassmannException {
public:
    explicit DegenerateSubspaceError(const std::string& message,
                                     const std::string& context = "",
                                     const std::string& suggestion = "")
        : GrassmannException(ErrorCode::DEGENERATE_SUBSPACE, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (condition) return;
        switch (code) {
            case ErrorCode::MISSING_INPUT:
                throw MissingInputError(message, context, suggestion);
            case ErrorCode::INVALID_DIMENSION:
                throw InvalidDimensionError(message, context, suggestion);
            case ErrorCode::INVALID_ARGUMENT:
                throw InvalidArgumentError(message, context, suggestion);
            case ErrorCode::DEGENERATE_SUBSPACE:
                throw DegenerateSubspaceError(message, context, suggestion);
            default:
                throw GrassmannException(code, message, context, suggestion);
        }
    }

    static void check_pointer(const void* ptr, const std::string& name,
                              const std::string& context = "") {
        if (!ptr) {
            throw MissingInputError("not enough input arguments: " + name + " is null", context);
        }
    }
};

#define GRASSMANN_CHECK(condition, code, message) \
    grassmann::ErrorHandler::check_condition(condition, code, message, __func__)

#define GRASSMANN_CHECK_ARGUMENT(condition, message) \
    GRASSMANN_CHECK(condition, grassmann::ErrorCode::INVALID_ARGUMENT, message)

#define GRASSMANN_CHECK_DIMENSION(condition, message) \
    GRASSMANN_CHECK(condition, grassmann::ErrorCode::INVALID_DIMENSION, message)

#define GRASSMANN_CHECK_POINTER(ptr, name) \
    grassmann::ErrorHandler::check_pointer(ptr, name, __func__)

} // namespace grassmann
