// =============================================================================
// pipeflow - Error Handling Framework
// =============================================================================
// Error handling for the pipeflow stream-processing library.
//
// This module provides:
// - ErrorCode enum shared by exceptions and Result values
// - PFlowException hierarchy for structured error handling
// - Result<T, E> type for per-item and API-level errors (using std::expected)
// - Error context naming the stage and item where a failure occurred
//
// Error taxonomy:
// - Per-item recoverable errors travel through streams as Result<T>
// - Stage-fatal failures end a stream with CloseReason::kFailed
// - Cancellation is a close reason, never an Error inside a stream
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef PFLOW_COMMON_ERROR_H
#define PFLOW_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace pflow {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes used by exceptions and Result values.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Invalid argument value (worker count, batch size, capacity...).
    kInvalidArgument = 1,

    /// @brief Operation not valid in the current state.
    /// @note Closing a stream twice, sending after close, submitting to a closed pool.
    kInvalidState = 2,

    /// @brief Operation was cancelled through a cancellation token.
    kCancelled = 3,

    /// @brief The token's deadline elapsed.
    kDeadlineExceeded = 4,

    /// @brief A caller-supplied function failed.
    kStageFailed = 5,

    /// @brief The stream was closed or abandoned.
    kStreamClosed = 6,

    /// @brief Unexpected internal failure.
    kInternalError = 7
};

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kDeadlineExceeded:
            return "deadline exceeded";
        case ErrorCode::kStageFailed:
            return "stage failed";
        case ErrorCode::kStreamClosed:
            return "stream closed";
        case ErrorCode::kInternalError:
            return "internal error";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Identifies the stage and the item being processed when an error occurred.
struct ErrorContext {
    /// @brief Name of the stage that failed (if applicable).
    std::string stage;

    /// @brief Zero-based index of the item within the stage's input (if known).
    std::optional<std::uint64_t> itemIndex;

    /// @brief Worker number within a fan-out (if applicable).
    std::optional<std::uint32_t> workerId;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with stage name.
    explicit ErrorContext(std::string stageName,
                          std::source_location loc = std::source_location::current())
        : stage(std::move(stageName)), location(loc) {}

    /// @brief Set the stage name.
    /// @return Reference to this for method chaining.
    ErrorContext& withStage(std::string name) {
        stage = std::move(name);
        return *this;
    }

    /// @brief Set the item index.
    /// @return Reference to this for method chaining.
    ErrorContext& withItem(std::uint64_t index) {
        itemIndex = index;
        return *this;
    }

    /// @brief Set the worker number.
    /// @return Reference to this for method chaining.
    ErrorContext& withWorker(std::uint32_t id) {
        workerId = id;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all pipeflow errors.
/// @note Provides error code, message, and optional context.
class PFlowException : public std::exception {
public:
    /// @brief Construct with error code and message.
    PFlowException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    PFlowException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~PFlowException() override = default;

    PFlowException(const PFlowException&) = default;
    PFlowException(PFlowException&&) noexcept = default;
    PFlowException& operator=(const PFlowException&) = default;
    PFlowException& operator=(PFlowException&&) noexcept = default;

    /// @brief Get the formatted message including context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Thrown for invalid stage or pool arguments.
/// @note Zero worker count, zero batch size, invalid configuration values.
class InvalidArgumentError : public PFlowException {
public:
    explicit InvalidArgumentError(std::string message)
        : PFlowException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : PFlowException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief Thrown when an operation violates an ownership or lifecycle rule.
/// @note Closing a stream twice or sending into a closed stream.
class InvalidStateError : public PFlowException {
public:
    explicit InvalidStateError(std::string message)
        : PFlowException(ErrorCode::kInvalidState, std::move(message)) {}

    InvalidStateError(std::string message, ErrorContext context)
        : PFlowException(ErrorCode::kInvalidState, std::move(message), std::move(context)) {}
};

/// @brief Raised when a stream ended because a stage failed.
/// @note Wraps the original exception so callers can rethrow or inspect it.
class StageFailure : public PFlowException {
public:
    explicit StageFailure(std::string message, std::exception_ptr cause = nullptr)
        : PFlowException(ErrorCode::kStageFailed, std::move(message)), cause_(std::move(cause)) {}

    StageFailure(std::string message, ErrorContext context, std::exception_ptr cause = nullptr)
        : PFlowException(ErrorCode::kStageFailed, std::move(message), std::move(context)),
          cause_(std::move(cause)) {}

    /// @brief Get the original exception (may be null).
    [[nodiscard]] const std::exception_ptr& cause() const noexcept { return cause_; }

private:
    std::exception_ptr cause_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a PFlowException.
    explicit Error(const PFlowException& ex) : code_(ex.code()), message_(ex.message()) {}

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Format as "[category] message".
    [[nodiscard]] std::string toString() const;

    /// @brief Convert to the appropriate exception type.
    [[nodiscard]] PFlowException toException() const;

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

    friend bool operator==(const Error& lhs, const Error& rhs) noexcept {
        return lhs.code_ == rhs.code_ && lhs.message_ == rhs.message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
/// @tparam T The success value type.
/// @tparam E The error type (defaults to Error).
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create a success result.
template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const PFlowException& ex) {
    return std::unexpected(Error{ex});
}

/// @brief Create an unexpected error with a formatted message.
/// @note Converts to any Result<T>.
template <typename... Args>
[[nodiscard]] std::unexpected<Error> makeError(ErrorCode code,
                                               fmt::format_string<Args...> format,
                                               Args&&... args) {
    return std::unexpected(Error{code, fmt::format(format, std::forward<Args>(args)...)});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws PFlowException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Convert a captured exception into an Error.
/// @note PFlowException keeps its code; anything else maps to kStageFailed.
[[nodiscard]] Error errorFromException(const std::exception_ptr& ex);

/// @brief Try to execute a function and convert exceptions to Result.
/// @tparam F The function type.
/// @return Result containing the return value or error.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const PFlowException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kStageFailed, ex.what()});
    }
}

}  // namespace pflow

#endif  // PFLOW_COMMON_ERROR_H
