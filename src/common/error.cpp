// =============================================================================
// pipeflow - Error Handling Framework Implementation
// =============================================================================
// Implementation of error handling utilities and exception classes.
// =============================================================================

#include "pflow/common/error.h"

#include <sstream>

namespace pflow {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!stage.empty()) {
        oss << "stage: " << stage;
        hasContent = true;
    }

    if (itemIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "item: " << *itemIndex;
        hasContent = true;
    }

    if (workerId.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "worker: " << *workerId;
        hasContent = true;
    }

    // Add source location in debug builds
#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// PFlowException Implementation
// =============================================================================

void PFlowException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// Error Implementation
// =============================================================================

std::string Error::toString() const {
    return fmt::format("[{}] {}", errorCodeToString(code_), message_);
}

PFlowException Error::toException() const {
    switch (code_) {
        case ErrorCode::kInvalidArgument:
            return InvalidArgumentError(message_);
        case ErrorCode::kInvalidState:
            return InvalidStateError(message_);
        case ErrorCode::kStageFailed:
            return StageFailure(message_);
        default:
            break;
    }
    return PFlowException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        case ErrorCode::kInvalidState:
            throw InvalidStateError(message_);
        case ErrorCode::kStageFailed:
            throw StageFailure(message_);
        default:
            break;
    }
    throw PFlowException(code_, message_);
}

Error errorFromException(const std::exception_ptr& ex) {
    if (!ex) {
        return Error{ErrorCode::kInternalError, "missing exception"};
    }
    try {
        std::rethrow_exception(ex);
    } catch (const PFlowException& e) {
        return Error{e};
    } catch (const std::exception& e) {
        return Error{ErrorCode::kStageFailed, e.what()};
    } catch (...) {
        return Error{ErrorCode::kStageFailed, "non-standard exception"};
    }
}

}  // namespace pflow
