// include/fomc_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace fomc_ngin {

/**
 * @brief Error codes for the event-study pipeline
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATA_UNAVAILABLE = 4,  // No ticks / no trade in window. Recoverable.
    INVALID_DATA = 5,
    CONVERSION_ERROR = 6,

    // Setup errors
    CONFIGURATION_ERROR = 7,  // Fatal, aborts the run

    // Calendar errors
    AMBIGUOUS_TIMESTAMP = 8,  // Local wall time skipped or repeated by DST

    // File and I/O errors
    FILE_NOT_FOUND = 9,
    FILE_IO_ERROR = 10,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 11,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATA_UNAVAILABLE:
            return "DATA_UNAVAILABLE";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::CONFIGURATION_ERROR:
            return "CONFIGURATION_ERROR";
        case ErrorCode::AMBIGUOUS_TIMESTAMP:
            return "AMBIGUOUS_TIMESTAMP";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Whether a batch run may skip the failing unit of work and continue
 *
 * Missing data and unresolvable anchors only cost the affected meeting or
 * instrument. Everything else indicates a setup defect.
 */
inline bool is_recoverable(ErrorCode code) {
    return code == ErrorCode::DATA_UNAVAILABLE || code == ErrorCode::AMBIGUOUS_TIMESTAMP ||
           code == ErrorCode::FILE_NOT_FOUND;
}

/**
 * @brief Exception type carried by Result
 */
class FomcError : public std::runtime_error {
public:
    /**
     * @brief Constructor for FomcError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    FomcError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    /**
     * @brief Get the error code
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (Code: " +
               error_code_to_string(code_) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<FomcError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    /**
     * @brief Check if result represents success
     */
    bool is_ok() const {
        return error_ == nullptr;
    }

    /**
     * @brief Check if result represents error
     */
    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @throws FomcError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws FomcError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const FomcError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<FomcError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<FomcError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const FomcError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<FomcError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<FomcError>(code, message, component));
}

/**
 * @brief Re-wrap an error from one Result type into another
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed, const std::string& component) {
    return make_error<T>(failed.error()->code(), failed.error()->what(), component);
}

}  // namespace fomc_ngin
