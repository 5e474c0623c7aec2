// include/option_screener/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace option_screener {

/**
 * @brief Error codes for the screener
 * Provider, pricing and configuration failures each get their own code so
 * the pipeline can map them onto skip reasons
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,

    // Data provider errors
    DATA_UNAVAILABLE = 3,
    INSUFFICIENT_DATA = 4,
    INVALID_DATA = 5,
    CONVERSION_ERROR = 6,

    // Pricing errors
    DEGENERATE_INPUTS = 7,

    // Configuration errors
    INVALID_CONFIGURATION = 8,

    // Transport errors
    CONNECTION_ERROR = 9,
    TIMEOUT_ERROR = 10,
    API_ERROR = 11,

    // File and I/O errors
    FILE_NOT_FOUND = 12,
    FILE_IO_ERROR = 13,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 14
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::DATA_UNAVAILABLE:
            return "DATA_UNAVAILABLE";
        case ErrorCode::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::DEGENERATE_INPUTS:
            return "DEGENERATE_INPUTS";
        case ErrorCode::INVALID_CONFIGURATION:
            return "INVALID_CONFIGURATION";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::API_ERROR:
            return "API_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Exception type carried by failed results
 */
class ScreenerError : public std::runtime_error {
public:
    /**
     * @brief Constructor for ScreenerError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    ScreenerError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

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
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<ScreenerError> error) : value_(), error_(std::move(error)) {}

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

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws ScreenerError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws ScreenerError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    const ScreenerError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<ScreenerError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<ScreenerError> error) : error_(std::move(error)) {}

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

    const ScreenerError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<ScreenerError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<ScreenerError>(code, message, component));
}

}  // namespace option_screener
