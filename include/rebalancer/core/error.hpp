// include/rebalancer/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace rebalancer {

/**
 * @brief Error codes for the rebalancing agent
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    INVALID_DATA = 4,
    CONVERSION_ERROR = 5,

    // Trading errors
    ORDER_REJECTED = 6,
    INSUFFICIENT_FUNDS = 7,
    INVALID_ORDER = 8,

    // Scheduling errors
    PRECONDITION_VIOLATION = 9,

    // Broker connectivity errors
    CONNECTION_ERROR = 10,
    TIMEOUT_ERROR = 11,
    API_ERROR = 12,
    MARKET_DATA_ERROR = 13,

    // File and I/O errors
    FILE_NOT_FOUND = 14,
    FILE_IO_ERROR = 15,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 16
};

/**
 * @brief Exception carrying an error code and the component that raised it
 */
class RebalanceError : public std::runtime_error {
public:
    /**
     * @brief Constructor for RebalanceError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    RebalanceError(ErrorCode code, const std::string& message, const std::string& component = "")
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
        return "Error in " + component_ + ": " + what() +
               " (Code: " + std::to_string(static_cast<int>(code_)) + ")";
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
    Result(std::unique_ptr<RebalanceError> error) : error_(std::move(error)) {}

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
     * @throws RebalanceError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const RebalanceError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<RebalanceError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<RebalanceError> error) : error_(std::move(error)) {}

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

    const RebalanceError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<RebalanceError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<RebalanceError>(code, message, component));
}

/**
 * @brief Re-wrap the error of one result as the error of another result type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed, const std::string& component) {
    const RebalanceError* err = failed.error();
    return make_error<T>(err->code(), err->what(),
                         err->component().empty() ? component : err->component());
}

}  // namespace rebalancer
