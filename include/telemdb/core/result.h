#ifndef TELEMDB_CORE_RESULT_H_
#define TELEMDB_CORE_RESULT_H_

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "telemdb/core/error.h"

namespace telemdb {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Usage:
 * ```
 * Result<StoreConfig> load() {
 *     if (error_condition) {
 *         return Result<StoreConfig>::error("error message");
 *     }
 *     return Result<StoreConfig>(config);
 * }
 *
 * auto result = load();
 * if (result.ok()) {
 *     auto config = result.take_value();
 * } else {
 *     std::string error = result.error();
 * }
 * ```
 *
 * Failures built from an Error keep its code, so callers can tell an I/O
 * failure from a rejected argument without parsing the message.
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, ErrorTag, Error::Code code = Error::Code::UNKNOWN)
        : value_(), error_msg_(std::move(error_msg)), code_(code) {}

    explicit Result(const Error& error)
        : value_(), error_msg_(std::string(error.what())), code_(error.code()) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_msg_(std::move(other.error_msg_)), code_(other.code_) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
            code_ = other.code_;
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code error_code() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error code of ok result");
        }
        return code_;
    }
    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<T>(message, ErrorTag{}, code);
    }

private:
    T value_;
    std::optional<std::string> error_msg_;
    Error::Code code_ = Error::Code::UNKNOWN;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, ErrorTag, Error::Code code = Error::Code::UNKNOWN)
        : error_msg_(std::move(error_msg)), code_(code) {}

    explicit Result(const Error& error) : error_msg_(std::string(error.what())), code_(error.code()) {}

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code error_code() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error code of ok result");
        }
        return code_;
    }

    static Result<void> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<void>(message, ErrorTag{}, code);
    }

private:
    std::optional<std::string> error_msg_;
    Error::Code code_ = Error::Code::UNKNOWN;
};

} // namespace core
} // namespace telemdb

#endif // TELEMDB_CORE_RESULT_H_
