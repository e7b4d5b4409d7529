#ifndef TELEMDB_CORE_ERROR_H_
#define TELEMDB_CORE_ERROR_H_

#include <stdexcept>
#include <string>
#include <system_error>

namespace telemdb {
namespace core {

/**
 * @brief Base class for all telemdb errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        IO = 3,
        INTERNAL = 4
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

    static const char* CodeName(Code code) {
        switch (code) {
            case Code::INVALID_ARGUMENT: return "invalid argument";
            case Code::NOT_FOUND: return "not found";
            case Code::IO: return "I/O";
            case Code::INTERNAL: return "internal";
            case Code::UNKNOWN: break;
        }
        return "unknown";
    }

private:
    Code code_;
};

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
    explicit NotFoundError(const char* message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Error raised by snapshot and config file access
 *
 * Carries the file involved and, when the failure came from the filesystem
 * library, the underlying error code.
 */
class IOError : public Error {
public:
    explicit IOError(const std::string& message)
        : Error(message, Code::IO) {}
    explicit IOError(const char* message)
        : Error(message, Code::IO) {}
    IOError(const std::string& message, const std::string& path, std::error_code ec = {})
        : Error(message + ": " + path + (ec ? " (" + ec.message() + ")" : std::string()), Code::IO),
          path_(path), ec_(ec) {}

    const std::string& path() const { return path_; }
    const std::error_code& error_code() const { return ec_; }

private:
    std::string path_;
    std::error_code ec_;
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
    explicit InternalError(const char* message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace telemdb

#endif // TELEMDB_CORE_ERROR_H_
