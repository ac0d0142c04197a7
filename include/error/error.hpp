#ifndef HOLD_ERROR_HPP
#define HOLD_ERROR_HPP

#include <exception>
#include <ios>
#include <stdexcept>
#include <string>
#include <system_error>

namespace hold {
namespace error {

enum class ErrorKind {
    NOT_FOUND,
    PROVIDER,
    BODY
};

const char* error_kind_to_string(ErrorKind kind);

// std::ios_base::failure that still holds the backend error it was converted from
class IoFailure : public std::ios_base::failure {
public:
    IoFailure(const std::string& message, const std::error_code& code, std::exception_ptr cause);

    const std::exception_ptr& cause() const noexcept { return cause_; }
    void rethrow_cause() const;

private:
    std::exception_ptr cause_;
};

// Base of every failure a provider is allowed to report
class Error : public std::runtime_error {
public:
    ErrorKind kind() const noexcept { return kind_; }

    // Original backend error, null for BodyError
    const std::exception_ptr& cause() const noexcept { return cause_; }
    // Rethrows the original backend error, if any
    void rethrow_cause() const;

    // ---- I/O CONVERSION ----
    // not found -> no_such_file_or_directory, anything else -> io_error
    std::error_code io_error_code() const;
    IoFailure to_io_failure() const;
    // Throws to_io_failure() with the cause nested, for std::rethrow_if_nested
    void raise_as_io_failure() const;

protected:
    Error(ErrorKind kind, const std::string& message, std::exception_ptr cause);

private:
    ErrorKind kind_;
    std::exception_ptr cause_;
};

class NotFoundError : public Error {
public:
    NotFoundError(const std::string& id, std::exception_ptr cause);

    const std::string& id() const noexcept { return id_; }

private:
    std::string id_;
};

class ProviderError : public Error {
public:
    explicit ProviderError(std::exception_ptr cause);
};

class BodyError : public Error {
public:
    explicit BodyError(const std::string& message);
};

// Best-effort description of an exception_ptr for messages and logs
std::string describe(const std::exception_ptr& cause);

} // namespace error
} // namespace hold

#endif // HOLD_ERROR_HPP
