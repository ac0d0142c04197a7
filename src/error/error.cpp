#include "error/error.hpp"
#include <utility>

namespace hold {
namespace error {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "Not found";
        case ErrorKind::PROVIDER: return "Provider error";
        case ErrorKind::BODY: return "Body error";
        default: return "Undefined error";
    }
}

std::string describe(const std::exception_ptr& cause) {
    if (!cause) {
        return "unknown cause";
    }
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

//==============================================
// ERROR
//==============================================

Error::Error(ErrorKind kind, const std::string& message, std::exception_ptr cause)
    : std::runtime_error(message)
    , kind_(kind)
    , cause_(std::move(cause)) {}

void Error::rethrow_cause() const {
    if (cause_) {
        std::rethrow_exception(cause_);
    }
}

std::error_code Error::io_error_code() const {
    if (kind_ == ErrorKind::NOT_FOUND) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return std::make_error_code(std::errc::io_error);
}

IoFailure Error::to_io_failure() const {
    return IoFailure(what(), io_error_code(), cause_);
}

void Error::raise_as_io_failure() const {
    if (!cause_) {
        throw to_io_failure();
    }
    try {
        std::rethrow_exception(cause_);
    } catch (...) {
        std::throw_with_nested(to_io_failure());
    }
}


//==============================================
// IO FAILURE
//==============================================

IoFailure::IoFailure(const std::string& message, const std::error_code& code, std::exception_ptr cause)
    : std::ios_base::failure(message, code)
    , cause_(std::move(cause)) {}

void IoFailure::rethrow_cause() const {
    if (cause_) {
        std::rethrow_exception(cause_);
    }
}

//==============================================
// ERROR KINDS
//==============================================

NotFoundError::NotFoundError(const std::string& id, std::exception_ptr cause)
    : Error(ErrorKind::NOT_FOUND, "ID not found " + id + ": " + describe(cause), cause)
    , id_(id) {}

ProviderError::ProviderError(std::exception_ptr cause)
    : Error(ErrorKind::PROVIDER, "Provider error: " + describe(cause), cause) {}

BodyError::BodyError(const std::string& message)
    : Error(ErrorKind::BODY, "Error while reading body: " + message, nullptr) {}

} // namespace error
} // namespace hold
