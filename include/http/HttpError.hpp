#pragma once

#include <stdexcept>
#include <string>

namespace lanshare {
namespace http {

enum class ErrorKind {
    MalformedRequest,
    NotFound,
    MethodNotAllowed,
    RangeNotSatisfiable,
    IncompleteTransfer,
    InternalError,
};

/**
 * Error raised anywhere in request handling. The server maps the kind
 * to a status code when no response has been started yet.
 */
class HttpError : public std::runtime_error {
public:
    HttpError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    int status() const {
        switch (kind_) {
            case ErrorKind::MalformedRequest:    return 400;
            case ErrorKind::NotFound:            return 404;
            case ErrorKind::MethodNotAllowed:    return 405;
            case ErrorKind::RangeNotSatisfiable: return 416;
            case ErrorKind::IncompleteTransfer:  return 400;
            case ErrorKind::InternalError:       return 500;
        }
        return 500;
    }

    static HttpError malformed(const std::string& message) {
        return HttpError(ErrorKind::MalformedRequest, message);
    }

    static HttpError notFound(const std::string& message) {
        return HttpError(ErrorKind::NotFound, message);
    }

    static HttpError incomplete(const std::string& message) {
        return HttpError(ErrorKind::IncompleteTransfer, message);
    }

    static HttpError internal(const std::string& message) {
        return HttpError(ErrorKind::InternalError, message);
    }

private:
    ErrorKind kind_;
};

} // namespace http
} // namespace lanshare
