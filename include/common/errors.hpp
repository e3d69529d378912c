#ifndef ISOFETCH_ERRORS_HPP
#define ISOFETCH_ERRORS_HPP

#include <stdexcept>
#include <string>

// Base class for every error raised by isofetch code.
class IsofetchError : public std::runtime_error {
public:
    explicit IsofetchError(const std::string& what) : std::runtime_error(what) {}
};

// --- Caller-facing, raised synchronously ---

class ValidationError : public IsofetchError {
public:
    explicit ValidationError(const std::string& what) : IsofetchError(what) {}
};

class ConfigError : public IsofetchError {
public:
    explicit ConfigError(const std::string& what) : IsofetchError(what) {}
};

class NotFoundError : public IsofetchError {
public:
    explicit NotFoundError(const std::string& what) : IsofetchError(what) {}
};

class AlreadyExistsError : public IsofetchError {
public:
    AlreadyExistsError(const std::string& what, std::string existing_id)
        : IsofetchError(what), existing_id_(std::move(existing_id)) {}

    const std::string& existing_id() const { return existing_id_; }

private:
    std::string existing_id_;
};

class InvalidStateError : public IsofetchError {
public:
    InvalidStateError(const std::string& message, const std::string& current_status)
        : IsofetchError("invalid state: " + message + " (status: " + current_status + ")") {}
};

// --- Raised inside a worker; always recorded on the job, never rethrown ---

class HttpError : public IsofetchError {
public:
    explicit HttpError(const std::string& what) : IsofetchError(what) {}
};

class CancelledError : public IsofetchError {
public:
    explicit CancelledError(const std::string& reason) : IsofetchError(reason) {}
};

class ChecksumNotFoundError : public IsofetchError {
public:
    explicit ChecksumNotFoundError(const std::string& filename)
        : IsofetchError("checksum not found for file: " + filename) {}
};

class ChecksumMismatchError : public IsofetchError {
public:
    ChecksumMismatchError(const std::string& expected, const std::string& actual)
        : IsofetchError("checksum mismatch: expected " + expected + ", got " + actual) {}
};

#endif // ISOFETCH_ERRORS_HPP
