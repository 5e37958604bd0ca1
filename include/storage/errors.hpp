#pragma once

#include <stdexcept>
#include <string>

namespace sbs::storage {

struct StorageException : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Required environment variable or config entry is missing or unreadable.
struct ConfigError : StorageException {
    using StorageException::StorageException;
};

// A header name or value that cannot be put on the wire.
struct HeaderError : StorageException {
    using StorageException::StorageException;
};

// A request payload that could not be encoded as JSON.
struct SerdeError : StorageException {
    using StorageException::StorageException;
};

// The request never produced an HTTP response.
struct TransportError : StorageException {
    using StorageException::StorageException;
};

/**
 * The service answered with a non-2xx status, or with a body that does not
 * match the expected success shape. Status and body are carried verbatim.
 */
class StorageError : public StorageException {
public:
    StorageError(long status, std::string body);

    [[nodiscard]] long status() const noexcept { return status_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }

private:
    long status_;
    std::string body_;
};

}
