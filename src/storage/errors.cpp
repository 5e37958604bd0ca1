#include "storage/errors.hpp"

#include <fmt/format.h>

namespace sbs::storage {

StorageError::StorageError(const long status, std::string body)
    : StorageException(fmt::format("Operation failed with status: {}: {}", status, body)),
      status_(status), body_(std::move(body)) {}

}
