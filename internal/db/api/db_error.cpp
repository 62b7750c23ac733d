#include "internal/db/api/db_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace fleet::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
      throw util::TerminalStateViolation(message);
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
    case ErrorCode::IOError:
      throw util::StoreUnavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace fleet::db
