#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace fleet::db {

// Converts a failed Result into the matching util:: exception.
// Conflict becomes TerminalStateViolation; transient backend failures
// become StoreUnavailable.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace fleet::db
