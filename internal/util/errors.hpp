#pragma once

#include <stdexcept>
#include <string>

namespace fleet::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed, unknown or revoked credential. Raised before any side effect.
class AuthenticationFailure : public std::runtime_error {
 public:
  explicit AuthenticationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Attempted transition out of a terminal (or otherwise disallowed) state.
class TerminalStateViolation : public std::runtime_error {
 public:
  explicit TerminalStateViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Busy / locked / I/O failures of the backing store. Safe to retry.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fleet::util
