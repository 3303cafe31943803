#pragma once

#include <stdexcept>
#include <string>

namespace alerts::util {

/*
  Central error types.

  Local operations let these propagate to the caller. The replication pool
  retries RetryableError and its subclasses, everything else is final.
*/

class InvalidCoordinates : public std::runtime_error {
 public:
  explicit InvalidCoordinates(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SlugCollision : public std::runtime_error {
 public:
  explicit SlugCollision(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PathTraversalRejected : public std::runtime_error {
 public:
  explicit PathTraversalRejected(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ContentHashMismatch : public std::runtime_error {
 public:
  explicit ContentHashMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RetryableError : public std::runtime_error {
 public:
  explicit RetryableError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockTimeout : public RetryableError {
 public:
  explicit LockTimeout(const std::string& msg) : RetryableError(msg) {
  }
};

class IOError : public RetryableError {
 public:
  explicit IOError(const std::string& msg) : RetryableError(msg) {
  }
};

} // namespace alerts::util
