#pragma once

#include <stdexcept>
#include <string>

namespace roster::util {

/*
  Central error types for service-level operations.

  These get translated later to gRPC status codes. The core move and
  claim entry points do not throw these; they return typed results.
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

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unimplemented : public std::runtime_error {
 public:
  explicit Unimplemented(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace roster::util
