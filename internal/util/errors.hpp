#pragma once

#include <stdexcept>
#include <string>

namespace roster::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Business declines of an assignment are values, never these.
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

// Catalogue data breaks its own rules (duplicate names, short groups).
class InvalidCatalog : public std::runtime_error {
 public:
  explicit InvalidCatalog(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient infrastructure failure; the caller may retry the whole call.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace roster::util
