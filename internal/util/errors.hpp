#pragma once

#include <stdexcept>
#include <string>

namespace canary::util {

/*
  Central error types.

  Thrown for conditions a component cannot turn into an outcome value
  itself; translated into util::Result at component boundaries.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IntegrityFailure : public std::runtime_error {
 public:
  explicit IntegrityFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedFormat : public std::runtime_error {
 public:
  explicit UnsupportedFormat(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// SQLite or filesystem failure below the component layer.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace canary::util
