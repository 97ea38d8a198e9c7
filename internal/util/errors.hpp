#pragma once

#include <stdexcept>
#include <string>

namespace hsm::util {

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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// stat()/stat(1) could not produce size and block count for a path.
class ProbeError : public std::runtime_error {
 public:
  explicit ProbeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operation attempted on an unverified file or storage object.
class Unverified : public std::runtime_error {
 public:
  explicit Unverified(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageClassNotSupportedError : public std::runtime_error {
 public:
  explicit StorageClassNotSupportedError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingLocationError : public std::runtime_error {
 public:
  explicit MissingLocationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// More than one HSM backend entry configured for a storage box.
class MultipleConfigError : public std::runtime_error {
 public:
  explicit MultipleConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RetrieveError : public std::runtime_error {
 public:
  explicit RetrieveError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace hsm::util
