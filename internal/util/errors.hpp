#pragma once

#include <stdexcept>
#include <string>

namespace mountsync::util {

/*
  Central error types.

  Only ConfigurationError is allowed to reach main(); everything else is
  contained inside a single reconciliation pass.
*/

// Required path missing or unusable at startup.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Mount timed out / returned an I/O error. Never means "absent".
class TransientMountError : public std::runtime_error {
 public:
  explicit TransientMountError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// One descriptor file could not be parsed.
class MalformedMetadataError : public std::runtime_error {
 public:
  explicit MalformedMetadataError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Persisting one item failed; retried next cycle.
class StoreWriteError : public std::runtime_error {
 public:
  explicit StoreWriteError(const std::string& msg) : std::runtime_error(msg) {
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

} // namespace mountsync::util
