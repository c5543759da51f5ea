#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace codescope {

class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Invalid configuration or a malformed input record. Aborts the current operation only.
class ConfigurationError : public Error {
 public:
  using Error::Error;
};

class DimensionMismatchError : public ConfigurationError {
 public:
  DimensionMismatchError(const std::string& where, std::size_t expected, std::size_t actual)
      : ConfigurationError(where + ": dimension mismatch (expected " + std::to_string(expected) + ", got " +
                           std::to_string(actual) + ")"),
        expected_(expected),
        actual_(actual) {}

  [[nodiscard]] std::size_t expected() const noexcept { return expected_; }
  [[nodiscard]] std::size_t actual() const noexcept { return actual_; }

 private:
  std::size_t expected_ = 0;
  std::size_t actual_ = 0;
};

// Embedding or completion collaborator unreachable or returned a malformed response.
class ProviderError : public Error {
 public:
  using Error::Error;
};

// Persisted snapshot is partial or garbled.
class CorruptionError : public Error {
 public:
  using Error::Error;
};

class StoreError : public Error {
 public:
  using Error::Error;
};

}  // namespace codescope
