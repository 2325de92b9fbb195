#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace yield_oracle::core {

enum class error_kind : std::uint8_t {
  UNKNOWN_ASSET = 0,
  INVALID_IDENTIFIER = 1,
  CAPACITY_TOO_LARGE = 2,
  INSUFFICIENT_SAMPLES = 3,
  UNAUTHORIZED = 4,
  RATE_SOURCE_FAILURE = 5,
  NON_MONOTONIC_SAMPLES = 6,
};

const char* to_string(error_kind kind) noexcept;

class OracleError : public std::runtime_error {
 public:
  OracleError(error_kind kind, const std::string& message);

  [[nodiscard]] error_kind kind() const noexcept { return kind_; }

 private:
  error_kind kind_;
};

}  // namespace yield_oracle::core
