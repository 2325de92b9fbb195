#include "core/errors.hpp"

namespace yield_oracle::core {

const char* to_string(const error_kind kind) noexcept {
  switch (kind) {
    case error_kind::UNKNOWN_ASSET:
      return "UnknownAsset";
    case error_kind::INVALID_IDENTIFIER:
      return "InvalidAddressOrIdentifier";
    case error_kind::CAPACITY_TOO_LARGE:
      return "CapacityTooLarge";
    case error_kind::INSUFFICIENT_SAMPLES:
      return "InsufficientSamples";
    case error_kind::UNAUTHORIZED:
      return "Unauthorized";
    case error_kind::RATE_SOURCE_FAILURE:
      return "RateSourceFailure";
    case error_kind::NON_MONOTONIC_SAMPLES:
      return "NonMonotonicSamples";
  }
  return "Unknown";
}

OracleError::OracleError(const error_kind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

}  // namespace yield_oracle::core
