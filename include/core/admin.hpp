#pragma once

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace yield_oracle::core {

// Proof that a caller passed the admin check. Only AdminGate can mint one.
class AdminCapability {
 public:
  [[nodiscard]] const std::string& holder() const noexcept { return holder_; }

 private:
  friend class AdminGate;

  explicit AdminCapability(std::string holder) : holder_(std::move(holder)) {}

  std::string holder_;
};

class AdminGate {
 public:
  explicit AdminGate(const std::vector<std::string>& admins);

  // Throws core::OracleError(UNAUTHORIZED) for callers not in the admin set.
  [[nodiscard]] AdminCapability require(const std::string& caller) const;

  [[nodiscard]] bool is_admin(const std::string& caller) const;

 private:
  std::unordered_set<std::string> admins_;
};

}  // namespace yield_oracle::core
