#include "core/admin.hpp"

#include "core/errors.hpp"

namespace yield_oracle::core {

AdminGate::AdminGate(const std::vector<std::string>& admins) : admins_(admins.begin(), admins.end()) {}

AdminCapability AdminGate::require(const std::string& caller) const {
  if (!is_admin(caller)) {
    throw OracleError(error_kind::UNAUTHORIZED, "caller '" + caller + "' lacks admin privilege");
  }
  return AdminCapability(caller);
}

bool AdminGate::is_admin(const std::string& caller) const {
  return !caller.empty() && admins_.count(caller) != 0;
}

}  // namespace yield_oracle::core
