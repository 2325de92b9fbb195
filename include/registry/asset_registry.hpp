#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace yield_oracle::registry {

struct Binding {
  std::string asset;
  std::string rate_source;
};

// Append-only, duplicate-free list of assets with their rate source binding.
class AssetRegistry {
 public:
  struct BindResult {
    Binding binding;
    bool newly_registered{false};
    bool source_changed{false};
  };

  // Registers `asset` or rebinds its rate source. Throws
  // core::OracleError(INVALID_IDENTIFIER) on an empty or zero identifier.
  BindResult bind(const std::string& asset, const std::string& rate_source);

  [[nodiscard]] std::optional<std::size_t> position(const std::string& asset) const;
  [[nodiscard]] bool contains(const std::string& asset) const;

  // Throws core::OracleError(UNKNOWN_ASSET).
  [[nodiscard]] const std::string& rate_source_for(const std::string& asset) const;

  [[nodiscard]] const std::vector<std::string>& assets() const noexcept;
  [[nodiscard]] std::size_t size() const noexcept;

 private:
  std::vector<std::string> assets_{};
  std::unordered_map<std::string, std::size_t> positions_{};
  std::unordered_map<std::string, std::string> rate_sources_{};
};

// Empty, blank or all-zero hex ("0x0000...") identifiers are invalid.
[[nodiscard]] bool is_valid_identifier(const std::string& identifier);

}  // namespace yield_oracle::registry
