#include "registry/asset_registry.hpp"

#include <algorithm>
#include <cctype>

#include "core/errors.hpp"

namespace yield_oracle::registry {

bool is_valid_identifier(const std::string& identifier) {
  if (identifier.empty()) {
    return false;
  }
  if (std::all_of(identifier.begin(), identifier.end(), [](unsigned char c) { return std::isspace(c) != 0; })) {
    return false;
  }
  if (identifier.size() > 2 && identifier[0] == '0' && (identifier[1] == 'x' || identifier[1] == 'X')) {
    return !std::all_of(identifier.begin() + 2, identifier.end(), [](char c) { return c == '0'; });
  }
  return true;
}

AssetRegistry::BindResult AssetRegistry::bind(const std::string& asset, const std::string& rate_source) {
  if (!is_valid_identifier(asset)) {
    throw core::OracleError(core::error_kind::INVALID_IDENTIFIER, "invalid asset identifier '" + asset + "'");
  }
  if (!is_valid_identifier(rate_source)) {
    throw core::OracleError(core::error_kind::INVALID_IDENTIFIER,
                            "invalid rate source identifier '" + rate_source + "' for asset " + asset);
  }

  BindResult result{Binding{asset, rate_source}, false, false};
  if (!positions_.count(asset)) {
    positions_.emplace(asset, assets_.size());
    assets_.push_back(asset);
    result.newly_registered = true;
  }

  auto& bound = rate_sources_[asset];
  result.source_changed = bound != rate_source;
  bound = rate_source;
  return result;
}

std::optional<std::size_t> AssetRegistry::position(const std::string& asset) const {
  const auto it = positions_.find(asset);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool AssetRegistry::contains(const std::string& asset) const { return positions_.count(asset) != 0; }

const std::string& AssetRegistry::rate_source_for(const std::string& asset) const {
  const auto it = rate_sources_.find(asset);
  if (it == rate_sources_.end()) {
    throw core::OracleError(core::error_kind::UNKNOWN_ASSET, "asset " + asset + " is not registered");
  }
  return it->second;
}

const std::vector<std::string>& AssetRegistry::assets() const noexcept { return assets_; }

std::size_t AssetRegistry::size() const noexcept { return assets_.size(); }

}  // namespace yield_oracle::registry
