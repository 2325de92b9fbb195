#include "sensors/rate_source.hpp"

#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace yield_oracle::sensors {
namespace {

constexpr std::size_t kReadBufferSize = 256;

// Pool state file, re-read on every sample:
//   total_supply <integer>
//   total_borrow <integer>
class PoolFileRateSource final : public RateSource {
 public:
  PoolFileRateSource(std::string path, const KinkedRateCurve curve) : path_(std::move(path)), curve_(curve) {}

  const char* kind() const noexcept override { return "pool_file"; }

  bool utilization(model::rate_t& out) noexcept override {
    model::rate_t total_supply = 0;
    model::rate_t total_borrow = 0;
    if (!read_totals(total_supply, total_borrow)) {
      return false;
    }
    out = pool_utilization(total_supply, total_borrow);
    return true;
  }

  bool supply_rate(const model::rate_t utilization, model::rate_t& out) noexcept override {
    out = curve_.supply_rate(utilization);
    return true;
  }

 private:
  bool read_totals(model::rate_t& total_supply, model::rate_t& total_borrow) noexcept {
    std::FILE* file = std::fopen(path_.c_str(), "r");
    if (file == nullptr) {
      if (!reported_open_failure_) {
        std::cerr << "[pool_file] unable to open " << path_ << '\n';
        reported_open_failure_ = true;
      }
      return false;
    }
    reported_open_failure_ = false;

    bool has_supply = false;
    bool has_borrow = false;
    char buffer[kReadBufferSize]{};
    while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), file) != nullptr) {
      char key[64]{};
      unsigned long long value = 0;
      if (std::sscanf(buffer, "%63s %llu", key, &value) != 2) {
        continue;
      }

      if (std::strcmp(key, "total_supply") == 0) {
        total_supply = value;
        has_supply = true;
      } else if (std::strcmp(key, "total_borrow") == 0) {
        total_borrow = value;
        has_borrow = true;
      }
    }

    const bool read_error = std::ferror(file) != 0;
    std::fclose(file);
    return !read_error && has_supply && has_borrow;
  }

  std::string path_;
  KinkedRateCurve curve_;
  bool reported_open_failure_{false};
};

}  // namespace

std::unique_ptr<RateSource> make_pool_file_rate_source(std::string path, KinkedRateCurve curve) {
  return std::make_unique<PoolFileRateSource>(std::move(path), curve);
}

}  // namespace yield_oracle::sensors
