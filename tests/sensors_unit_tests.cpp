#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

#include "core/fixed_point.hpp"
#include "model/snapshot.hpp"
#include "sensors/kinked_rate_curve.hpp"
#include "sensors/rate_source.hpp"

using yield_oracle::core::format_fixed;
using yield_oracle::core::kRateScale;
using yield_oracle::core::midpoint;
using yield_oracle::core::mul_fixed_wide;
using yield_oracle::core::saturate;
using yield_oracle::core::parse_fixed;
using yield_oracle::model::rate_t;
using yield_oracle::sensors::KinkedRateCurve;
using yield_oracle::sensors::make_fixed_rate_source;
using yield_oracle::sensors::make_pool_file_rate_source;
using yield_oracle::sensors::pool_utilization;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool write_pool_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
  out.flush();
  return out.good();
}

KinkedRateCurve test_curve() {
  KinkedRateCurve curve{};
  curve.base = 1'000'000'000ULL;
  curve.slope_low = 2'000'000'000ULL;
  curve.slope_high = 20'000'000'000ULL;
  curve.kink = 800'000'000'000'000'000ULL;
  return curve;
}

int test_fixed_rate_source() {
  auto source = make_fixed_rate_source(1'585'489'599ULL);
  rate_t utilization = 42;
  rate_t rate = 0;
  if (!source->utilization(utilization) || utilization != 0) {
    return fail("test_fixed_rate_source", "fixed source reports zero utilization");
  }
  if (!source->current_supply_rate(rate) || rate != 1'585'489'599ULL) {
    return fail("test_fixed_rate_source", "fixed source must return its configured rate");
  }
  return 0;
}

int test_kinked_curve_slopes() {
  const auto curve = test_curve();
  if (curve.supply_rate(0) != 1'000'000'000ULL) {
    return fail("test_kinked_curve_slopes", "zero utilization should yield the base rate");
  }
  if (curve.supply_rate(500'000'000'000'000'000ULL) != 2'000'000'000ULL) {
    return fail("test_kinked_curve_slopes", "below kink uses the low slope");
  }
  if (curve.supply_rate(800'000'000'000'000'000ULL) != 2'600'000'000ULL) {
    return fail("test_kinked_curve_slopes", "rate at the kink mismatch");
  }
  if (curve.supply_rate(900'000'000'000'000'000ULL) != 4'600'000'000ULL) {
    return fail("test_kinked_curve_slopes", "above kink adds the high slope");
  }

  KinkedRateCurve steep{};
  steep.base = std::numeric_limits<rate_t>::max() - 1;
  steep.slope_low = std::numeric_limits<rate_t>::max();
  if (steep.supply_rate(kRateScale) != std::numeric_limits<rate_t>::max()) {
    return fail("test_kinked_curve_slopes", "curve must saturate instead of wrapping");
  }
  return 0;
}

int test_pool_utilization() {
  if (pool_utilization(0, 100) != 0) {
    return fail("test_pool_utilization", "empty pool has zero utilization");
  }
  if (pool_utilization(1000, 250) != 250'000'000'000'000'000ULL) {
    return fail("test_pool_utilization", "250/1000 should be 0.25");
  }
  return 0;
}

int test_pool_file_source_rereads_file() {
  const auto path = std::filesystem::temp_directory_path() / "yield_oracle_pool_state.txt";
  if (!write_pool_file(path, "total_supply 1000\ntotal_borrow 500\n")) {
    return fail("test_pool_file_source_rereads_file", "failed writing pool file");
  }

  auto source = make_pool_file_rate_source(path.string(), test_curve());
  rate_t rate = 0;
  if (!source->current_supply_rate(rate) || rate != 2'000'000'000ULL) {
    return fail("test_pool_file_source_rereads_file", "half utilized pool rate mismatch");
  }

  if (!write_pool_file(path, "# refreshed\ntotal_supply 1000\ntotal_borrow 900\n")) {
    return fail("test_pool_file_source_rereads_file", "failed rewriting pool file");
  }
  if (!source->current_supply_rate(rate) || rate != 4'600'000'000ULL) {
    return fail("test_pool_file_source_rereads_file", "source must pick up the new totals");
  }

  if (!write_pool_file(path, "total_supply 1000\n")) {
    return fail("test_pool_file_source_rereads_file", "failed writing partial pool file");
  }
  rate = 7;
  if (source->current_supply_rate(rate) || rate != 7) {
    return fail("test_pool_file_source_rereads_file", "missing borrow total must fail without touching output");
  }

  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (source->current_supply_rate(rate)) {
    return fail("test_pool_file_source_rereads_file", "missing file must fail");
  }
  return 0;
}

int test_parse_and_format_fixed() {
  if (parse_fixed("0.05") != 50'000'000'000'000'000ULL || parse_fixed("12") != 12 * kRateScale ||
      parse_fixed("1.000000000000000001") != kRateScale + 1 || parse_fixed("0.") != 0) {
    return fail("test_parse_and_format_fixed", "valid decimals parsed incorrectly");
  }

  const char* invalid[] = {"", ".", "1e5", "-1", "1.2.3", "0.0000000000000000001", "18.5"};
  for (const char* text : invalid) {
    bool threw = false;
    try {
      (void)parse_fixed(text);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    if (!threw) {
      return fail("test_parse_and_format_fixed", "invalid decimal accepted");
    }
  }

  if (format_fixed(50'000'000'000'000'000ULL) != "0.050000000000000000" ||
      format_fixed(kRateScale + 1) != "1.000000000000000001") {
    return fail("test_parse_and_format_fixed", "format mismatch");
  }
  return 0;
}

int test_fixed_point_arithmetic() {
  if (saturate(mul_fixed_wide(2 * kRateScale, 3 * kRateScale)) != 6 * kRateScale) {
    return fail("test_fixed_point_arithmetic", "2 * 3 should be 6");
  }

  const rate_t max = std::numeric_limits<rate_t>::max();
  if (saturate(mul_fixed_wide(10 * kRateScale, 10 * kRateScale)) != max) {
    return fail("test_fixed_point_arithmetic", "100 does not fit and must saturate");
  }

  if (midpoint(max, max) != max || midpoint(max, max - 1) != max - 1 || midpoint(1, 2) != 1) {
    return fail("test_fixed_point_arithmetic", "midpoint must not overflow and must truncate");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_fixed_rate_source(); rc != 0) {
    return rc;
  }
  if (int rc = test_kinked_curve_slopes(); rc != 0) {
    return rc;
  }
  if (int rc = test_pool_utilization(); rc != 0) {
    return rc;
  }
  if (int rc = test_pool_file_source_rereads_file(); rc != 0) {
    return rc;
  }
  if (int rc = test_parse_and_format_fixed(); rc != 0) {
    return rc;
  }
  if (int rc = test_fixed_point_arithmetic(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] sensors unit tests\n";
  return 0;
}
