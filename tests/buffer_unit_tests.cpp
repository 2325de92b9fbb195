#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <vector>

#include "buffer/snapshot_ring.hpp"
#include "core/errors.hpp"
#include "derived/time_weighted_yield.hpp"
#include "model/snapshot.hpp"

using yield_oracle::buffer::SnapshotRing;
using yield_oracle::core::OracleError;
using yield_oracle::core::error_kind;
using yield_oracle::derived::summarize_window;
using yield_oracle::derived::time_weighted_average;
using yield_oracle::model::rate_t;
using yield_oracle::model::snapshot;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool throws_kind(const std::function<void()>& action, const error_kind expected) {
  try {
    action();
  } catch (const OracleError& ex) {
    return ex.kind() == expected;
  }
  return false;
}

int test_latch_advances_cursor_one_slot_at_a_time() {
  for (std::size_t capacity = 1; capacity <= SnapshotRing::kMaxCapacity; ++capacity) {
    SnapshotRing ring(capacity);
    for (std::size_t i = 0; i < (3 * capacity) + 1; ++i) {
      const auto before_slots = ring.slots();
      const auto before_index = ring.write_index();

      const auto written = ring.latch(i + 1, static_cast<rate_t>(i * 7));
      if (written.timestamp != i + 1 || written.rate != i * 7) {
        return fail("test_latch_advances_cursor_one_slot_at_a_time", "latch returned the wrong snapshot");
      }
      if (ring.write_index() != (before_index + 1) % capacity) {
        return fail("test_latch_advances_cursor_one_slot_at_a_time", "cursor did not advance modulo capacity");
      }

      const auto after_slots = ring.slots();
      std::size_t changed = 0;
      for (std::size_t slot = 0; slot < capacity; ++slot) {
        if (before_slots[slot] != after_slots[slot]) {
          ++changed;
        }
      }
      if (changed != 1 || after_slots[before_index] != written) {
        return fail("test_latch_advances_cursor_one_slot_at_a_time", "latch must overwrite exactly the cursor slot");
      }
    }
  }
  return 0;
}

int test_resize_only_grows() {
  SnapshotRing ring;
  ring.latch(10, 100);
  ring.latch(20, 200);
  ring.latch(30, 300);
  const auto before = ring.slots();

  if (ring.resize(3) != 5 || ring.resize(5) != 5) {
    return fail("test_resize_only_grows", "shrink or same-size requests must return the current capacity");
  }
  if (ring.slots() != before || ring.write_index() != 3) {
    return fail("test_resize_only_grows", "ignored resize must not touch slots or cursor");
  }

  if (!throws_kind([&ring] { ring.resize(16); }, error_kind::CAPACITY_TOO_LARGE)) {
    return fail("test_resize_only_grows", "resize past 15 must fail with CapacityTooLarge");
  }
  if (ring.capacity() != 5 || ring.slots() != before) {
    return fail("test_resize_only_grows", "failed resize must leave the ring untouched");
  }
  return 0;
}

int test_resize_to_max_after_three_latches() {
  SnapshotRing ring;
  ring.latch(10, 100);
  ring.latch(20, 200);
  ring.latch(30, 300);

  if (ring.resize(15) != 15 || ring.capacity() != 15) {
    return fail("test_resize_to_max_after_three_latches", "capacity should grow to 15");
  }
  if (ring.write_index() != 3) {
    return fail("test_resize_to_max_after_three_latches", "cursor must stay at 3");
  }
  for (std::size_t i = 5; i < 15; ++i) {
    if (ring.slot(i).has_value()) {
      return fail("test_resize_to_max_after_three_latches", "appended slots must be uninitialized");
    }
  }
  if (ring.slot(0) != snapshot{10, 100} || ring.slot(2) != snapshot{30, 300} || ring.populated() != 3) {
    return fail("test_resize_to_max_after_three_latches", "existing slots must be preserved");
  }
  return 0;
}

int test_two_samples_yield_trapezoid_midpoint() {
  SnapshotRing ring;
  ring.latch(100, 18'000'000'000'000'000'000ULL);
  ring.latch(160, 17'000'000'000'000'000'001ULL);
  if (time_weighted_average(ring) != 17'500'000'000'000'000'000ULL) {
    return fail("test_two_samples_yield_trapezoid_midpoint", "large rates must average to their midpoint");
  }

  SnapshotRing small(2);
  small.latch(5, 3);
  small.latch(9, 4);
  if (time_weighted_average(small) != 3) {
    return fail("test_two_samples_yield_trapezoid_midpoint", "midpoint must truncate");
  }
  return 0;
}

int test_insufficient_samples() {
  SnapshotRing empty;
  if (!throws_kind([&empty] { (void)time_weighted_average(empty); }, error_kind::INSUFFICIENT_SAMPLES)) {
    return fail("test_insufficient_samples", "empty ring must fail");
  }

  SnapshotRing single;
  single.latch(10, 100);
  if (!throws_kind([&single] { (void)time_weighted_average(single); }, error_kind::INSUFFICIENT_SAMPLES)) {
    return fail("test_insufficient_samples", "single snapshot must fail");
  }

  SnapshotRing same_time;
  same_time.latch(10, 100);
  same_time.latch(10, 200);
  same_time.latch(10, 300);
  if (!throws_kind([&same_time] { (void)time_weighted_average(same_time); }, error_kind::INSUFFICIENT_SAMPLES)) {
    return fail("test_insufficient_samples", "snapshots sharing one timestamp must fail");
  }
  return 0;
}

int test_full_cycle_from_time_zero() {
  SnapshotRing ring;
  const rate_t rates[] = {100, 200, 300, 400, 500};
  for (std::size_t i = 0; i < 5; ++i) {
    ring.latch(i * 10, rates[i]);
  }

  if (ring.write_index() != 0) {
    return fail("test_full_cycle_from_time_zero", "five latches should wrap the cursor to 0");
  }

  const auto window = summarize_window(ring);
  if (window.average != 300 || window.samples != 5 || window.total_elapsed != 40 || window.oldest != 0 ||
      window.newest != 40) {
    return fail("test_full_cycle_from_time_zero", "time weighted average should be 300 over 40s");
  }
  return 0;
}

int test_uneven_intervals_are_time_weighted() {
  SnapshotRing ring;
  ring.latch(0, 100);
  ring.latch(30, 300);
  ring.latch(40, 500);
  // (200 * 30 + 400 * 10) / 40
  if (time_weighted_average(ring) != 250) {
    return fail("test_uneven_intervals_are_time_weighted", "longer periods must weigh more");
  }
  return 0;
}

int test_partially_filled_ring_skips_empty_anchor() {
  SnapshotRing ring;
  ring.latch(10, 100);
  ring.latch(20, 200);
  ring.latch(30, 300);

  // The cursor points at an empty slot; it must not seed the average with {0, 0}.
  if (time_weighted_average(ring) != 200) {
    return fail("test_partially_filled_ring_skips_empty_anchor", "average over 3 of 5 slots should be 200");
  }
  return 0;
}

int test_growth_after_wrap_leaves_gap_out_of_average() {
  SnapshotRing ring(3);
  ring.latch(10, 100);
  ring.latch(20, 200);
  ring.latch(30, 300);
  ring.latch(40, 400);
  if (ring.write_index() != 1 || time_weighted_average(ring) != 300) {
    return fail("test_growth_after_wrap_leaves_gap_out_of_average", "wrapped 3-slot ring should average 300");
  }

  ring.resize(5);
  if (ring.write_index() != 1 || time_weighted_average(ring) != 300) {
    return fail("test_growth_after_wrap_leaves_gap_out_of_average", "growth alone must not change the average");
  }

  ring.latch(50, 500);
  if (time_weighted_average(ring) != 400) {
    return fail("test_growth_after_wrap_leaves_gap_out_of_average", "expected 400 after first latch past growth");
  }

  ring.latch(60, 600);
  if (ring.write_index() != 3 || time_weighted_average(ring) != 500) {
    return fail("test_growth_after_wrap_leaves_gap_out_of_average", "empty cursor slot must not seed the window");
  }

  ring.latch(70, 700);
  if (time_weighted_average(ring) != 550) {
    return fail("test_growth_after_wrap_leaves_gap_out_of_average", "expected 550 with four samples");
  }

  ring.latch(80, 800);
  if (ring.write_index() != 0 || time_weighted_average(ring) != 600) {
    return fail("test_growth_after_wrap_leaves_gap_out_of_average", "expected 600 once the gap is filled");
  }
  return 0;
}

int test_non_monotonic_timestamps_fail() {
  SnapshotRing ring;
  ring.latch(20, 100);
  ring.latch(10, 200);
  if (!throws_kind([&ring] { (void)time_weighted_average(ring); }, error_kind::NON_MONOTONIC_SAMPLES)) {
    return fail("test_non_monotonic_timestamps_fail", "timestamps going backwards must fail");
  }
  return 0;
}

int test_restore_validates_shape() {
  std::vector<SnapshotRing::Slot> slots(4);
  slots[0] = snapshot{10, 100};
  slots[1] = snapshot{20, 300};

  const auto ring = SnapshotRing::restore(slots, 2);
  if (ring.capacity() != 4 || ring.write_index() != 2 || time_weighted_average(ring) != 200) {
    return fail("test_restore_validates_shape", "restored ring should match the persisted slots");
  }

  bool threw = false;
  try {
    (void)SnapshotRing::restore(slots, 4);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_restore_validates_shape", "cursor outside the slots must be rejected");
  }

  const std::vector<SnapshotRing::Slot> oversized(16);
  if (!throws_kind([&oversized] { (void)SnapshotRing::restore(oversized, 0); }, error_kind::CAPACITY_TOO_LARGE)) {
    return fail("test_restore_validates_shape", "more than 15 slots must be rejected");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_latch_advances_cursor_one_slot_at_a_time(); rc != 0) {
    return rc;
  }
  if (int rc = test_resize_only_grows(); rc != 0) {
    return rc;
  }
  if (int rc = test_resize_to_max_after_three_latches(); rc != 0) {
    return rc;
  }
  if (int rc = test_two_samples_yield_trapezoid_midpoint(); rc != 0) {
    return rc;
  }
  if (int rc = test_insufficient_samples(); rc != 0) {
    return rc;
  }
  if (int rc = test_full_cycle_from_time_zero(); rc != 0) {
    return rc;
  }
  if (int rc = test_uneven_intervals_are_time_weighted(); rc != 0) {
    return rc;
  }
  if (int rc = test_partially_filled_ring_skips_empty_anchor(); rc != 0) {
    return rc;
  }
  if (int rc = test_growth_after_wrap_leaves_gap_out_of_average(); rc != 0) {
    return rc;
  }
  if (int rc = test_non_monotonic_timestamps_fail(); rc != 0) {
    return rc;
  }
  if (int rc = test_restore_validates_shape(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] buffer unit tests\n";
  return 0;
}
