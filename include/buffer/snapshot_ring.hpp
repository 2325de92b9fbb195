#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include "model/snapshot.hpp"

namespace yield_oracle::buffer {

// Fixed-capacity circular buffer of rate snapshots. write_index() always names
// the oldest slot, i.e. the next one latch() overwrites. Capacity only grows;
// growth appends empty slots after the current last slot and leaves the cursor
// and every written slot where it is.
class SnapshotRing {
 public:
  using Slot = std::optional<model::snapshot>;

  static constexpr std::size_t kDefaultCapacity = 5;
  static constexpr std::size_t kMaxCapacity = 15;

  explicit SnapshotRing(std::size_t capacity = kDefaultCapacity);

  // Rebuilds a ring from persisted slots. Throws core::OracleError when there
  // are more than kMaxCapacity slots and std::invalid_argument on an empty
  // slot list or a cursor outside it.
  static SnapshotRing restore(const std::vector<Slot>& slots, std::size_t write_index);

  model::snapshot latch(model::timestamp_t now, model::rate_t rate) noexcept;

  // Returns the effective capacity. Shrink requests are ignored.
  std::size_t resize(std::size_t new_capacity);

  [[nodiscard]] std::size_t capacity() const noexcept;
  [[nodiscard]] std::size_t write_index() const noexcept;
  [[nodiscard]] std::size_t populated() const noexcept;
  [[nodiscard]] const Slot& slot(std::size_t index) const;
  [[nodiscard]] std::vector<Slot> slots() const;

  // Visits populated snapshots oldest to newest: the forward run from the
  // cursor to the end, then the wrapped run from slot 0 up to the cursor. Each
  // run stops at its first empty slot, so the empty tail of a ring that never
  // filled, or the gap left by growing a wrapped ring, is never visited.
  template <typename Visitor>
  void visit_chronological(Visitor&& visit) const {
    for (std::size_t i = write_index_; i < capacity_; ++i) {
      if (!slots_[i].has_value()) {
        break;
      }
      visit(*slots_[i]);
    }
    for (std::size_t i = 0; i < write_index_; ++i) {
      if (!slots_[i].has_value()) {
        break;
      }
      visit(*slots_[i]);
    }
  }

 private:
  std::array<Slot, kMaxCapacity> slots_{};
  std::size_t capacity_{kDefaultCapacity};
  std::size_t write_index_{0};
};

}  // namespace yield_oracle::buffer
