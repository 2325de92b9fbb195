#include "buffer/snapshot_ring.hpp"

#include <stdexcept>
#include <string>

#include "core/errors.hpp"

namespace yield_oracle::buffer {
namespace {

void check_capacity(const std::size_t capacity) {
  if (capacity > SnapshotRing::kMaxCapacity) {
    throw core::OracleError(core::error_kind::CAPACITY_TOO_LARGE,
                            "capacity " + std::to_string(capacity) + " exceeds " +
                                std::to_string(SnapshotRing::kMaxCapacity));
  }
}

}  // namespace

SnapshotRing::SnapshotRing(const std::size_t capacity) : capacity_(capacity) {
  check_capacity(capacity);
  if (capacity == 0) {
    throw std::invalid_argument("snapshot ring capacity must be at least 1");
  }
}

SnapshotRing SnapshotRing::restore(const std::vector<Slot>& slots, const std::size_t write_index) {
  SnapshotRing ring(slots.size());
  if (write_index >= slots.size()) {
    throw std::invalid_argument("snapshot ring write index " + std::to_string(write_index) +
                                " outside capacity " + std::to_string(slots.size()));
  }
  for (std::size_t i = 0; i < slots.size(); ++i) {
    ring.slots_[i] = slots[i];
  }
  ring.write_index_ = write_index;
  return ring;
}

model::snapshot SnapshotRing::latch(const model::timestamp_t now, const model::rate_t rate) noexcept {
  const model::snapshot written{now, rate};
  slots_[write_index_] = written;
  write_index_ = (write_index_ + 1) % capacity_;
  return written;
}

std::size_t SnapshotRing::resize(const std::size_t new_capacity) {
  check_capacity(new_capacity);
  if (new_capacity <= capacity_) {
    return capacity_;
  }
  // Slots past the old capacity were never written, so they are already empty.
  capacity_ = new_capacity;
  return capacity_;
}

std::size_t SnapshotRing::capacity() const noexcept { return capacity_; }

std::size_t SnapshotRing::write_index() const noexcept { return write_index_; }

std::size_t SnapshotRing::populated() const noexcept {
  std::size_t count = 0;
  for (std::size_t i = 0; i < capacity_; ++i) {
    if (slots_[i].has_value()) {
      ++count;
    }
  }
  return count;
}

const SnapshotRing::Slot& SnapshotRing::slot(const std::size_t index) const {
  if (index >= capacity_) {
    throw std::out_of_range("snapshot ring slot " + std::to_string(index) + " outside capacity " +
                            std::to_string(capacity_));
  }
  return slots_[index];
}

std::vector<SnapshotRing::Slot> SnapshotRing::slots() const {
  return std::vector<Slot>(slots_.begin(), slots_.begin() + static_cast<std::ptrdiff_t>(capacity_));
}

}  // namespace yield_oracle::buffer
