#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace yield_oracle::model {

// Supply rate, unsigned fixed point with 18 decimals.
using rate_t = std::uint64_t;
// Unix seconds.
using timestamp_t = std::uint64_t;

struct snapshot {
    timestamp_t timestamp{0};
    rate_t rate{0};
};

inline bool operator==(const snapshot& lhs, const snapshot& rhs) noexcept {
    return lhs.timestamp == rhs.timestamp && lhs.rate == rhs.rate;
}

inline bool operator!=(const snapshot& lhs, const snapshot& rhs) noexcept { return !(lhs == rhs); }

enum class event_kind : std::uint8_t {
    RATE_SOURCE_BOUND = 0,
    CAPACITY_CHANGED = 1,
    SNAPSHOT_LATCHED = 2,
};

struct oracle_event {
    event_kind kind{event_kind::SNAPSHOT_LATCHED};
    std::string asset{};
    std::string rate_source{};
    std::size_t capacity{0};
    snapshot latched{};
    // Yield over the window right after the latch; empty while the window is too short.
    std::optional<rate_t> yield{};
};

const char* to_string(event_kind kind) noexcept;

}  // namespace yield_oracle::model
