#include "sinks/stdout_debug.hpp"

#include <cstdio>
#include <string>

#include "core/fixed_point.hpp"

namespace yield_oracle::sinks {

bool StdoutDebugSink::publish(const model::oracle_event& event) {
  switch (event.kind) {
    case model::event_kind::RATE_SOURCE_BOUND:
      std::printf("[event] %s asset=%s source=%s\n", model::to_string(event.kind), event.asset.c_str(),
                  event.rate_source.c_str());
      break;
    case model::event_kind::CAPACITY_CHANGED:
      std::printf("[event] %s asset=%s capacity=%zu\n", model::to_string(event.kind), event.asset.c_str(),
                  event.capacity);
      break;
    case model::event_kind::SNAPSHOT_LATCHED: {
      const std::string rate = core::format_fixed(event.latched.rate);
      const std::string yield = event.yield.has_value() ? core::format_fixed(*event.yield) : std::string("n/a");
      std::printf("[event] %s asset=%s source=%s timestamp=%llu rate=%s apr_pct=%.4f yield=%s\n",
                  model::to_string(event.kind), event.asset.c_str(), event.rate_source.c_str(),
                  static_cast<unsigned long long>(event.latched.timestamp), rate.c_str(),
                  core::annualized_percent(event.latched.rate), yield.c_str());
      break;
    }
  }
  return std::fflush(stdout) == 0;
}

}  // namespace yield_oracle::sinks
