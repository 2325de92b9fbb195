#pragma once

#include "sinks/event_sink.hpp"

namespace yield_oracle::sinks {

class StdoutDebugSink final : public EventSink {
 public:
  const char* name() const noexcept override { return "stdout"; }
  bool publish(const model::oracle_event& event) override;
};

}  // namespace yield_oracle::sinks
