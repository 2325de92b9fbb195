#pragma once

#include "model/snapshot.hpp"

namespace yield_oracle::sinks {

class EventSink {
 public:
  virtual const char* name() const noexcept = 0;
  virtual bool publish(const model::oracle_event& event) = 0;
  virtual ~EventSink() = default;
};

}  // namespace yield_oracle::sinks
