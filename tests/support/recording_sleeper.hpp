#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

#include "internal/poll/sleeper.hpp"

namespace devicefarm::testing {

// Returns immediately and records every requested wait.
class RecordingSleeper final : public poll::Sleeper {
 public:
  // SleepFor returns false on the call with this index (0-based).
  std::size_t interrupt_at = static_cast<std::size_t>(-1);

  std::vector<std::chrono::milliseconds> waits;

  bool SleepFor(std::chrono::milliseconds duration) override {
    const bool interrupted = waits.size() == interrupt_at;
    waits.push_back(duration);
    return !interrupted;
  }
};

} // namespace devicefarm::testing
