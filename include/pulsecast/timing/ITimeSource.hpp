#pragma once
#include <cstdint>

namespace pulsecast::timing {

// Wall-clock source for event timestamps (ms since the Unix epoch).
// Pacing never reads this; the player paces on steady_clock.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace pulsecast::timing
