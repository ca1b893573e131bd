#pragma once
#include "pulsecast/timing/ITimeSource.hpp"
#include <chrono>
#include <memory>

namespace pulsecast::timing {

class SystemTimeSource : public ITimeSource {
public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }

  static std::shared_ptr<ITimeSource> Shared() {
    static std::shared_ptr<ITimeSource> instance = std::make_shared<SystemTimeSource>();
    return instance;
  }
};

}  // namespace pulsecast::timing
