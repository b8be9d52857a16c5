#pragma once

#include <chrono>

namespace admapper::core {

// Monotonic time source for expiry decisions.
//
// Entry lifetimes are measured with `steady_clock` so wall-clock adjustments
// never shorten or extend a TTL. Tests substitute a manually advanced clock.
class IClock {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  virtual ~IClock() = default;

  virtual TimePoint Now() const = 0;
};

class SteadyClock final : public IClock {
public:
  TimePoint Now() const override {
    return std::chrono::steady_clock::now();
  }
};

} // namespace admapper::core
