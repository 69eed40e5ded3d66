#include "common/clock.hpp"
#include <chrono>

std::uint64_t SystemClock::Now() const {
  return static_cast<std::uint64_t>(
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}
