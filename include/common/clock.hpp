#pragma once
#include <atomic>
#include <cstdint>

// Seconds since the unix epoch. Accrual reads time only through this.
class Clock {
public:
  virtual ~Clock() = default;
  virtual std::uint64_t Now() const = 0;
};

class SystemClock : public Clock {
public:
  std::uint64_t Now() const override;
};

// Time that only moves when told to. Used by tests and journal replay.
class ManualClock : public Clock {
public:
  explicit ManualClock(std::uint64_t start = 0) : now_(start) {}
  std::uint64_t Now() const override { return now_.load(); }
  void Set(std::uint64_t t) { now_.store(t); }
  void Advance(std::uint64_t seconds) { now_.fetch_add(seconds); }
private:
  std::atomic<std::uint64_t> now_;
};
