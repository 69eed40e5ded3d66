#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "engine/lending_pool.hpp"

class ThreadPool;

struct KeeperFailure {
  std::uint64_t loan_id = 0;
  std::string error;
};

struct KeeperReport {
  size_t candidates = 0;
  std::vector<LiquidationReceipt> liquidations;
  std::vector<KeeperFailure> failures;
};

// Scans for unhealthy loans and liquidates them on a worker pool, repaying
// close_factor_bps of each loan's current debt per pass. Losing a race against
// another liquidator shows up as a failure (NotLiquidatable or LoanNotActive).
class LiquidationKeeper {
public:
  LiquidationKeeper(LendingPool& pool, ThreadPool& workers, const std::string& account, std::uint32_t close_factor_bps);
  // Blocks until every submitted liquidation has finished. Receipts and
  // failures are reported in loan id order.
  KeeperReport RunOnce();
private:
  LiquidationReceipt LiquidateOne(std::uint64_t loan_id);
  LendingPool& pool_;
  ThreadPool& workers_;
  std::string account_;
  std::uint32_t close_factor_bps_;
};
