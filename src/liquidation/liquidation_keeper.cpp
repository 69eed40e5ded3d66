#include "liquidation/liquidation_keeper.hpp"
#include "scheduler/thread_pool.hpp"
#include "common/lending_error.hpp"
#include "common/logger.hpp"
#include <future>
#include <utility>

LiquidationKeeper::LiquidationKeeper(LendingPool& pool, ThreadPool& workers, const std::string& account,
                                     std::uint32_t close_factor_bps)
  : pool_(pool), workers_(workers), account_(account), close_factor_bps_(close_factor_bps) {
  if (close_factor_bps_ == 0 || close_factor_bps_ > FixedPoint::BPS_DENOMINATOR) {
    throw LendingError(LendingErrc::InvalidParameter, "close factor must lie in (0, 10000] bps");
  }
}

KeeperReport LiquidationKeeper::RunOnce() {
  KeeperReport report;
  const std::vector<std::uint64_t> ids = pool_.GetLiquidatableLoans();
  report.candidates = ids.size();

  std::vector<std::pair<std::uint64_t, std::future<LiquidationReceipt>>> pending;
  pending.reserve(ids.size());
  for (std::uint64_t id : ids) {
    pending.emplace_back(id, workers_.Submit([this, id]{ return LiquidateOne(id); }));
  }
  for (auto& p : pending) {
    try {
      report.liquidations.push_back(p.second.get());
    } catch (const std::exception& e) {
      Logger::Warning("Keeper could not liquidate loan " + std::to_string(p.first) + ": " + e.what());
      report.failures.push_back(KeeperFailure{p.first, e.what()});
    }
  }
  if (!ids.empty()) {
    Logger::Info("Keeper pass: " + std::to_string(report.liquidations.size()) + " liquidated, " +
                 std::to_string(report.failures.size()) + " failed of " + std::to_string(ids.size()));
  }
  return report;
}

LiquidationReceipt LiquidationKeeper::LiquidateOne(std::uint64_t loan_id) {
  const Amount debt = pool_.GetLoanInfo(loan_id).TotalDebt();
  Amount repay = FixedPoint::MulDivUp(debt, close_factor_bps_, FixedPoint::BPS_DENOMINATOR);
  if (repay == 0) repay = debt;
  return pool_.Liquidate(account_, loan_id, repay);
}
