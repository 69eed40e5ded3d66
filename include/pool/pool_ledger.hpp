#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "math/fixed_point.hpp"
#include "pool/interest_rate_model.hpp"

struct PoolRiskParams {
  std::uint32_t collateral_factor_bps = 7500;
  std::uint32_t liquidation_bonus_bps = 500;
  std::uint32_t liquidation_threshold_bps = 8500;
};

struct Pool {
  std::string asset;
  Amount total_deposits;
  Amount total_borrows;
  Amount total_reserves;
  std::uint64_t last_update_time = 0;
  bool is_active = true;
  bool borrowing_enabled = true;
  bool deposits_enabled = true;
  bool delisted = false;
  PoolRiskParams risk;
  std::optional<InterestRateCurve> curve_override;
};

struct AccrualResult {
  std::uint64_t elapsed = 0;
  Amount borrow_rate;   // annual, 1e18 scale; zero when nothing accrued
  Amount interest;
  Amount reserves;
};

// Owns every Pool record and every (user, asset) deposit balance.
//
// Not internally synchronized: LendingPool holds its lock around every call.
// Multi-pool operations work on Snapshot() copies and Commit() them only once
// all checks passed, so a thrown error leaves the ledger untouched.
class PoolLedger {
public:
  explicit PoolLedger(const InterestRateCurve& default_curve);

  void ListAsset(const std::string& asset, const PoolRiskParams& risk, std::uint64_t now);
  bool IsListed(const std::string& asset) const;
  std::vector<std::string> Assets() const;

  // Throws AssetNotSupported for unknown assets.
  Pool Snapshot(const std::string& asset) const;
  void Commit(const Pool& pool);

  InterestRateModel ModelFor(const Pool& pool) const;
  const InterestRateCurve& DefaultCurve() const { return default_curve_; }
  void SetDefaultCurve(const InterestRateCurve& curve);

  // Brings a staged pool up to `now`. Interest is added to total borrows and,
  // as the depositors' and protocol's claim on it, to total deposits; the
  // reserve-factor share is also booked into total reserves.
  AccrualResult Accrue(Pool& pool, std::uint64_t now) const;
  // Accrue + commit for a single pool.
  AccrualResult AccruePool(const std::string& asset, std::uint64_t now);

  // Both return the user's new balance.
  Amount Deposit(const std::string& asset, const std::string& user, const Amount& amount, std::uint64_t now);
  Amount Withdraw(const std::string& asset, const std::string& user, const Amount& amount, std::uint64_t now);
  // Moves reserves out of the pool; returns the remaining reserves.
  Amount WithdrawReserves(const std::string& asset, const Amount& amount, std::uint64_t now);

  Amount BalanceOf(const std::string& user, const std::string& asset) const;

  // Removes repaid principal from a staged pool's borrow total. Interest is
  // never passed here: it entered total borrows through accrual.
  static void ReleaseBorrows(Pool& pool, const Amount& principal);
  static Amount AvailableLiquidity(const Pool& pool);
  // Throws AccountingInvariant when total borrows exceed total deposits.
  static void CheckSolvent(const Pool& pool);

private:
  const Pool& Find(const std::string& asset) const;

  InterestRateCurve default_curve_;
  std::map<std::string, Pool> pools_;
  std::map<std::string, std::map<std::string, Amount>> balances_; // asset -> user -> amount
};
