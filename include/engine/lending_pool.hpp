#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "math/fixed_point.hpp"
#include "pool/pool_ledger.hpp"
#include "loan/loan_registry.hpp"
#include "liquidation/liquidation_engine.hpp"
#include "oracle/price_feed.hpp"
#include "access/access_gate.hpp"
#include "notify/activity_notifier.hpp"

class Clock;

struct ProtocolParams {
  PriceGuardPolicy price_guard;
  Amount min_loan_amount = FixedPoint::Tokens(1);
  std::uint32_t max_utilization_bps = 9500;
  std::uint32_t max_collateral_factor_bps = 9000;
  std::uint32_t max_liquidation_bonus_bps = 2000;
  std::uint32_t default_liquidation_threshold_bps = 8500;

  // Throws LendingError(InvalidParameter).
  void Validate() const;
};

struct Receipt {
  std::vector<NotifyResult> notifications;
  bool AllDelivered() const;
};

struct BalanceReceipt : Receipt {
  std::string asset;
  Amount balance;   // user's balance after the operation
  Pool pool;
};

struct BorrowReceipt : Receipt {
  Loan loan;
};

struct RepayReceipt : Receipt {
  Loan loan;
  Amount amount_applied;        // requested amount capped to the debt
  PaymentSplit split;
  Amount collateral_released;
};

struct LiquidationReceipt : Receipt {
  Loan loan;
  HealthReport health_before;
  SeizurePlan plan;
  LiquidationOutcome outcome;
};

struct ReserveReceipt : Receipt {
  std::string asset;
  std::string recipient;
  Amount amount;
  Amount remaining_reserves;
};

struct PoolInfo {
  Pool pool;                     // projected to the current time
  InterestRateCurve curve;
  Amount available_liquidity;
  std::uint32_t utilization_bps = 0;
  std::uint32_t borrow_apy_bps = 0;
  std::uint32_t supply_apy_bps = 0;
};

// The protocol facade. Every public call takes one exclusive lock over all
// pools and loans, stages its changes on copies, and commits only after every
// check (price reads included) has passed. Notifications are delivered after
// the lock is released and reported back in the receipt.
//
// User mutations fail with ProtocolPaused while the protocol is paused;
// administrative calls and views keep working.
class LendingPool {
public:
  LendingPool(const Clock& clock, PriceFeed& prices, const AccessGate& gate,
              const ProtocolParams& params = ProtocolParams{},
              const InterestRateCurve& curve = InterestRateCurve{});

  // Not owned; must outlive the pool.
  void AddNotifier(ActivityNotifier& notifier);

  // User operations
  BalanceReceipt Deposit(const std::string& user, const std::string& asset, const Amount& amount);
  BalanceReceipt Withdraw(const std::string& user, const std::string& asset, const Amount& amount);
  BorrowReceipt Borrow(const std::string& borrower,
                       const std::string& collateral_asset,
                       const std::string& borrow_asset,
                       const Amount& collateral_amount,
                       const Amount& borrow_amount);
  RepayReceipt Repay(const std::string& caller, std::uint64_t loan_id, const Amount& amount);
  LiquidationReceipt Liquidate(const std::string& liquidator, std::uint64_t loan_id, const Amount& repay_amount);
  // Brings one pool's totals up to date without any other change.
  AccrualResult AccrueInterest(const std::string& asset);

  // Administration, each gated by AccessGate
  void AddSupportedAsset(const std::string& caller, const std::string& asset,
                         std::uint32_t collateral_factor_bps, std::uint32_t liquidation_bonus_bps,
                         std::optional<std::uint32_t> liquidation_threshold_bps = std::nullopt);
  void RemoveSupportedAsset(const std::string& caller, const std::string& asset);
  void SetRiskParameters(const std::string& caller, const std::string& asset, const PoolRiskParams& risk);
  void SetPoolFlags(const std::string& caller, const std::string& asset, bool deposits_enabled, bool borrowing_enabled);
  void SetInterestCurve(const std::string& caller, const InterestRateCurve& curve);
  // std::nullopt drops the override and returns the pool to the protocol curve.
  void SetPoolInterestCurve(const std::string& caller, const std::string& asset,
                            const std::optional<InterestRateCurve>& curve);
  void PausePool(const std::string& caller, const std::string& asset);
  void UnpausePool(const std::string& caller, const std::string& asset);
  void Pause(const std::string& caller);
  void Unpause(const std::string& caller);
  void SetFeeRecipient(const std::string& caller, const std::string& recipient);
  ReserveReceipt WithdrawReserves(const std::string& caller, const std::string& asset, const Amount& amount);

  // Views. None of them mutate; interest is projected to the current time.
  PoolInfo GetPoolInfo(const std::string& asset) const;
  Loan GetLoanInfo(std::uint64_t loan_id) const;
  std::vector<std::uint64_t> GetUserLoans(const std::string& user) const;
  Amount GetUserBalance(const std::string& user, const std::string& asset) const;
  HealthReport GetLoanHealthFactor(std::uint64_t loan_id) const;
  std::uint32_t GetUtilizationRate(const std::string& asset) const;
  std::uint32_t GetBorrowApy(const std::string& asset) const;
  std::uint32_t GetSupplyApy(const std::string& asset) const;
  // Whether a loan of `amount` could be funded right now; collateral is not considered.
  bool CanBorrow(const std::string& borrow_asset, const Amount& amount) const;
  // Active loans whose projected health factor is below 1 at current prices.
  std::vector<std::uint64_t> GetLiquidatableLoans() const;
  std::vector<std::string> ListedAssets() const;
  std::uint64_t NextLoanId() const;
  bool IsPaused() const;
  std::string FeeRecipient() const;
  ProtocolParams Params() const;

private:
  void RequireRunning() const;
  void RequireRole(const std::string& caller, AdminAction action) const;
  void ValidateRisk(const PoolRiskParams& risk) const;
  Amount Price(const std::string& asset, std::uint64_t now) const;
  Pool ProjectedPool(const std::string& asset, std::uint64_t now) const;
  Loan ProjectedLoan(std::uint64_t loan_id, std::uint64_t now) const;
  std::vector<NotifyResult> Publish(const ActivityEvent& event);

  const Clock& clock_;
  PriceFeed& prices_;
  const AccessGate& gate_;
  ProtocolParams params_;

  mutable std::mutex mu_;
  PoolLedger ledger_;
  LoanRegistry loans_;
  bool paused_ = false;
  std::string fee_recipient_;

  std::mutex notifier_mu_;
  std::vector<ActivityNotifier*> notifiers_;
};
