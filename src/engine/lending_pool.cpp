#include "engine/lending_pool.hpp"
#include "common/clock.hpp"
#include "common/lending_error.hpp"
#include "common/logger.hpp"
#include "math/valuation.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

using namespace FixedPoint;

namespace {

// Runs one public operation. Rejections are logged at WARNING and rethrown;
// checked-arithmetic failures become AccountingInvariant. Both escape before
// anything was committed.
template <typename F>
auto Guarded(const char* op, F&& body) -> decltype(body()) {
  try {
    return body();
  } catch (const LendingError& e) {
    Logger::Warning(std::string(op) + " rejected: " + e.what());
    throw;
  } catch (const std::overflow_error& e) {
    Logger::Error(std::string(op) + " aborted on arithmetic overflow: " + e.what());
    throw LendingError(LendingErrc::AccountingInvariant, std::string(op) + ": arithmetic overflow");
  } catch (const std::range_error& e) {
    Logger::Error(std::string(op) + " aborted on arithmetic underflow: " + e.what());
    throw LendingError(LendingErrc::AccountingInvariant, std::string(op) + ": arithmetic underflow");
  }
}

// Accrued copies of every pool an operation touches. A loan whose collateral
// and borrow asset are the same works on a single copy.
class StagedPools {
public:
  StagedPools(PoolLedger& ledger, std::uint64_t now) : ledger_(ledger), now_(now) {}

  Pool& Get(const std::string& asset) {
    auto it = pools_.find(asset);
    if (it != pools_.end()) return it->second;
    Pool p = ledger_.Snapshot(asset);
    ledger_.Accrue(p, now_);
    return pools_.emplace(asset, std::move(p)).first->second;
  }

  void CheckAll() const {
    for (const auto& kv : pools_) PoolLedger::CheckSolvent(kv.second);
  }

  void CommitAll() {
    for (const auto& kv : pools_) ledger_.Commit(kv.second);
  }

private:
  PoolLedger& ledger_;
  std::uint64_t now_;
  std::map<std::string, Pool> pools_;
};

void RequireAccount(const std::string& account) {
  if (account.empty()) throw LendingError(LendingErrc::InvalidParameter, "account name is empty");
}

}

void ProtocolParams::Validate() const {
  auto check_bps = [](std::uint64_t v, const char* name) {
    if (v > BPS_DENOMINATOR) {
      throw LendingError(LendingErrc::InvalidParameter, std::string(name) + " must be at most 10000 bps");
    }
  };
  if (max_utilization_bps == 0) throw LendingError(LendingErrc::InvalidParameter, "max utilization must be positive");
  check_bps(max_utilization_bps, "max utilization");
  check_bps(max_collateral_factor_bps, "max collateral factor");
  check_bps(max_liquidation_bonus_bps, "max liquidation bonus");
  check_bps(default_liquidation_threshold_bps, "default liquidation threshold");
  check_bps(price_guard.min_confidence_bps, "min confidence");
  if (min_loan_amount == 0) throw LendingError(LendingErrc::InvalidParameter, "minimum loan amount must be positive");
}

bool Receipt::AllDelivered() const {
  return std::all_of(notifications.begin(), notifications.end(),
                     [](const NotifyResult& r) { return r.delivered; });
}

LendingPool::LendingPool(const Clock& clock, PriceFeed& prices, const AccessGate& gate,
                         const ProtocolParams& params, const InterestRateCurve& curve)
  : clock_(clock), prices_(prices), gate_(gate), params_(params), ledger_(curve) {
  params_.Validate();
}

void LendingPool::AddNotifier(ActivityNotifier& notifier) {
  std::lock_guard<std::mutex> lock(notifier_mu_);
  notifiers_.push_back(&notifier);
}

void LendingPool::RequireRunning() const {
  if (paused_) throw LendingError(LendingErrc::ProtocolPaused, "protocol is paused");
}

void LendingPool::RequireRole(const std::string& caller, AdminAction action) const {
  if (!gate_.Authorize(caller, action)) {
    throw LendingError(LendingErrc::Unauthorized, caller + " may not " + ToString(action));
  }
}

void LendingPool::ValidateRisk(const PoolRiskParams& risk) const {
  if (risk.collateral_factor_bps > params_.max_collateral_factor_bps) {
    throw LendingError(LendingErrc::InvalidParameter,
      "collateral factor " + std::to_string(risk.collateral_factor_bps) + " bps exceeds the maximum of " +
      std::to_string(params_.max_collateral_factor_bps));
  }
  if (risk.liquidation_bonus_bps > params_.max_liquidation_bonus_bps) {
    throw LendingError(LendingErrc::InvalidParameter,
      "liquidation bonus " + std::to_string(risk.liquidation_bonus_bps) + " bps exceeds the maximum of " +
      std::to_string(params_.max_liquidation_bonus_bps));
  }
  if (risk.liquidation_threshold_bps < risk.collateral_factor_bps || risk.liquidation_threshold_bps > BPS_DENOMINATOR) {
    throw LendingError(LendingErrc::InvalidParameter,
      "liquidation threshold must lie between the collateral factor and 10000 bps");
  }
}

Amount LendingPool::Price(const std::string& asset, std::uint64_t now) const {
  return FetchValidatedPrice(prices_, asset, now, params_.price_guard);
}

Pool LendingPool::ProjectedPool(const std::string& asset, std::uint64_t now) const {
  Pool p = ledger_.Snapshot(asset);
  ledger_.Accrue(p, now);
  return p;
}

Loan LendingPool::ProjectedLoan(std::uint64_t loan_id, std::uint64_t now) const {
  Loan loan = loans_.Snapshot(loan_id);
  LoanRegistry::Accrue(loan, now);
  return loan;
}

std::vector<NotifyResult> LendingPool::Publish(const ActivityEvent& event) {
  std::vector<ActivityNotifier*> targets;
  {
    std::lock_guard<std::mutex> lock(notifier_mu_);
    targets = notifiers_;
  }
  std::vector<NotifyResult> results;
  results.reserve(targets.size());
  for (ActivityNotifier* n : targets) {
    NotifyResult r;
    try {
      r = n->Notify(event);
    } catch (const std::exception& e) {
      r = NotifyResult::Failed(n->Name(), e.what());
    }
    if (!r.delivered) {
      Logger::Error("Notifier " + r.notifier + " failed on " + ToString(event.kind) + ": " + r.error);
    }
    results.push_back(std::move(r));
  }
  return results;
}

BalanceReceipt LendingPool::Deposit(const std::string& user, const std::string& asset, const Amount& amount) {
  BalanceReceipt receipt;
  ActivityEvent event;
  Guarded("deposit", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRunning();
    RequireAccount(user);
    const std::uint64_t now = clock_.Now();
    receipt.balance = ledger_.Deposit(asset, user, amount, now);
    receipt.asset = asset;
    receipt.pool = ledger_.Snapshot(asset);
    event.kind = ActivityKind::Deposit;
    event.timestamp = now;
    Logger::Info("Deposit " + FormatDecimal(amount) + " " + asset + " by " + user);
  });
  event.account = user;
  event.asset = asset;
  event.amount = amount;
  receipt.notifications = Publish(event);
  return receipt;
}

BalanceReceipt LendingPool::Withdraw(const std::string& user, const std::string& asset, const Amount& amount) {
  BalanceReceipt receipt;
  ActivityEvent event;
  Guarded("withdraw", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRunning();
    const std::uint64_t now = clock_.Now();
    receipt.balance = ledger_.Withdraw(asset, user, amount, now);
    receipt.asset = asset;
    receipt.pool = ledger_.Snapshot(asset);
    event.kind = ActivityKind::Withdraw;
    event.timestamp = now;
    Logger::Info("Withdraw " + FormatDecimal(amount) + " " + asset + " by " + user);
  });
  event.account = user;
  event.asset = asset;
  event.amount = amount;
  receipt.notifications = Publish(event);
  return receipt;
}

BorrowReceipt LendingPool::Borrow(const std::string& borrower,
                                  const std::string& collateral_asset,
                                  const std::string& borrow_asset,
                                  const Amount& collateral_amount,
                                  const Amount& borrow_amount) {
  BorrowReceipt receipt;
  ActivityEvent event;
  Guarded("borrow", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRunning();
    RequireAccount(borrower);
    if (collateral_amount == 0) throw LendingError(LendingErrc::ZeroAmount, "collateral amount is zero");
    if (borrow_amount == 0) throw LendingError(LendingErrc::ZeroAmount, "borrow amount is zero");
    if (borrow_amount < params_.min_loan_amount) {
      throw LendingError(LendingErrc::LoanTooSmall,
        "minimum loan is " + FormatDecimal(params_.min_loan_amount) + " " + borrow_asset);
    }
    const std::uint64_t now = clock_.Now();
    StagedPools staged(ledger_, now);
    Pool& collateral = staged.Get(collateral_asset);
    Pool& debt = staged.Get(borrow_asset);
    if (!collateral.is_active) throw LendingError(LendingErrc::PoolInactive, collateral_asset + " pool is inactive");
    if (!debt.is_active) throw LendingError(LendingErrc::PoolInactive, borrow_asset + " pool is inactive");
    if (!debt.borrowing_enabled) throw LendingError(LendingErrc::BorrowingDisabled, "borrowing is disabled for " + borrow_asset);

    // The loan's fixed rate is the pool rate before this loan is added.
    const std::uint32_t rate_bps = ledger_.ModelFor(debt).BorrowRateBps(debt.total_borrows, debt.total_deposits);

    const Amount collateral_price = Price(collateral_asset, now);
    const Amount borrow_price = Price(borrow_asset, now);
    const Amount collateral_usd = Valuation::UsdValue(collateral_amount, collateral_price);
    const Amount borrow_usd = Valuation::UsdValue(borrow_amount, borrow_price);
    if (collateral_usd * collateral.risk.collateral_factor_bps < borrow_usd * BPS_DENOMINATOR) {
      throw LendingError(LendingErrc::InsufficientCollateral,
        "collateral worth " + FormatDecimal(collateral_usd) + " USD at " +
        std::to_string(collateral.risk.collateral_factor_bps) + " bps cannot back " +
        FormatDecimal(borrow_usd) + " USD");
    }
    const Amount available = PoolLedger::AvailableLiquidity(debt);
    if (borrow_amount > available) {
      throw LendingError(LendingErrc::InsufficientLiquidity,
        "only " + FormatDecimal(available) + " " + borrow_asset + " can be borrowed");
    }
    const Amount borrows_after = debt.total_borrows + borrow_amount;
    if (borrows_after * BPS_DENOMINATOR > debt.total_deposits * params_.max_utilization_bps) {
      throw LendingError(LendingErrc::UtilizationLimitExceeded,
        borrow_asset + " utilization would exceed " + std::to_string(params_.max_utilization_bps) + " bps");
    }
    debt.total_borrows = borrows_after;
    staged.CheckAll();

    receipt.loan = loans_.Open(borrower, collateral_asset, borrow_asset, collateral_amount, borrow_amount,
                               rate_bps, collateral.risk.liquidation_threshold_bps, now);
    staged.CommitAll();
    event.kind = ActivityKind::Borrow;
    event.timestamp = now;
    Logger::Info("Loan " + std::to_string(receipt.loan.id) + " opened: " + borrower + " borrowed " +
                 FormatDecimal(borrow_amount) + " " + borrow_asset + " against " +
                 FormatDecimal(collateral_amount) + " " + collateral_asset + " at " + std::to_string(rate_bps) + " bps");
  });
  event.account = borrower;
  event.asset = borrow_asset;
  event.amount = borrow_amount;
  event.loan_id = receipt.loan.id;
  event.collateral_asset = collateral_asset;
  event.collateral_amount = collateral_amount;
  receipt.notifications = Publish(event);
  return receipt;
}

RepayReceipt LendingPool::Repay(const std::string& caller, std::uint64_t loan_id, const Amount& amount) {
  RepayReceipt receipt;
  ActivityEvent event;
  Guarded("repay", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRunning();
    if (amount == 0) throw LendingError(LendingErrc::ZeroAmount, "repay amount is zero");
    Loan loan = loans_.Snapshot(loan_id);
    if (!loan.IsActive()) {
      throw LendingError(LendingErrc::LoanNotActive, "loan " + std::to_string(loan_id) + " is " + ToString(loan.status));
    }
    if (caller != loan.borrower) {
      throw LendingError(LendingErrc::Unauthorized, caller + " is not the borrower of loan " + std::to_string(loan_id));
    }
    const std::uint64_t now = clock_.Now();
    StagedPools staged(ledger_, now);
    Pool& debt = staged.Get(loan.borrow_asset);
    LoanRegistry::Accrue(loan, now);

    receipt.amount_applied = Min(amount, loan.TotalDebt());
    receipt.split = LoanRegistry::ApplyPayment(loan, receipt.amount_applied);
    PoolLedger::ReleaseBorrows(debt, receipt.split.principal_paid);
    if (loan.TotalDebt() == 0) {
      receipt.collateral_released = loan.collateral_amount;
      loan.collateral_returned += loan.collateral_amount;
      loan.collateral_amount = 0;
      LoanRegistry::Close(loan, LoanStatus::Repaid, now);
    }
    staged.CheckAll();
    loans_.Commit(loan);
    staged.CommitAll();
    receipt.loan = loan;
    event.kind = ActivityKind::Repay;
    event.timestamp = now;
    Logger::Info("Loan " + std::to_string(loan_id) + " repaid " + FormatDecimal(receipt.amount_applied) + " " +
                 loan.borrow_asset + " (interest " + FormatDecimal(receipt.split.interest_paid) +
                 ", principal " + FormatDecimal(receipt.split.principal_paid) + ")" +
                 (loan.IsActive() ? "" : ", closed"));
  });
  event.account = caller;
  event.asset = receipt.loan.borrow_asset;
  event.amount = receipt.amount_applied;
  event.loan_id = loan_id;
  event.collateral_asset = receipt.loan.collateral_asset;
  event.collateral_amount = receipt.collateral_released;
  event.interest_paid = receipt.split.interest_paid;
  event.principal_paid = receipt.split.principal_paid;
  event.closed = !receipt.loan.IsActive();
  receipt.notifications = Publish(event);
  return receipt;
}

LiquidationReceipt LendingPool::Liquidate(const std::string& liquidator, std::uint64_t loan_id, const Amount& repay_amount) {
  LiquidationReceipt receipt;
  ActivityEvent event;
  Guarded("liquidate", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRunning();
    RequireAccount(liquidator);
    if (repay_amount == 0) throw LendingError(LendingErrc::ZeroAmount, "repay amount is zero");
    Loan loan = loans_.Snapshot(loan_id);
    if (!loan.IsActive()) {
      throw LendingError(LendingErrc::LoanNotActive, "loan " + std::to_string(loan_id) + " is " + ToString(loan.status));
    }
    const std::uint64_t now = clock_.Now();
    StagedPools staged(ledger_, now);
    Pool& debt = staged.Get(loan.borrow_asset);
    const Pool& collateral = staged.Get(loan.collateral_asset);
    LoanRegistry::Accrue(loan, now);

    const Amount collateral_price = Price(loan.collateral_asset, now);
    const Amount borrow_price = Price(loan.borrow_asset, now);
    receipt.health_before = LiquidationEngine::Assess(loan, collateral_price, borrow_price);
    if (!receipt.health_before.liquidatable) {
      throw LendingError(LendingErrc::NotLiquidatable,
        "loan " + std::to_string(loan_id) + " health factor is " + FormatDecimal(receipt.health_before.health_factor));
    }
    const Amount repay = Min(repay_amount, loan.TotalDebt());
    receipt.plan = LiquidationEngine::PlanSeizure(repay, borrow_price, collateral_price,
                                                  collateral.risk.liquidation_bonus_bps, loan.collateral_amount);
    receipt.outcome = LiquidationEngine::Apply(loan, debt, receipt.plan, now);
    staged.CheckAll();
    loans_.Commit(loan);
    staged.CommitAll();
    receipt.loan = loan;
    event.kind = ActivityKind::Liquidate;
    event.timestamp = now;
    Logger::Info("Loan " + std::to_string(loan_id) + " liquidated by " + liquidator + ": repaid " +
                 FormatDecimal(repay) + " " + loan.borrow_asset + ", seized " +
                 FormatDecimal(receipt.plan.total_seized) + " " + loan.collateral_asset +
                 (receipt.plan.capped ? " (capped)" : "") + (receipt.outcome.closed ? ", closed" : ""));
  });
  event.account = liquidator;
  event.asset = receipt.loan.borrow_asset;
  event.amount = receipt.plan.repay_amount;
  event.loan_id = loan_id;
  event.borrower = receipt.loan.borrower;
  event.collateral_asset = receipt.loan.collateral_asset;
  event.collateral_amount = receipt.plan.total_seized;
  event.interest_paid = receipt.outcome.split.interest_paid;
  event.principal_paid = receipt.outcome.split.principal_paid;
  event.bonus = receipt.plan.bonus;
  event.collateral_returned = receipt.outcome.collateral_to_borrower;
  event.health_factor = receipt.health_before.health_factor;
  event.capped = receipt.plan.capped;
  event.closed = receipt.outcome.closed;
  receipt.notifications = Publish(event);
  return receipt;
}

AccrualResult LendingPool::AccrueInterest(const std::string& asset) {
  return Guarded("accrue", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    return ledger_.AccruePool(asset, clock_.Now());
  });
}

void LendingPool::AddSupportedAsset(const std::string& caller, const std::string& asset,
                                    std::uint32_t collateral_factor_bps, std::uint32_t liquidation_bonus_bps,
                                    std::optional<std::uint32_t> liquidation_threshold_bps) {
  Guarded("add_asset", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::ListAsset);
    PoolRiskParams risk;
    risk.collateral_factor_bps = collateral_factor_bps;
    risk.liquidation_bonus_bps = liquidation_bonus_bps;
    risk.liquidation_threshold_bps = liquidation_threshold_bps.value_or(
      std::max(params_.default_liquidation_threshold_bps, collateral_factor_bps));
    ValidateRisk(risk);
    ledger_.ListAsset(asset, risk, clock_.Now());
    Logger::Info("Listed " + asset + " (cf " + std::to_string(risk.collateral_factor_bps) + ", bonus " +
                 std::to_string(risk.liquidation_bonus_bps) + ", threshold " +
                 std::to_string(risk.liquidation_threshold_bps) + ") by " + caller);
  });
}

void LendingPool::RemoveSupportedAsset(const std::string& caller, const std::string& asset) {
  Guarded("remove_asset", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::DelistAsset);
    Pool p = ProjectedPool(asset, clock_.Now());
    p.is_active = false;
    p.deposits_enabled = false;
    p.borrowing_enabled = false;
    p.delisted = true;
    ledger_.Commit(p);
    Logger::Info("Delisted " + asset + " by " + caller);
  });
}

void LendingPool::SetRiskParameters(const std::string& caller, const std::string& asset, const PoolRiskParams& risk) {
  Guarded("set_risk", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::SetRiskParameters);
    ValidateRisk(risk);
    Pool p = ProjectedPool(asset, clock_.Now());
    p.risk = risk;
    ledger_.Commit(p);
    Logger::Info("Risk parameters of " + asset + " set to cf " + std::to_string(risk.collateral_factor_bps) +
                 ", bonus " + std::to_string(risk.liquidation_bonus_bps) + ", threshold " +
                 std::to_string(risk.liquidation_threshold_bps) + " by " + caller);
  });
}

void LendingPool::SetPoolFlags(const std::string& caller, const std::string& asset, bool deposits_enabled, bool borrowing_enabled) {
  Guarded("set_pool_flags", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::SetPoolFlags);
    Pool p = ProjectedPool(asset, clock_.Now());
    if (p.delisted && (deposits_enabled || borrowing_enabled)) {
      throw LendingError(LendingErrc::InvalidParameter, asset + " is delisted");
    }
    p.deposits_enabled = deposits_enabled;
    p.borrowing_enabled = borrowing_enabled;
    ledger_.Commit(p);
    Logger::Info(asset + " deposits " + (deposits_enabled ? "on" : "off") + ", borrowing " +
                 (borrowing_enabled ? "on" : "off") + " by " + caller);
  });
}

void LendingPool::SetInterestCurve(const std::string& caller, const InterestRateCurve& curve) {
  Guarded("set_interest_curve", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::SetInterestCurve);
    curve.Validate();
    const std::uint64_t now = clock_.Now();
    // Interest up to now is owed at the old curve.
    std::vector<Pool> accrued;
    for (const auto& asset : ledger_.Assets()) accrued.push_back(ProjectedPool(asset, now));
    for (const auto& p : accrued) ledger_.Commit(p);
    ledger_.SetDefaultCurve(curve);
    Logger::Info("Protocol interest curve updated by " + caller);
  });
}

void LendingPool::SetPoolInterestCurve(const std::string& caller, const std::string& asset,
                                       const std::optional<InterestRateCurve>& curve) {
  Guarded("set_pool_interest_curve", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::SetInterestCurve);
    if (curve) curve->Validate();
    Pool p = ProjectedPool(asset, clock_.Now());
    p.curve_override = curve;
    ledger_.Commit(p);
    Logger::Info(asset + (curve ? " interest curve overridden by " : " interest curve reset by ") + caller);
  });
}

void LendingPool::PausePool(const std::string& caller, const std::string& asset) {
  Guarded("pause_pool", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::PausePool);
    Pool p = ProjectedPool(asset, clock_.Now());
    p.is_active = false;
    ledger_.Commit(p);
    Logger::Info(asset + " pool paused by " + caller);
  });
}

void LendingPool::UnpausePool(const std::string& caller, const std::string& asset) {
  Guarded("unpause_pool", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::PausePool);
    Pool p = ProjectedPool(asset, clock_.Now());
    if (p.delisted) throw LendingError(LendingErrc::InvalidParameter, asset + " is delisted");
    p.is_active = true;
    ledger_.Commit(p);
    Logger::Info(asset + " pool unpaused by " + caller);
  });
}

void LendingPool::Pause(const std::string& caller) {
  Guarded("pause", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::PauseProtocol);
    paused_ = true;
    Logger::Warning("Protocol paused by " + caller);
  });
}

void LendingPool::Unpause(const std::string& caller) {
  Guarded("unpause", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::PauseProtocol);
    paused_ = false;
    Logger::Info("Protocol unpaused by " + caller);
  });
}

void LendingPool::SetFeeRecipient(const std::string& caller, const std::string& recipient) {
  Guarded("set_fee_recipient", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::SetFeeRecipient);
    RequireAccount(recipient);
    fee_recipient_ = recipient;
    Logger::Info("Fee recipient set to " + recipient + " by " + caller);
  });
}

ReserveReceipt LendingPool::WithdrawReserves(const std::string& caller, const std::string& asset, const Amount& amount) {
  ReserveReceipt receipt;
  ActivityEvent event;
  Guarded("withdraw_reserves", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    RequireRole(caller, AdminAction::WithdrawReserves);
    if (fee_recipient_.empty()) throw LendingError(LendingErrc::InvalidParameter, "fee recipient is not set");
    const std::uint64_t now = clock_.Now();
    receipt.remaining_reserves = ledger_.WithdrawReserves(asset, amount, now);
    receipt.asset = asset;
    receipt.recipient = fee_recipient_;
    receipt.amount = amount;
    event.kind = ActivityKind::ReservesWithdrawn;
    event.timestamp = now;
    Logger::Info("Withdrew " + FormatDecimal(amount) + " " + asset + " reserves to " + fee_recipient_);
  });
  event.account = receipt.recipient;
  event.asset = asset;
  event.amount = amount;
  receipt.notifications = Publish(event);
  return receipt;
}

PoolInfo LendingPool::GetPoolInfo(const std::string& asset) const {
  return Guarded("pool_info", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    PoolInfo info;
    info.pool = ProjectedPool(asset, clock_.Now());
    const InterestRateModel model = ledger_.ModelFor(info.pool);
    const Pool& p = info.pool;
    info.curve = model.curve();
    info.available_liquidity = PoolLedger::AvailableLiquidity(p);
    info.utilization_bps = WadToBps(InterestRateModel::Utilization(p.total_borrows, p.total_deposits));
    info.borrow_apy_bps = model.BorrowRateBps(p.total_borrows, p.total_deposits);
    info.supply_apy_bps = model.SupplyRateBps(p.total_borrows, p.total_deposits);
    return info;
  });
}

Loan LendingPool::GetLoanInfo(std::uint64_t loan_id) const {
  return Guarded("loan_info", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    return ProjectedLoan(loan_id, clock_.Now());
  });
}

std::vector<std::uint64_t> LendingPool::GetUserLoans(const std::string& user) const {
  std::lock_guard<std::mutex> lock(mu_);
  return loans_.LoansOf(user);
}

Amount LendingPool::GetUserBalance(const std::string& user, const std::string& asset) const {
  std::lock_guard<std::mutex> lock(mu_);
  return ledger_.BalanceOf(user, asset);
}

HealthReport LendingPool::GetLoanHealthFactor(std::uint64_t loan_id) const {
  return Guarded("health_factor", [&] {
    std::lock_guard<std::mutex> lock(mu_);
    const std::uint64_t now = clock_.Now();
    const Loan loan = ProjectedLoan(loan_id, now);
    return LiquidationEngine::Assess(loan, Price(loan.collateral_asset, now), Price(loan.borrow_asset, now));
  });
}

std::uint32_t LendingPool::GetUtilizationRate(const std::string& asset) const {
  return GetPoolInfo(asset).utilization_bps;
}

std::uint32_t LendingPool::GetBorrowApy(const std::string& asset) const {
  return GetPoolInfo(asset).borrow_apy_bps;
}

std::uint32_t LendingPool::GetSupplyApy(const std::string& asset) const {
  return GetPoolInfo(asset).supply_apy_bps;
}

bool LendingPool::CanBorrow(const std::string& borrow_asset, const Amount& amount) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (paused_ || !ledger_.IsListed(borrow_asset)) return false;
  if (amount == 0 || amount < params_.min_loan_amount) return false;
  const Pool p = ProjectedPool(borrow_asset, clock_.Now());
  if (!p.is_active || !p.borrowing_enabled) return false;
  if (amount > PoolLedger::AvailableLiquidity(p)) return false;
  return (p.total_borrows + amount) * BPS_DENOMINATOR <= p.total_deposits * params_.max_utilization_bps;
}

std::vector<std::uint64_t> LendingPool::GetLiquidatableLoans() const {
  std::lock_guard<std::mutex> lock(mu_);
  const std::uint64_t now = clock_.Now();
  std::map<std::string, Amount> price_cache;
  auto price_of = [&](const std::string& asset) {
    auto it = price_cache.find(asset);
    if (it != price_cache.end()) return it->second;
    const Amount p = Price(asset, now);
    price_cache.emplace(asset, p);
    return p;
  };
  std::vector<std::uint64_t> out;
  for (std::uint64_t id : loans_.ActiveLoanIds()) {
    const Loan loan = ProjectedLoan(id, now);
    try {
      const Amount collateral_price = price_of(loan.collateral_asset);
      const Amount borrow_price = price_of(loan.borrow_asset);
      if (LiquidationEngine::Assess(loan, collateral_price, borrow_price).liquidatable) out.push_back(id);
    } catch (const LendingError& e) {
      Logger::Warning("Skipping loan " + std::to_string(id) + " in liquidation scan: " + e.what());
    }
  }
  return out;
}

std::vector<std::string> LendingPool::ListedAssets() const {
  std::lock_guard<std::mutex> lock(mu_);
  return ledger_.Assets();
}

std::uint64_t LendingPool::NextLoanId() const {
  std::lock_guard<std::mutex> lock(mu_);
  return loans_.NextLoanId();
}

bool LendingPool::IsPaused() const {
  std::lock_guard<std::mutex> lock(mu_);
  return paused_;
}

std::string LendingPool::FeeRecipient() const {
  std::lock_guard<std::mutex> lock(mu_);
  return fee_recipient_;
}

ProtocolParams LendingPool::Params() const {
  return params_;
}
