#include "pool/pool_ledger.hpp"
#include "common/lending_error.hpp"
#include "common/logger.hpp"

using namespace FixedPoint;

PoolLedger::PoolLedger(const InterestRateCurve& default_curve) : default_curve_(default_curve) {
  default_curve_.Validate();
}

void PoolLedger::ListAsset(const std::string& asset, const PoolRiskParams& risk, std::uint64_t now) {
  if (asset.empty()) throw LendingError(LendingErrc::InvalidParameter, "asset symbol is empty");
  if (pools_.count(asset)) throw LendingError(LendingErrc::AssetAlreadyListed, asset + " is already listed");
  Pool p;
  p.asset = asset;
  p.last_update_time = now;
  p.risk = risk;
  pools_.emplace(asset, p);
}

bool PoolLedger::IsListed(const std::string& asset) const {
  return pools_.count(asset) > 0;
}

std::vector<std::string> PoolLedger::Assets() const {
  std::vector<std::string> out;
  out.reserve(pools_.size());
  for (const auto& kv : pools_) out.push_back(kv.first);
  return out;
}

const Pool& PoolLedger::Find(const std::string& asset) const {
  auto it = pools_.find(asset);
  if (it == pools_.end()) throw LendingError(LendingErrc::AssetNotSupported, asset + " is not a listed asset");
  return it->second;
}

Pool PoolLedger::Snapshot(const std::string& asset) const {
  return Find(asset);
}

void PoolLedger::Commit(const Pool& pool) {
  auto it = pools_.find(pool.asset);
  if (it == pools_.end()) throw LendingError(LendingErrc::AssetNotSupported, pool.asset + " is not a listed asset");
  it->second = pool;
}

InterestRateModel PoolLedger::ModelFor(const Pool& pool) const {
  return InterestRateModel(pool.curve_override ? *pool.curve_override : default_curve_);
}

void PoolLedger::SetDefaultCurve(const InterestRateCurve& curve) {
  curve.Validate();
  default_curve_ = curve;
}

AccrualResult PoolLedger::Accrue(Pool& pool, std::uint64_t now) const {
  AccrualResult r;
  if (now <= pool.last_update_time) return r;
  r.elapsed = now - pool.last_update_time;
  if (pool.total_borrows > 0) {
    const InterestRateModel model = ModelFor(pool);
    r.borrow_rate = model.BorrowRate(pool.total_borrows, pool.total_deposits);
    r.interest = MulDiv(pool.total_borrows * r.borrow_rate, r.elapsed, Amount(SECONDS_PER_YEAR) * PRECISION);
    r.reserves = MulDiv(r.interest, model.curve().reserve_factor_bps, BPS_DENOMINATOR);
    pool.total_borrows += r.interest;
    pool.total_deposits += r.interest;
    pool.total_reserves += r.reserves;
  }
  pool.last_update_time = now;
  return r;
}

AccrualResult PoolLedger::AccruePool(const std::string& asset, std::uint64_t now) {
  Pool p = Snapshot(asset);
  AccrualResult r = Accrue(p, now);
  Commit(p);
  if (r.interest > 0) {
    Logger::Debug("Accrued " + FormatDecimal(r.interest) + " " + asset + " over " + std::to_string(r.elapsed) + "s");
  }
  return r;
}

Amount PoolLedger::Deposit(const std::string& asset, const std::string& user, const Amount& amount, std::uint64_t now) {
  if (amount == 0) throw LendingError(LendingErrc::ZeroAmount, "deposit amount is zero");
  Pool p = Snapshot(asset);
  if (!p.is_active) throw LendingError(LendingErrc::PoolInactive, asset + " pool is inactive");
  if (!p.deposits_enabled) throw LendingError(LendingErrc::DepositsDisabled, "deposits are disabled for " + asset);
  Accrue(p, now);
  const Amount balance = BalanceOf(user, asset) + amount;
  p.total_deposits += amount;
  CheckSolvent(p);
  Commit(p);
  balances_[asset][user] = balance;
  return balance;
}

Amount PoolLedger::Withdraw(const std::string& asset, const std::string& user, const Amount& amount, std::uint64_t now) {
  if (amount == 0) throw LendingError(LendingErrc::ZeroAmount, "withdraw amount is zero");
  Pool p = Snapshot(asset);
  const Amount balance = BalanceOf(user, asset);
  if (amount > balance) {
    throw LendingError(LendingErrc::InsufficientBalance,
      user + " holds " + FormatDecimal(balance) + " " + asset + ", requested " + FormatDecimal(amount));
  }
  Accrue(p, now);
  const Amount available = AvailableLiquidity(p);
  if (amount > available) {
    throw LendingError(LendingErrc::InsufficientLiquidity,
      "only " + FormatDecimal(available) + " " + asset + " available to withdraw");
  }
  p.total_deposits -= amount;
  CheckSolvent(p);
  const Amount remaining = balance - amount;
  Commit(p);
  if (remaining == 0) {
    balances_[asset].erase(user);
  } else {
    balances_[asset][user] = remaining;
  }
  return remaining;
}

Amount PoolLedger::WithdrawReserves(const std::string& asset, const Amount& amount, std::uint64_t now) {
  if (amount == 0) throw LendingError(LendingErrc::ZeroAmount, "reserve withdrawal is zero");
  Pool p = Snapshot(asset);
  Accrue(p, now);
  if (amount > p.total_reserves) {
    throw LendingError(LendingErrc::InsufficientBalance,
      asset + " reserves are " + FormatDecimal(p.total_reserves) + ", requested " + FormatDecimal(amount));
  }
  if (amount > AvailableLiquidity(p)) {
    throw LendingError(LendingErrc::InsufficientLiquidity, "not enough idle " + asset + " to pay out reserves");
  }
  p.total_reserves -= amount;
  p.total_deposits -= amount;
  CheckSolvent(p);
  Commit(p);
  return p.total_reserves;
}

Amount PoolLedger::BalanceOf(const std::string& user, const std::string& asset) const {
  auto a = balances_.find(asset);
  if (a == balances_.end()) return Amount(0);
  auto u = a->second.find(user);
  if (u == a->second.end()) return Amount(0);
  return u->second;
}

void PoolLedger::ReleaseBorrows(Pool& pool, const Amount& principal) {
  if (principal > pool.total_borrows) {
    throw LendingError(LendingErrc::AccountingInvariant,
      "repaid principal " + FormatDecimal(principal) + " exceeds " + pool.asset + " borrows " + FormatDecimal(pool.total_borrows));
  }
  pool.total_borrows -= principal;
}

Amount PoolLedger::AvailableLiquidity(const Pool& pool) {
  if (pool.total_borrows >= pool.total_deposits) return Amount(0);
  return pool.total_deposits - pool.total_borrows;
}

void PoolLedger::CheckSolvent(const Pool& pool) {
  if (pool.total_borrows > pool.total_deposits) {
    throw LendingError(LendingErrc::AccountingInvariant,
      pool.asset + " borrows " + FormatDecimal(pool.total_borrows) + " exceed deposits " + FormatDecimal(pool.total_deposits));
  }
}
