#include "liquidation/liquidation_engine.hpp"
#include "math/valuation.hpp"
#include "common/lending_error.hpp"
#include <limits>

using namespace FixedPoint;

HealthReport LiquidationEngine::Assess(const Loan& loan, const Amount& collateral_price, const Amount& borrow_price) {
  HealthReport r;
  r.collateral_value_usd = Valuation::UsdValue(loan.collateral_amount, collateral_price);
  r.debt_value_usd = Valuation::UsdValue(loan.TotalDebt(), borrow_price);
  const Amount weighted_collateral = r.collateral_value_usd * loan.liquidation_threshold_bps;
  const Amount scaled_debt = r.debt_value_usd * BPS_DENOMINATOR;
  if (scaled_debt == 0) {
    r.health_factor = std::numeric_limits<Amount>::max();
    r.liquidatable = false;
    return r;
  }
  r.health_factor = MulDiv(weighted_collateral, PRECISION, scaled_debt);
  r.liquidatable = scaled_debt > weighted_collateral;
  return r;
}

SeizurePlan LiquidationEngine::PlanSeizure(const Amount& repay_amount,
                                           const Amount& borrow_price,
                                           const Amount& collateral_price,
                                           std::uint32_t liquidation_bonus_bps,
                                           const Amount& available_collateral) {
  SeizurePlan plan;
  plan.repay_amount = repay_amount;
  plan.collateral_to_seize = Valuation::Convert(repay_amount, borrow_price, collateral_price);
  plan.bonus = MulDiv(plan.collateral_to_seize, liquidation_bonus_bps, BPS_DENOMINATOR);
  plan.total_seized = plan.collateral_to_seize + plan.bonus;
  if (plan.total_seized > available_collateral) {
    plan.capped = true;
    plan.total_seized = available_collateral;
    plan.collateral_to_seize = MulDiv(plan.total_seized, BPS_DENOMINATOR, BPS_DENOMINATOR + liquidation_bonus_bps);
    plan.bonus = plan.total_seized - plan.collateral_to_seize;
  }
  return plan;
}

LiquidationOutcome LiquidationEngine::Apply(Loan& loan, Pool& borrow_pool, const SeizurePlan& plan, std::uint64_t now) {
  if (plan.total_seized > loan.collateral_amount) {
    throw LendingError(LendingErrc::AccountingInvariant,
      "seizure " + FormatDecimal(plan.total_seized) + " exceeds collateral " + FormatDecimal(loan.collateral_amount));
  }
  LiquidationOutcome out;
  const bool full = plan.repay_amount >= loan.TotalDebt();
  out.split = LoanRegistry::ApplyPayment(loan, plan.repay_amount);
  PoolLedger::ReleaseBorrows(borrow_pool, out.split.principal_paid);

  loan.collateral_amount -= plan.total_seized;
  loan.collateral_seized += plan.total_seized;
  out.collateral_to_liquidator = plan.total_seized;

  if (full) {
    out.collateral_to_borrower = loan.collateral_amount;
    loan.collateral_returned += loan.collateral_amount;
    loan.collateral_amount = 0;
    LoanRegistry::Close(loan, LoanStatus::Liquidated, now);
    out.closed = true;
  }
  return out;
}
