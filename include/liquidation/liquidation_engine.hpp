#pragma once
#include <cstdint>
#include "math/fixed_point.hpp"
#include "loan/loan_registry.hpp"
#include "pool/pool_ledger.hpp"

struct HealthReport {
  Amount collateral_value_usd;
  Amount debt_value_usd;
  Amount health_factor;   // 1e18 == 1.0; max value when there is no debt
  bool liquidatable = false;
};

struct SeizurePlan {
  Amount repay_amount;          // borrow-asset units, already capped to total debt
  Amount collateral_to_seize;   // collateral units matching repay_amount in value
  Amount bonus;                 // collateral units on top of collateral_to_seize
  Amount total_seized;          // collateral_to_seize + bonus, never above the loan's collateral
  bool capped = false;
};

struct LiquidationOutcome {
  PaymentSplit split;
  Amount collateral_to_liquidator;
  Amount collateral_to_borrower;
  bool closed = false;
};

// Solvency math. Prices passed in must already be validated; callers accrue the
// loan before asking.
class LiquidationEngine {
public:
  //   healthFactor = collateralUsd * thresholdBps / (debtUsd * 10000)
  // A loan is liquidatable iff debtUsd * 10000 > collateralUsd * thresholdBps.
  static HealthReport Assess(const Loan& loan, const Amount& collateral_price, const Amount& borrow_price);

  // Converts `repay_amount` of the borrow asset into collateral and adds the
  // bonus. When the total exceeds `available_collateral` the seizure is cut to
  // the available amount and split back into seize and bonus in the
  // 10000 : bonusBps ratio.
  static SeizurePlan PlanSeizure(const Amount& repay_amount,
                                 const Amount& borrow_price,
                                 const Amount& collateral_price,
                                 std::uint32_t liquidation_bonus_bps,
                                 const Amount& available_collateral);

  // Applies a plan to staged copies of the loan and its borrow pool. A plan
  // that repays the whole debt closes the loan as Liquidated and hands the
  // leftover collateral back to the borrower.
  static LiquidationOutcome Apply(Loan& loan, Pool& borrow_pool, const SeizurePlan& plan, std::uint64_t now);
};
