#include "test_support.hpp"
#include "liquidation/liquidation_engine.hpp"
#include <limits>

namespace {

Loan MakeLoan(const Amount& collateral, const Amount& principal) {
  Loan l;
  l.id = 7;
  l.borrower = "bob";
  l.collateral_asset = "ETH";
  l.borrow_asset = "USDC";
  l.collateral_amount = collateral;
  l.principal = principal;
  l.liquidation_threshold_bps = 8500;
  l.start_time = kStart;
  l.last_accrual_time = kStart;
  return l;
}

Pool BorrowPool(const Amount& deposits, const Amount& borrows) {
  Pool p;
  p.asset = "USDC";
  p.total_deposits = deposits;
  p.total_borrows = borrows;
  return p;
}

}

BOOST_AUTO_TEST_SUITE(liquidation_engine)

BOOST_AUTO_TEST_CASE(health_factor_and_threshold) {
  const Loan loan = MakeLoan(Tok(1000), Tok(765));
  HealthReport h = LiquidationEngine::Assess(loan, Units("0.81"), Tok(1));
  BOOST_CHECK_EQUAL(h.collateral_value_usd, Tok(810));
  BOOST_CHECK_EQUAL(h.debt_value_usd, Tok(765));
  BOOST_CHECK_EQUAL(h.health_factor, Units("0.9"));
  BOOST_CHECK(h.liquidatable);

  // exactly 1.0 is still healthy
  h = LiquidationEngine::Assess(loan, Units("0.9"), Tok(1));
  BOOST_CHECK_EQUAL(h.health_factor, Tok(1));
  BOOST_CHECK(!h.liquidatable);
}

BOOST_AUTO_TEST_CASE(debt_free_loan_is_never_liquidatable) {
  const Loan loan = MakeLoan(Tok(1), Amount(0));
  const HealthReport h = LiquidationEngine::Assess(loan, Tok(1), Tok(1));
  BOOST_CHECK(!h.liquidatable);
  BOOST_CHECK_EQUAL(h.health_factor, std::numeric_limits<Amount>::max());
}

BOOST_AUTO_TEST_CASE(uncapped_seizure_adds_bonus) {
  const SeizurePlan plan = LiquidationEngine::PlanSeizure(Tok(100), Tok(1), Tok(2), 500, Tok(1000));
  BOOST_CHECK(!plan.capped);
  BOOST_CHECK_EQUAL(plan.collateral_to_seize, Tok(50));
  BOOST_CHECK_EQUAL(plan.bonus, Units("2.5"));
  BOOST_CHECK_EQUAL(plan.total_seized, Units("52.5"));
}

BOOST_AUTO_TEST_CASE(capped_seizure_keeps_bonus_ratio) {
  const SeizurePlan plan = LiquidationEngine::PlanSeizure(Tok(765), Tok(1), Units("0.81"), 1000, Tok(1000));
  BOOST_CHECK(plan.capped);
  BOOST_CHECK_EQUAL(plan.total_seized, Tok(1000));
  BOOST_CHECK_EQUAL(plan.collateral_to_seize, Amount("909090909090909090909"));
  BOOST_CHECK_EQUAL(plan.bonus, Amount("90909090909090909091"));
  BOOST_CHECK_EQUAL(plan.collateral_to_seize + plan.bonus, Tok(1000));
}

BOOST_AUTO_TEST_CASE(partial_liquidation_keeps_loan_open) {
  Loan loan = MakeLoan(Tok(1000), Tok(765));
  loan.accrued_interest = Tok(5);
  Pool pool = BorrowPool(Tok(2000), Tok(800));
  const SeizurePlan plan = LiquidationEngine::PlanSeizure(Tok(105), Tok(1), Tok(1), 500, loan.collateral_amount);
  const LiquidationOutcome out = LiquidationEngine::Apply(loan, pool, plan, kStart + 1);
  BOOST_CHECK(!out.closed);
  BOOST_CHECK_EQUAL(out.split.interest_paid, Tok(5));
  BOOST_CHECK_EQUAL(out.split.principal_paid, Tok(100));
  BOOST_CHECK_EQUAL(loan.principal, Tok(665));
  BOOST_CHECK_EQUAL(loan.collateral_amount, Tok(1000) - Units("110.25"));
  BOOST_CHECK_EQUAL(loan.collateral_seized, Units("110.25"));
  BOOST_CHECK_EQUAL(pool.total_borrows, Tok(700));
  BOOST_CHECK(loan.status == LoanStatus::Active);
}

BOOST_AUTO_TEST_CASE(full_liquidation_returns_remainder) {
  Loan loan = MakeLoan(Tok(1000), Tok(765));
  Pool pool = BorrowPool(Tok(2000), Tok(765));
  const SeizurePlan plan = LiquidationEngine::PlanSeizure(Tok(765), Tok(1), Tok(1), 500, loan.collateral_amount);
  const LiquidationOutcome out = LiquidationEngine::Apply(loan, pool, plan, kStart + 1);
  BOOST_CHECK(out.closed);
  BOOST_CHECK(loan.status == LoanStatus::Liquidated);
  BOOST_CHECK_EQUAL(out.collateral_to_liquidator, Units("803.25"));
  BOOST_CHECK_EQUAL(out.collateral_to_borrower, Units("196.75"));
  BOOST_CHECK_EQUAL(loan.collateral_amount, Amount(0));
  BOOST_CHECK_EQUAL(loan.collateral_returned, Units("196.75"));
  BOOST_CHECK_EQUAL(pool.total_borrows, Amount(0));
  BOOST_CHECK_EQUAL(loan.closed_time, kStart + 1);
}

BOOST_AUTO_TEST_CASE(plan_larger_than_collateral_is_refused) {
  Loan loan = MakeLoan(Tok(10), Tok(5));
  Pool pool = BorrowPool(Tok(100), Tok(5));
  SeizurePlan plan;
  plan.repay_amount = Tok(5);
  plan.total_seized = Tok(11);
  CHECK_LENDING_ERROR(LiquidationEngine::Apply(loan, pool, plan, kStart), LendingErrc::AccountingInvariant);
}

BOOST_AUTO_TEST_SUITE_END()
