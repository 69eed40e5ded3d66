#include "loan/loan_registry.hpp"
#include "common/lending_error.hpp"

using namespace FixedPoint;

const char* ToString(LoanStatus status) {
  switch (status) {
    case LoanStatus::Active: return "active";
    case LoanStatus::Repaid: return "repaid";
    case LoanStatus::Liquidated: return "liquidated";
    case LoanStatus::Defaulted: return "defaulted";
  }
  return "unknown";
}

Loan LoanRegistry::Open(const std::string& borrower,
                        const std::string& collateral_asset,
                        const std::string& borrow_asset,
                        const Amount& collateral_amount,
                        const Amount& principal,
                        std::uint32_t interest_rate_bps,
                        std::uint32_t liquidation_threshold_bps,
                        std::uint64_t now) {
  if (principal == 0) throw LendingError(LendingErrc::ZeroAmount, "loan principal is zero");
  Loan loan;
  loan.id = next_id_;
  loan.borrower = borrower;
  loan.collateral_asset = collateral_asset;
  loan.borrow_asset = borrow_asset;
  loan.collateral_amount = collateral_amount;
  loan.principal = principal;
  loan.interest_rate_bps = interest_rate_bps;
  loan.start_time = now;
  loan.last_accrual_time = now;
  loan.liquidation_threshold_bps = liquidation_threshold_bps;
  loans_.emplace(loan.id, loan);
  by_borrower_[borrower].push_back(loan.id);
  ++next_id_;
  return loan;
}

Loan LoanRegistry::Snapshot(std::uint64_t id) const {
  auto it = loans_.find(id);
  if (it == loans_.end()) throw LendingError(LendingErrc::LoanNotFound, "loan " + std::to_string(id) + " does not exist");
  return it->second;
}

void LoanRegistry::Commit(const Loan& loan) {
  auto it = loans_.find(loan.id);
  if (it == loans_.end()) throw LendingError(LendingErrc::LoanNotFound, "loan " + std::to_string(loan.id) + " does not exist");
  if (!it->second.IsActive()) {
    throw LendingError(LendingErrc::LoanNotActive, "loan " + std::to_string(loan.id) + " is " + ToString(it->second.status));
  }
  it->second = loan;
}

std::vector<std::uint64_t> LoanRegistry::LoansOf(const std::string& borrower) const {
  auto it = by_borrower_.find(borrower);
  if (it == by_borrower_.end()) return {};
  return it->second;
}

std::vector<std::uint64_t> LoanRegistry::ActiveLoanIds() const {
  std::vector<std::uint64_t> out;
  for (const auto& kv : loans_) {
    if (kv.second.IsActive()) out.push_back(kv.first);
  }
  return out;
}

Amount LoanRegistry::Accrue(Loan& loan, std::uint64_t now) {
  if (!loan.IsActive() || now <= loan.last_accrual_time) return Amount(0);
  const std::uint64_t elapsed = now - loan.last_accrual_time;
  const Amount interest = MulDiv(loan.principal * loan.interest_rate_bps, elapsed,
                                 Amount(BPS_DENOMINATOR) * SECONDS_PER_YEAR);
  loan.accrued_interest += interest;
  loan.last_accrual_time = now;
  return interest;
}

PaymentSplit LoanRegistry::ApplyPayment(Loan& loan, const Amount& amount) {
  if (amount == 0) throw LendingError(LendingErrc::ZeroAmount, "payment amount is zero");
  if (!loan.IsActive()) {
    throw LendingError(LendingErrc::LoanNotActive, "loan " + std::to_string(loan.id) + " is " + ToString(loan.status));
  }
  const Amount debt = loan.TotalDebt();
  if (amount > debt) {
    throw LendingError(LendingErrc::RepaymentExceedsDebt,
      "payment " + FormatDecimal(amount) + " exceeds debt " + FormatDecimal(debt));
  }
  PaymentSplit split;
  split.interest_paid = Min(amount, loan.accrued_interest);
  split.principal_paid = amount - split.interest_paid;
  loan.accrued_interest -= split.interest_paid;
  loan.principal -= split.principal_paid;
  loan.repaid_interest += split.interest_paid;
  loan.repaid_principal += split.principal_paid;
  return split;
}

void LoanRegistry::Close(Loan& loan, LoanStatus terminal, std::uint64_t now) {
  if (!loan.IsActive()) {
    throw LendingError(LendingErrc::LoanNotActive, "loan " + std::to_string(loan.id) + " is " + ToString(loan.status));
  }
  if (terminal != LoanStatus::Repaid && terminal != LoanStatus::Liquidated) {
    throw LendingError(LendingErrc::InvalidParameter, std::string("cannot close a loan as ") + ToString(terminal));
  }
  loan.status = terminal;
  loan.closed_time = now;
}
