#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "math/fixed_point.hpp"

enum class LoanStatus {
  Active,
  Repaid,
  Liquidated,
  Defaulted,  // reserved, nothing transitions into it
};

const char* ToString(LoanStatus status);

struct Loan {
  std::uint64_t id = 0;
  std::string borrower;
  std::string collateral_asset;
  std::string borrow_asset;
  Amount collateral_amount;
  Amount principal;
  Amount accrued_interest;
  std::uint32_t interest_rate_bps = 0;
  std::uint64_t start_time = 0;
  std::uint64_t last_accrual_time = 0;
  LoanStatus status = LoanStatus::Active;
  std::uint32_t liquidation_threshold_bps = 0;
  // history
  Amount repaid_principal;
  Amount repaid_interest;
  Amount collateral_seized;
  Amount collateral_returned;
  std::uint64_t closed_time = 0;

  Amount TotalDebt() const { return principal + accrued_interest; }
  bool IsActive() const { return status == LoanStatus::Active; }
};

struct PaymentSplit {
  Amount interest_paid;
  Amount principal_paid;
};

// Owns loan records. Same staging contract as PoolLedger: callers work on a
// Snapshot() and Commit() it when the whole operation has been validated.
class LoanRegistry {
public:
  std::uint64_t NextLoanId() const { return next_id_; }

  // Assigns the next id and stores an Active loan.
  Loan Open(const std::string& borrower,
            const std::string& collateral_asset,
            const std::string& borrow_asset,
            const Amount& collateral_amount,
            const Amount& principal,
            std::uint32_t interest_rate_bps,
            std::uint32_t liquidation_threshold_bps,
            std::uint64_t now);

  // Throws LoanNotFound.
  Loan Snapshot(std::uint64_t id) const;
  // Throws LoanNotFound, or LoanNotActive when the stored record is already terminal.
  void Commit(const Loan& loan);

  std::vector<std::uint64_t> LoansOf(const std::string& borrower) const;
  std::vector<std::uint64_t> ActiveLoanIds() const;
  size_t size() const { return loans_.size(); }

  // Simple interest at the loan's fixed rate since the last accrual:
  //   principal * rateBps * elapsed / (10000 * SECONDS_PER_YEAR)
  // No-op for terminal loans and when no time has passed. Returns the interest added.
  static Amount Accrue(Loan& loan, std::uint64_t now);

  // Applies `amount` interest-first, then principal. Throws ZeroAmount,
  // LoanNotActive, or RepaymentExceedsDebt when amount > total debt.
  static PaymentSplit ApplyPayment(Loan& loan, const Amount& amount);

  // Active -> Repaid | Liquidated, exactly once.
  static void Close(Loan& loan, LoanStatus terminal, std::uint64_t now);

private:
  std::uint64_t next_id_ = 1;
  std::map<std::uint64_t, Loan> loans_;
  std::map<std::string, std::vector<std::uint64_t>> by_borrower_;
};
