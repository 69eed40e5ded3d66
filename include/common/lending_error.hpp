#pragma once
#include <stdexcept>
#include <string>

enum class LendingErrc {
  ZeroAmount,
  AssetNotSupported,
  AssetAlreadyListed,
  PoolInactive,
  DepositsDisabled,
  BorrowingDisabled,
  ProtocolPaused,
  InsufficientBalance,
  InsufficientCollateral,
  InsufficientLiquidity,
  LoanTooSmall,
  LoanNotFound,
  LoanNotActive,
  RepaymentExceedsDebt,
  NotLiquidatable,
  StalePriceData,
  LowConfidencePrice,
  PriceUnavailable,
  UtilizationLimitExceeded,
  Unauthorized,
  InvalidParameter,
  AccountingInvariant,
};

// Stable snake_case name, used in logs and journal output.
const char* ToString(LendingErrc code);

// Every rejected operation throws this. The engine guarantees that no state was
// changed when it propagates out of a public call.
class LendingError : public std::runtime_error {
public:
  LendingError(LendingErrc code, const std::string& message);
  LendingErrc code() const noexcept { return code_; }
private:
  LendingErrc code_;
};
