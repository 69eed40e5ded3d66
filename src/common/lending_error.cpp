#include "common/lending_error.hpp"

const char* ToString(LendingErrc code) {
  switch (code) {
    case LendingErrc::ZeroAmount: return "zero_amount";
    case LendingErrc::AssetNotSupported: return "asset_not_supported";
    case LendingErrc::AssetAlreadyListed: return "asset_already_listed";
    case LendingErrc::PoolInactive: return "pool_inactive";
    case LendingErrc::DepositsDisabled: return "deposits_disabled";
    case LendingErrc::BorrowingDisabled: return "borrowing_disabled";
    case LendingErrc::ProtocolPaused: return "protocol_paused";
    case LendingErrc::InsufficientBalance: return "insufficient_balance";
    case LendingErrc::InsufficientCollateral: return "insufficient_collateral";
    case LendingErrc::InsufficientLiquidity: return "insufficient_liquidity";
    case LendingErrc::LoanTooSmall: return "loan_too_small";
    case LendingErrc::LoanNotFound: return "loan_not_found";
    case LendingErrc::LoanNotActive: return "loan_not_active";
    case LendingErrc::RepaymentExceedsDebt: return "repayment_exceeds_debt";
    case LendingErrc::NotLiquidatable: return "not_liquidatable";
    case LendingErrc::StalePriceData: return "stale_price_data";
    case LendingErrc::LowConfidencePrice: return "low_confidence_price";
    case LendingErrc::PriceUnavailable: return "price_unavailable";
    case LendingErrc::UtilizationLimitExceeded: return "utilization_limit_exceeded";
    case LendingErrc::Unauthorized: return "unauthorized";
    case LendingErrc::InvalidParameter: return "invalid_parameter";
    case LendingErrc::AccountingInvariant: return "accounting_invariant";
  }
  return "unknown";
}

LendingError::LendingError(LendingErrc code, const std::string& message)
  : std::runtime_error(std::string(ToString(code)) + ": " + message), code_(code) {}
