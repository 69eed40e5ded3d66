#include "test_support.hpp"

MarketFixture::MarketFixture(const ProtocolParams& params, const InterestRateCurve& curve)
  : pool(clock, prices, gate, params, curve) {
  gate.Grant("admin", Role::Admin);
  pool.AddSupportedAsset("admin", "USDC", 8000, 500, 8500);
  pool.AddSupportedAsset("admin", "ETH", 8000, 1000, 8500);
  prices.SetFixed("USDC", Tok(1));
  prices.SetFixed("ETH", Tok(1));
}

Loan MarketFixture::OpenUsdcLoan(const Amount& liquidity, const Amount& collateral, const Amount& amount) {
  pool.Deposit("lp", "USDC", liquidity);
  return pool.Borrow("bob", "ETH", "USDC", collateral, amount).loan;
}

void MarketFixture::CheckSolvent(const std::string& asset) {
  const Pool p = pool.GetPoolInfo(asset).pool;
  BOOST_CHECK_LE(p.total_borrows, p.total_deposits);
  BOOST_CHECK_LE(p.total_reserves, p.total_deposits);
}
