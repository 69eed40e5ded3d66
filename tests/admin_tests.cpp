#include "test_support.hpp"

using FixedPoint::SECONDS_PER_YEAR;

BOOST_FIXTURE_TEST_SUITE(administration, MarketFixture)

BOOST_AUTO_TEST_CASE(admin_calls_require_a_role) {
  CHECK_LENDING_ERROR(pool.AddSupportedAsset("bob", "BTC", 7000, 500), LendingErrc::Unauthorized);
  CHECK_LENDING_ERROR(pool.RemoveSupportedAsset("bob", "USDC"), LendingErrc::Unauthorized);
  CHECK_LENDING_ERROR(pool.SetRiskParameters("bob", "USDC", PoolRiskParams{}), LendingErrc::Unauthorized);
  CHECK_LENDING_ERROR(pool.SetPoolFlags("bob", "USDC", false, false), LendingErrc::Unauthorized);
  CHECK_LENDING_ERROR(pool.SetInterestCurve("bob", InterestRateCurve{}), LendingErrc::Unauthorized);
  CHECK_LENDING_ERROR(pool.PausePool("bob", "USDC"), LendingErrc::Unauthorized);
  CHECK_LENDING_ERROR(pool.SetFeeRecipient("bob", "bob"), LendingErrc::Unauthorized);
  CHECK_LENDING_ERROR(pool.WithdrawReserves("bob", "USDC", Tok(1)), LendingErrc::Unauthorized);
  BOOST_CHECK((pool.ListedAssets() == std::vector<std::string>{"ETH", "USDC"}));
  BOOST_CHECK(pool.GetPoolInfo("USDC").pool.is_active);
}

BOOST_AUTO_TEST_CASE(roles_are_scoped) {
  gate.Grant("guard", Role::Guardian);
  gate.Grant("risk", Role::RiskManager);
  pool.PausePool("guard", "USDC");
  BOOST_CHECK(!pool.GetPoolInfo("USDC").pool.is_active);
  CHECK_LENDING_ERROR(pool.AddSupportedAsset("guard", "BTC", 7000, 500), LendingErrc::Unauthorized);
  CHECK_LENDING_ERROR(pool.PausePool("risk", "ETH"), LendingErrc::Unauthorized);
  pool.AddSupportedAsset("risk", "BTC", 7000, 500);
  BOOST_CHECK_EQUAL(pool.ListedAssets().size(), 3u);

  gate.Revoke("admin", Role::Admin);
  CHECK_LENDING_ERROR(pool.Pause("admin"), LendingErrc::Unauthorized);
}

BOOST_AUTO_TEST_CASE(listing_validates_risk_parameters) {
  CHECK_LENDING_ERROR(pool.AddSupportedAsset("admin", "BTC", 9100, 500), LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(pool.AddSupportedAsset("admin", "BTC", 7000, 2500), LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(pool.AddSupportedAsset("admin", "BTC", 8000, 500, 7000), LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(pool.AddSupportedAsset("admin", "BTC", 8000, 500, 10001), LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(pool.AddSupportedAsset("admin", "USDC", 8000, 500), LendingErrc::AssetAlreadyListed);
  BOOST_CHECK_EQUAL(pool.ListedAssets().size(), 2u);

  // without an explicit threshold the protocol default applies, raised to the collateral factor
  pool.AddSupportedAsset("admin", "BTC", 9000, 500);
  BOOST_CHECK_EQUAL(pool.GetPoolInfo("BTC").pool.risk.liquidation_threshold_bps, 9000u);
  pool.AddSupportedAsset("admin", "DAI", 6000, 500);
  const Pool dai = pool.GetPoolInfo("DAI").pool;
  BOOST_CHECK_EQUAL(dai.risk.liquidation_threshold_bps, 8500u);
  BOOST_CHECK_EQUAL(dai.last_update_time, kStart);
  BOOST_CHECK_EQUAL(dai.total_deposits, Amount(0));
  BOOST_CHECK(dai.is_active && dai.deposits_enabled && dai.borrowing_enabled);
}

BOOST_AUTO_TEST_CASE(new_risk_parameters_apply_to_new_loans) {
  OpenUsdcLoan(Tok(10000), Tok(1000), Tok(700));
  PoolRiskParams eth;
  eth.collateral_factor_bps = 6000;
  eth.liquidation_bonus_bps = 800;
  eth.liquidation_threshold_bps = 7000;
  pool.SetRiskParameters("admin", "ETH", eth);
  // the open loan keeps the threshold it was opened with
  BOOST_CHECK_EQUAL(pool.GetLoanInfo(1).liquidation_threshold_bps, 8500u);
  CHECK_LENDING_ERROR(pool.Borrow("carol", "ETH", "USDC", Tok(1000), Tok(700)), LendingErrc::InsufficientCollateral);
  BOOST_CHECK_EQUAL(pool.Borrow("carol", "ETH", "USDC", Tok(1000), Tok(600)).loan.liquidation_threshold_bps, 7000u);

  eth.liquidation_threshold_bps = 5000;
  CHECK_LENDING_ERROR(pool.SetRiskParameters("admin", "ETH", eth), LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(pool.SetRiskParameters("admin", "BTC", PoolRiskParams{}), LendingErrc::AssetNotSupported);
}

BOOST_AUTO_TEST_CASE(delisted_pool_only_allows_exits) {
  pool.Deposit("lp", "ETH", Tok(100));
  pool.RemoveSupportedAsset("admin", "ETH");
  const Pool eth = pool.GetPoolInfo("ETH").pool;
  BOOST_CHECK(eth.delisted);
  BOOST_CHECK(!eth.is_active);
  CHECK_LENDING_ERROR(pool.Deposit("lp", "ETH", Tok(1)), LendingErrc::PoolInactive);
  CHECK_LENDING_ERROR(pool.UnpausePool("admin", "ETH"), LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(pool.SetPoolFlags("admin", "ETH", true, false), LendingErrc::InvalidParameter);
  BOOST_CHECK_EQUAL(pool.Withdraw("lp", "ETH", Tok(100)).balance, Amount(0));
  CHECK_LENDING_ERROR(pool.AddSupportedAsset("admin", "ETH", 8000, 500), LendingErrc::AssetAlreadyListed);
}

BOOST_AUTO_TEST_CASE(pool_flags_gate_deposits_and_borrows) {
  pool.SetPoolFlags("admin", "USDC", false, true);
  CHECK_LENDING_ERROR(pool.Deposit("lp", "USDC", Tok(1)), LendingErrc::DepositsDisabled);
  pool.SetPoolFlags("admin", "USDC", true, true);
  pool.Deposit("lp", "USDC", Tok(1000));
  const PoolInfo info = pool.GetPoolInfo("USDC");
  BOOST_CHECK(info.pool.deposits_enabled && info.pool.borrowing_enabled);
}

BOOST_AUTO_TEST_CASE(curve_change_settles_interest_at_the_old_curve) {
  OpenUsdcLoan(Tok(1000), Tok(1000), Tok(500));
  clock.Advance(SECONDS_PER_YEAR);
  InterestRateCurve steep;
  steep.base_rate_bps = 5000;
  pool.SetInterestCurve("admin", steep);

  const PoolInfo info = pool.GetPoolInfo("USDC");
  // 50% utilization on the old curve is 4.5% a year
  BOOST_CHECK_EQUAL(info.pool.total_borrows, Units("522.5"));
  BOOST_CHECK_EQUAL(info.pool.last_update_time, clock.Now());
  BOOST_CHECK(info.curve == steep);
  BOOST_CHECK_GT(info.borrow_apy_bps, 5000u);

  InterestRateCurve broken;
  broken.optimal_utilization_bps = 0;
  CHECK_LENDING_ERROR(pool.SetInterestCurve("admin", broken), LendingErrc::InvalidParameter);
  BOOST_CHECK(pool.GetPoolInfo("USDC").curve == steep);
}

BOOST_AUTO_TEST_CASE(pool_curve_override_and_reset) {
  InterestRateCurve flat;
  flat.base_rate_bps = 700;
  flat.slope1_bps = 0;
  flat.slope2_bps = 0;
  pool.SetPoolInterestCurve("admin", "ETH", flat);
  BOOST_CHECK_EQUAL(pool.GetBorrowApy("ETH"), 700u);
  BOOST_CHECK_EQUAL(pool.GetBorrowApy("USDC"), 200u);
  pool.SetPoolInterestCurve("admin", "ETH", std::nullopt);
  BOOST_CHECK_EQUAL(pool.GetBorrowApy("ETH"), 200u);
  BOOST_CHECK(!pool.GetPoolInfo("ETH").pool.curve_override);
}

BOOST_AUTO_TEST_CASE(reserves_go_to_the_fee_recipient) {
  gate.Grant("treasury", Role::Treasurer);
  OpenUsdcLoan(Tok(1000), Tok(1000), Tok(500));
  clock.Advance(SECONDS_PER_YEAR);
  BOOST_CHECK_EQUAL(pool.GetPoolInfo("USDC").pool.total_reserves, Units("2.25"));

  CHECK_LENDING_ERROR(pool.WithdrawReserves("treasury", "USDC", Tok(2)), LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(pool.SetFeeRecipient("treasury", ""), LendingErrc::InvalidParameter);
  pool.SetFeeRecipient("treasury", "dao");
  BOOST_CHECK_EQUAL(pool.FeeRecipient(), "dao");
  CHECK_LENDING_ERROR(pool.WithdrawReserves("treasury", "USDC", Tok(3)), LendingErrc::InsufficientBalance);
  CHECK_LENDING_ERROR(pool.WithdrawReserves("treasury", "USDC", Amount(0)), LendingErrc::ZeroAmount);

  // reserves can be swept while users are locked out
  pool.Pause("admin");
  const ReserveReceipt r = pool.WithdrawReserves("treasury", "USDC", Tok(2));
  BOOST_CHECK_EQUAL(r.recipient, "dao");
  BOOST_CHECK_EQUAL(r.remaining_reserves, Units("0.25"));
  const Pool p = pool.GetPoolInfo("USDC").pool;
  BOOST_CHECK_EQUAL(p.total_deposits, Units("1020.5"));
  BOOST_CHECK_EQUAL(p.total_reserves, Units("0.25"));
}

BOOST_AUTO_TEST_CASE(accrual_runs_while_paused) {
  OpenUsdcLoan(Tok(1000), Tok(1000), Tok(500));
  pool.Pause("admin");
  clock.Advance(SECONDS_PER_YEAR);
  const AccrualResult r = pool.AccrueInterest("USDC");
  BOOST_CHECK_EQUAL(r.elapsed, SECONDS_PER_YEAR);
  BOOST_CHECK_EQUAL(r.interest, Units("22.5"));
  BOOST_CHECK_EQUAL(pool.AccrueInterest("USDC").interest, Amount(0));
  CHECK_LENDING_ERROR(pool.AccrueInterest("BTC"), LendingErrc::AssetNotSupported);
}

BOOST_AUTO_TEST_CASE(protocol_params_are_validated) {
  ProtocolParams bad;
  bad.max_utilization_bps = 0;
  auto build = [&] { LendingPool p(clock, prices, gate, bad); };
  CHECK_LENDING_ERROR(build(), LendingErrc::InvalidParameter);
  bad.max_utilization_bps = 9500;
  bad.max_collateral_factor_bps = 10001;
  CHECK_LENDING_ERROR(build(), LendingErrc::InvalidParameter);
  bad.max_collateral_factor_bps = 9000;
  bad.min_loan_amount = 0;
  CHECK_LENDING_ERROR(build(), LendingErrc::InvalidParameter);
  BOOST_CHECK_EQUAL(pool.Params().max_utilization_bps, 9500u);
}

BOOST_AUTO_TEST_SUITE_END()
