#include "test_support.hpp"
#include "engine/market_config.hpp"
#include "common/config_manager.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

using nlohmann::json;

namespace {

const char* kMarkets = R"({
  "operator": "deployer",
  "fee_recipient": "treasury",
  "protocol": {"max_price_age_seconds": 600, "min_loan_amount": "10", "max_utilization_bps": 9000},
  "interest_curve": {"base_rate_bps": 100, "slope1_bps": 500},
  "assets": [
    {"symbol": "USDC", "collateral_factor_bps": 8500, "liquidation_bonus_bps": 400},
    {"symbol": "ETH", "collateral_factor_bps": 8000, "liquidation_bonus_bps": 800,
     "liquidation_threshold_bps": 8800, "borrowing_enabled": false,
     "interest_curve": {"base_rate_bps": 300}}
  ],
  "roles": [{"account": "ops", "role": "guardian"}]
})";

// Removes the keys a test set once it ends.
struct ConfigGuard {
  ~ConfigGuard() { ConfigManager::Clear(); }
};

}

BOOST_AUTO_TEST_SUITE(market_config)

BOOST_AUTO_TEST_CASE(parses_a_full_document) {
  const MarketConfig cfg = MarketConfig::FromJson(json::parse(kMarkets));
  BOOST_CHECK_EQUAL(cfg.operator_account, "deployer");
  BOOST_CHECK_EQUAL(cfg.fee_recipient, "treasury");
  BOOST_CHECK_EQUAL(cfg.protocol.price_guard.max_age_seconds, 600u);
  BOOST_CHECK_EQUAL(cfg.protocol.min_loan_amount, Tok(10));
  BOOST_CHECK_EQUAL(cfg.protocol.max_utilization_bps, 9000u);
  BOOST_CHECK_EQUAL(cfg.protocol.max_collateral_factor_bps, 9000u);
  BOOST_CHECK_EQUAL(cfg.curve.base_rate_bps, 100u);
  BOOST_CHECK_EQUAL(cfg.curve.slope1_bps, 500u);
  BOOST_CHECK_EQUAL(cfg.curve.slope2_bps, 6000u);

  BOOST_REQUIRE_EQUAL(cfg.assets.size(), 2u);
  BOOST_CHECK(!cfg.assets[0].liquidation_threshold_bps);
  BOOST_CHECK_EQUAL(*cfg.assets[1].liquidation_threshold_bps, 8800u);
  BOOST_CHECK(!cfg.assets[1].borrowing_enabled);
  BOOST_REQUIRE(cfg.assets[1].curve);
  // asset curves start from the protocol curve
  BOOST_CHECK_EQUAL(cfg.assets[1].curve->base_rate_bps, 300u);
  BOOST_CHECK_EQUAL(cfg.assets[1].curve->slope1_bps, 500u);

  BOOST_REQUIRE_EQUAL(cfg.roles.size(), 1u);
  BOOST_CHECK(cfg.roles[0].role == Role::Guardian);
}

BOOST_AUTO_TEST_CASE(empty_document_keeps_defaults) {
  const MarketConfig cfg = MarketConfig::FromJson(json::object());
  BOOST_CHECK_EQUAL(cfg.operator_account, "operator");
  BOOST_CHECK(cfg.assets.empty());
  BOOST_CHECK(cfg.curve == InterestRateCurve{});
}

BOOST_AUTO_TEST_CASE(rejects_malformed_documents) {
  CHECK_LENDING_ERROR(MarketConfig::FromJson(json::array()), LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(MarketConfig::FromJson(json::parse(R"({"roles": [{"account": "x", "role": "root"}]})")),
                      LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(MarketConfig::FromJson(json::parse(R"({"assets": [{"collateral_factor_bps": 1}]})")),
                      LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(MarketConfig::FromJson(json::parse(R"({"assets": [{"symbol": "X", "collateral_factor_bps": -1}]})")),
                      LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(MarketConfig::FromJson(json::parse(R"({"interest_curve": {"optimal_utilization_bps": 0}})")),
                      LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(MarketConfig::FromJson(json::parse(R"({"protocol": {"max_utilization_bps": 20000}})")),
                      LendingErrc::InvalidParameter);
  CHECK_LENDING_ERROR(MarketConfig::FromJson(json::parse(R"({"protocol": {"min_loan_amount": "1e3"}})")),
                      LendingErrc::InvalidParameter);
}

BOOST_AUTO_TEST_CASE(load_file) {
  const auto path = std::filesystem::temp_directory_path() / "lending_markets_test.json";
  {
    std::ofstream out(path);
    out << kMarkets;
  }
  BOOST_CHECK_EQUAL(MarketConfig::LoadFile(path.string()).assets.size(), 2u);
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  CHECK_LENDING_ERROR(MarketConfig::LoadFile(path.string()), LendingErrc::InvalidParameter);
  std::filesystem::remove(path);
  BOOST_CHECK_THROW(MarketConfig::LoadFile(path.string()), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(environment_overrides_win) {
  ConfigGuard guard;
  ProtocolParams params;
  ConfigManager::Set("MAX_PRICE_AGE_SECONDS", "120");
  ConfigManager::Set("MIN_LOAN_AMOUNT", "0.5");
  ConfigManager::Set("MAX_UTILIZATION_BPS", "not-a-number");
  ApplyEnvOverrides(params);
  BOOST_CHECK_EQUAL(params.price_guard.max_age_seconds, 120u);
  BOOST_CHECK_EQUAL(params.min_loan_amount, Units("0.5"));
  BOOST_CHECK_EQUAL(params.max_utilization_bps, 9500u);

  ConfigManager::Set("MAX_COLLATERAL_FACTOR_BPS", "12000");
  CHECK_LENDING_ERROR(ApplyEnvOverrides(params), LendingErrc::InvalidParameter);
}

BOOST_AUTO_TEST_CASE(oversized_bps_are_rejected_not_truncated) {
  ConfigGuard guard;
  ProtocolParams params;
  // 2^32 + 10000 would become 10000 if narrowed
  ConfigManager::Set("MIN_CONFIDENCE_BPS", "4294977296");
  CHECK_LENDING_ERROR(ApplyEnvOverrides(params), LendingErrc::InvalidParameter);
  BOOST_CHECK_EQUAL(params.price_guard.min_confidence_bps, 9500u);

  ConfigManager::Set("MIN_CONFIDENCE_BPS", "9000");
  ConfigManager::Set("DEFAULT_LIQUIDATION_THRESHOLD_BPS", "4294967296");
  CHECK_LENDING_ERROR(ApplyEnvOverrides(params), LendingErrc::InvalidParameter);
}

BOOST_AUTO_TEST_CASE(keeper_settings_from_environment) {
  ConfigGuard guard;
  const KeeperSettings defaults = KeeperSettingsFromEnv();
  BOOST_CHECK_EQUAL(defaults.account, "keeper");
  BOOST_CHECK_EQUAL(defaults.close_factor_bps, 5000u);
  BOOST_CHECK_EQUAL(defaults.threads, 2u);

  ConfigManager::Set("KEEPER_ACCOUNT", "bot");
  ConfigManager::Set("KEEPER_CLOSE_FACTOR_BPS", "10000");
  ConfigManager::Set("KEEPER_THREADS", "8");
  const KeeperSettings set = KeeperSettingsFromEnv();
  BOOST_CHECK_EQUAL(set.account, "bot");
  BOOST_CHECK_EQUAL(set.close_factor_bps, 10000u);
  BOOST_CHECK_EQUAL(set.threads, 8u);

  ConfigManager::Set("KEEPER_THREADS", "-3");
  BOOST_CHECK_EQUAL(KeeperSettingsFromEnv().threads, 2u);
  ConfigManager::Set("KEEPER_THREADS", "0");
  BOOST_CHECK_EQUAL(KeeperSettingsFromEnv().threads, 1u);
  ConfigManager::Set("KEEPER_THREADS", "100000");
  BOOST_CHECK_EQUAL(KeeperSettingsFromEnv().threads, KeeperSettings::kMaxThreads);

  ConfigManager::Set("KEEPER_CLOSE_FACTOR_BPS", "4294972296");
  CHECK_LENDING_ERROR(KeeperSettingsFromEnv(), LendingErrc::InvalidParameter);
}

BOOST_AUTO_TEST_CASE(apply_lists_markets_and_roles) {
  const MarketConfig cfg = MarketConfig::FromJson(json::parse(kMarkets));
  ManualClock clock(kStart);
  StaticPriceFeed prices(clock);
  RoleAccessGate gate;
  LendingPool pool(clock, prices, gate, cfg.protocol, cfg.curve);
  ApplyMarketConfig(cfg, pool, gate);

  BOOST_CHECK(gate.HasRole("deployer", Role::Admin));
  BOOST_CHECK(gate.Authorize("ops", AdminAction::PauseProtocol));
  BOOST_CHECK_EQUAL(pool.FeeRecipient(), "treasury");
  BOOST_CHECK((pool.ListedAssets() == std::vector<std::string>{"ETH", "USDC"}));

  const PoolInfo usdc = pool.GetPoolInfo("USDC");
  BOOST_CHECK_EQUAL(usdc.pool.risk.collateral_factor_bps, 8500u);
  BOOST_CHECK_EQUAL(usdc.pool.risk.liquidation_threshold_bps, 8500u);
  BOOST_CHECK_EQUAL(usdc.borrow_apy_bps, 100u);
  const PoolInfo eth = pool.GetPoolInfo("ETH");
  BOOST_CHECK_EQUAL(eth.pool.risk.liquidation_threshold_bps, 8800u);
  BOOST_CHECK(!eth.pool.borrowing_enabled);
  BOOST_CHECK(eth.pool.deposits_enabled);
  BOOST_CHECK_EQUAL(eth.borrow_apy_bps, 300u);
}

BOOST_AUTO_TEST_SUITE_END()
