#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/lending_pool.hpp"
#include "access/access_gate.hpp"

struct AssetListing {
  std::string asset;
  std::uint32_t collateral_factor_bps = 7500;
  std::uint32_t liquidation_bonus_bps = 500;
  std::optional<std::uint32_t> liquidation_threshold_bps;
  bool deposits_enabled = true;
  bool borrowing_enabled = true;
  std::optional<InterestRateCurve> curve;
};

struct RoleGrant {
  std::string account;
  Role role = Role::Admin;
};

// Markets file, e.g.
//   {
//     "operator": "deployer",
//     "fee_recipient": "treasury",
//     "protocol": {"max_price_age_seconds": 3600, "min_loan_amount": "1", ...},
//     "interest_curve": {"base_rate_bps": 200, "slope1_bps": 400, ...},
//     "assets": [{"symbol": "ETH", "collateral_factor_bps": 8000, "liquidation_bonus_bps": 500}],
//     "roles": [{"account": "ops", "role": "guardian"}]
//   }
// Every key is optional; missing ones keep their defaults.
struct MarketConfig {
  std::string operator_account = "operator";
  std::string fee_recipient;
  ProtocolParams protocol;
  InterestRateCurve curve;
  std::vector<AssetListing> assets;
  std::vector<RoleGrant> roles;

  // Throws LendingError(InvalidParameter) on malformed content.
  static MarketConfig FromJson(const nlohmann::json& j);
  // Throws std::runtime_error when the file cannot be read.
  static MarketConfig LoadFile(const std::string& path);
};

// MAX_PRICE_AGE_SECONDS, MIN_CONFIDENCE_BPS, MIN_LOAN_AMOUNT, MAX_UTILIZATION_BPS,
// MAX_COLLATERAL_FACTOR_BPS, MAX_LIQUIDATION_BONUS_BPS and
// DEFAULT_LIQUIDATION_THRESHOLD_BPS from ConfigManager win over the file.
// Values above 2^32 - 1 are rejected with InvalidParameter.
void ApplyEnvOverrides(ProtocolParams& params);

struct KeeperSettings {
  static constexpr size_t kMaxThreads = 64;
  std::string account = "keeper";
  std::uint32_t close_factor_bps = 5000;
  size_t threads = 2;
};

// KEEPER_ACCOUNT, KEEPER_CLOSE_FACTOR_BPS and KEEPER_THREADS. A thread count
// outside [1, kMaxThreads] is clamped with a warning.
KeeperSettings KeeperSettingsFromEnv();

// Grants the configured roles (the operator account receives Admin), then lists
// every asset and sets the fee recipient through the pool's admin surface.
void ApplyMarketConfig(const MarketConfig& config, LendingPool& pool, RoleAccessGate& gate);
