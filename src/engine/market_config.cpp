#include "engine/market_config.hpp"
#include "common/config_manager.hpp"
#include "common/lending_error.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>

using nlohmann::json;

namespace {

std::uint32_t Bps(const json& obj, const char* key, std::uint32_t fallback) {
  if (!obj.contains(key)) return fallback;
  const json& v = obj.at(key);
  if (!v.is_number_unsigned() || v.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
    throw LendingError(LendingErrc::InvalidParameter, std::string(key) + " must be an unsigned integer");
  }
  return v.get<std::uint32_t>();
}

// Unsigned env key that must also fit the 32-bit bps fields.
std::uint32_t EnvBps(const char* key, std::uint32_t fallback) {
  const std::uint64_t v = ConfigManager::GetUint64Or(key, fallback);
  if (v > std::numeric_limits<std::uint32_t>::max()) {
    throw LendingError(LendingErrc::InvalidParameter, std::string(key) + " is out of range: " + std::to_string(v));
  }
  return static_cast<std::uint32_t>(v);
}

InterestRateCurve ParseCurve(const json& j, const InterestRateCurve& base) {
  if (!j.is_object()) throw LendingError(LendingErrc::InvalidParameter, "interest_curve must be an object");
  InterestRateCurve c = base;
  c.base_rate_bps = Bps(j, "base_rate_bps", c.base_rate_bps);
  c.slope1_bps = Bps(j, "slope1_bps", c.slope1_bps);
  c.slope2_bps = Bps(j, "slope2_bps", c.slope2_bps);
  c.optimal_utilization_bps = Bps(j, "optimal_utilization_bps", c.optimal_utilization_bps);
  c.reserve_factor_bps = Bps(j, "reserve_factor_bps", c.reserve_factor_bps);
  c.Validate();
  return c;
}

Amount DecimalField(const json& j, const char* key, const Amount& fallback) {
  if (!j.contains(key)) return fallback;
  const json& v = j.at(key);
  if (v.is_string()) return FixedPoint::ParseDecimal(v.get<std::string>());
  if (v.is_number_unsigned()) return FixedPoint::Tokens(v.get<std::uint64_t>());
  throw LendingError(LendingErrc::InvalidParameter, std::string(key) + " must be a decimal string");
}

}

MarketConfig MarketConfig::FromJson(const json& j) {
  if (!j.is_object()) throw LendingError(LendingErrc::InvalidParameter, "markets config must be a JSON object");
  MarketConfig cfg;
  try {
    cfg.operator_account = j.value("operator", cfg.operator_account);
    cfg.fee_recipient = j.value("fee_recipient", cfg.fee_recipient);

    if (j.contains("protocol")) {
      const json& p = j.at("protocol");
      ProtocolParams& pp = cfg.protocol;
      if (p.contains("max_price_age_seconds")) {
        const json& age = p.at("max_price_age_seconds");
        if (!age.is_number_unsigned()) {
          throw LendingError(LendingErrc::InvalidParameter, "max_price_age_seconds must be an unsigned integer");
        }
        pp.price_guard.max_age_seconds = age.get<std::uint64_t>();
      }
      pp.price_guard.min_confidence_bps = Bps(p, "min_confidence_bps", pp.price_guard.min_confidence_bps);
      pp.min_loan_amount = DecimalField(p, "min_loan_amount", pp.min_loan_amount);
      pp.max_utilization_bps = Bps(p, "max_utilization_bps", pp.max_utilization_bps);
      pp.max_collateral_factor_bps = Bps(p, "max_collateral_factor_bps", pp.max_collateral_factor_bps);
      pp.max_liquidation_bonus_bps = Bps(p, "max_liquidation_bonus_bps", pp.max_liquidation_bonus_bps);
      pp.default_liquidation_threshold_bps = Bps(p, "default_liquidation_threshold_bps", pp.default_liquidation_threshold_bps);
    }
    if (j.contains("interest_curve")) cfg.curve = ParseCurve(j.at("interest_curve"), cfg.curve);

    if (j.contains("assets")) {
      for (const auto& a : j.at("assets")) {
        AssetListing l;
        l.asset = a.at("symbol").get<std::string>();
        l.collateral_factor_bps = Bps(a, "collateral_factor_bps", l.collateral_factor_bps);
        l.liquidation_bonus_bps = Bps(a, "liquidation_bonus_bps", l.liquidation_bonus_bps);
        if (a.contains("liquidation_threshold_bps")) l.liquidation_threshold_bps = Bps(a, "liquidation_threshold_bps", 0);
        l.deposits_enabled = a.value("deposits_enabled", true);
        l.borrowing_enabled = a.value("borrowing_enabled", true);
        if (a.contains("interest_curve")) l.curve = ParseCurve(a.at("interest_curve"), cfg.curve);
        cfg.assets.push_back(l);
      }
    }
    if (j.contains("roles")) {
      for (const auto& r : j.at("roles")) {
        cfg.roles.push_back(RoleGrant{r.at("account").get<std::string>(), ParseRole(r.at("role").get<std::string>())});
      }
    }
  } catch (const json::exception& e) {
    throw LendingError(LendingErrc::InvalidParameter, std::string("markets config: ") + e.what());
  }
  cfg.protocol.Validate();
  return cfg;
}

MarketConfig MarketConfig::LoadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw std::runtime_error("Cannot open markets file: " + path);
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) throw LendingError(LendingErrc::InvalidParameter, "markets file is not valid JSON: " + path);
  MarketConfig cfg = FromJson(j);
  Logger::Info("Loaded " + std::to_string(cfg.assets.size()) + " market(s) from " + path);
  return cfg;
}

void ApplyEnvOverrides(ProtocolParams& params) {
  params.price_guard.max_age_seconds = ConfigManager::GetUint64Or("MAX_PRICE_AGE_SECONDS", params.price_guard.max_age_seconds);
  params.price_guard.min_confidence_bps = EnvBps("MIN_CONFIDENCE_BPS", params.price_guard.min_confidence_bps);
  if (auto v = ConfigManager::Get("MIN_LOAN_AMOUNT")) params.min_loan_amount = FixedPoint::ParseDecimal(*v);
  params.max_utilization_bps = EnvBps("MAX_UTILIZATION_BPS", params.max_utilization_bps);
  params.max_collateral_factor_bps = EnvBps("MAX_COLLATERAL_FACTOR_BPS", params.max_collateral_factor_bps);
  params.max_liquidation_bonus_bps = EnvBps("MAX_LIQUIDATION_BONUS_BPS", params.max_liquidation_bonus_bps);
  params.default_liquidation_threshold_bps =
    EnvBps("DEFAULT_LIQUIDATION_THRESHOLD_BPS", params.default_liquidation_threshold_bps);
  params.Validate();
}

KeeperSettings KeeperSettingsFromEnv() {
  KeeperSettings s;
  s.account = ConfigManager::Get("KEEPER_ACCOUNT").value_or(s.account);
  s.close_factor_bps = EnvBps("KEEPER_CLOSE_FACTOR_BPS", s.close_factor_bps);
  const std::uint64_t threads = ConfigManager::GetUint64Or("KEEPER_THREADS", s.threads);
  if (threads == 0 || threads > KeeperSettings::kMaxThreads) {
    s.threads = threads == 0 ? 1 : KeeperSettings::kMaxThreads;
    Logger::Warning("KEEPER_THREADS=" + std::to_string(threads) + " clamped to " + std::to_string(s.threads));
  } else {
    s.threads = static_cast<size_t>(threads);
  }
  return s;
}

void ApplyMarketConfig(const MarketConfig& config, LendingPool& pool, RoleAccessGate& gate) {
  gate.Grant(config.operator_account, Role::Admin);
  for (const auto& r : config.roles) gate.Grant(r.account, r.role);
  for (const auto& l : config.assets) {
    pool.AddSupportedAsset(config.operator_account, l.asset, l.collateral_factor_bps, l.liquidation_bonus_bps,
                           l.liquidation_threshold_bps);
    if (!l.deposits_enabled || !l.borrowing_enabled) {
      pool.SetPoolFlags(config.operator_account, l.asset, l.deposits_enabled, l.borrowing_enabled);
    }
    if (l.curve) pool.SetPoolInterestCurve(config.operator_account, l.asset, l.curve);
  }
  if (!config.fee_recipient.empty()) pool.SetFeeRecipient(config.operator_account, config.fee_recipient);
}
