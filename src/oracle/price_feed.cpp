#include "oracle/price_feed.hpp"
#include "common/lending_error.hpp"
#include "common/logger.hpp"

void ValidatePrice(const std::string& asset, const PriceData& data, std::uint64_t now, const PriceGuardPolicy& policy) {
  if (data.price == 0) {
    throw LendingError(LendingErrc::PriceUnavailable, "zero price for " + asset);
  }
  const std::uint64_t age = now > data.timestamp ? now - data.timestamp : 0;
  if (age > policy.max_age_seconds) {
    throw LendingError(LendingErrc::StalePriceData,
      asset + " price is " + std::to_string(age) + "s old (max " + std::to_string(policy.max_age_seconds) + "s)");
  }
  if (data.confidence_bps < policy.min_confidence_bps) {
    throw LendingError(LendingErrc::LowConfidencePrice,
      asset + " confidence " + std::to_string(data.confidence_bps) + " bps below " + std::to_string(policy.min_confidence_bps));
  }
}

Amount FetchValidatedPrice(PriceFeed& feed, const std::string& asset, std::uint64_t now, const PriceGuardPolicy& policy) {
  PriceData data;
  try {
    data = feed.GetPrice(asset);
  } catch (const LendingError&) {
    throw;
  } catch (const std::exception& e) {
    Logger::Error("Price feed failure for " + asset + ": " + e.what());
    throw LendingError(LendingErrc::PriceUnavailable, std::string("price feed failure for ") + asset + ": " + e.what());
  }
  ValidatePrice(asset, data, now, policy);
  return data.price;
}
