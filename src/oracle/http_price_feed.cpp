#include "oracle/http_price_feed.hpp"
#include "common/lending_error.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>

PriceData HttpPriceFeed::ParseResponse(const std::string& asset, const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw LendingError(LendingErrc::PriceUnavailable, "malformed price response for " + asset);
  }
  if (!j.contains("price") || !j.contains("timestamp") || !j.contains("confidence_bps")) {
    throw LendingError(LendingErrc::PriceUnavailable, "incomplete price response for " + asset);
  }
  PriceData d;
  const auto& p = j["price"];
  if (p.is_string()) {
    try {
      d.price = FixedPoint::ParseDecimal(p.get<std::string>());
    } catch (const LendingError& e) {
      throw LendingError(LendingErrc::PriceUnavailable, "bad price for " + asset + ": " + e.what());
    }
  } else if (p.is_number_unsigned()) {
    d.price = FixedPoint::Tokens(p.get<std::uint64_t>());
  } else {
    throw LendingError(LendingErrc::PriceUnavailable, "price for " + asset + " must be a decimal string");
  }
  if (!j["timestamp"].is_number_unsigned() || !j["confidence_bps"].is_number_unsigned()) {
    throw LendingError(LendingErrc::PriceUnavailable, "timestamp/confidence for " + asset + " must be unsigned integers");
  }
  d.timestamp = j["timestamp"].get<std::uint64_t>();
  d.confidence_bps = j["confidence_bps"].get<std::uint32_t>();
  return d;
}

PriceData HttpPriceFeed::GetPrice(const std::string& asset) {
  std::string url = base_url_;
  if (!url.empty() && url.back() != '/') url.push_back('/');
  url += asset;
  auto resp = http_.Get(url, headers_, timeout_ms_);
  if (resp.status == 0) {
    throw LendingError(LendingErrc::PriceUnavailable, "price request for " + asset + " failed: " + resp.error);
  }
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Error("Price feed HTTP status=" + std::to_string(resp.status) + " for " + asset);
    throw LendingError(LendingErrc::PriceUnavailable, "price request for " + asset + " returned HTTP " + std::to_string(resp.status));
  }
  return ParseResponse(asset, resp.body);
}
