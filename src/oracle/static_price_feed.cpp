#include "oracle/static_price_feed.hpp"
#include "common/clock.hpp"
#include "common/lending_error.hpp"
#include "common/logger.hpp"
#include <sstream>

PriceData StaticPriceFeed::GetPrice(const std::string& asset) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = prices_.find(asset);
  if (it == prices_.end()) throw LendingError(LendingErrc::PriceUnavailable, "no price for " + asset);
  PriceData out = it->second.data;
  if (it->second.fixed) out.timestamp = clock_.Now();
  return out;
}

void StaticPriceFeed::Set(const std::string& asset, const PriceData& data) {
  std::lock_guard<std::mutex> lock(mutex_);
  prices_[asset] = Entry{data, false};
}

void StaticPriceFeed::SetFixed(const std::string& asset, const Amount& price, std::uint32_t confidence_bps) {
  std::lock_guard<std::mutex> lock(mutex_);
  PriceData d;
  d.price = price;
  d.confidence_bps = confidence_bps;
  prices_[asset] = Entry{d, true};
}

void StaticPriceFeed::Remove(const std::string& asset) {
  std::lock_guard<std::mutex> lock(mutex_);
  prices_.erase(asset);
}

size_t StaticPriceFeed::LoadOverrides(const std::string& entries) {
  size_t loaded = 0;
  std::istringstream iss(entries);
  std::string kv;
  while (std::getline(iss, kv, ',')) {
    if (kv.empty()) continue;
    auto pos = kv.find(':');
    if (pos == std::string::npos) {
      Logger::Warning("Ignoring price override without ':' -> " + kv);
      continue;
    }
    try {
      SetFixed(kv.substr(0, pos), FixedPoint::ParseDecimal(kv.substr(pos + 1)));
      ++loaded;
    } catch (const LendingError& e) {
      Logger::Warning("Ignoring price override " + kv + ": " + e.what());
    }
  }
  return loaded;
}
