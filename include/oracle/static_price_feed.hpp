#pragma once
#include <string>
#include <unordered_map>
#include <mutex>
#include "oracle/price_feed.hpp"

class Clock;

// In-memory price table. Entries set with SetFixed report the clock's current
// time as their timestamp, so they never go stale; entries set with Set keep
// the timestamp they were given.
class StaticPriceFeed : public PriceFeed {
public:
  explicit StaticPriceFeed(const Clock& clock) : clock_(clock) {}
  PriceData GetPrice(const std::string& asset) override;
  void Set(const std::string& asset, const PriceData& data);
  void SetFixed(const std::string& asset, const Amount& price, std::uint32_t confidence_bps = 10000);
  void Remove(const std::string& asset);
  // Parses "ASSET:price,ASSET:price" (decimal USD prices) into fixed entries.
  // Returns the number of entries loaded; malformed pairs are logged and skipped.
  size_t LoadOverrides(const std::string& entries);
private:
  struct Entry {
    PriceData data;
    bool fixed = false;
  };
  const Clock& clock_;
  std::mutex mutex_;
  std::unordered_map<std::string, Entry> prices_;
};
