#pragma once
#include <cstdint>
#include <string>
#include "math/fixed_point.hpp"

struct PriceData {
  Amount price;                  // USD per whole unit, 18 decimals
  std::uint64_t timestamp = 0;   // seconds
  std::uint32_t confidence_bps = 0;
};

// External price source. Implementations throw LendingError(PriceUnavailable)
// when they cannot answer (unknown asset, transport failure, timeout).
class PriceFeed {
public:
  virtual ~PriceFeed() = default;
  virtual PriceData GetPrice(const std::string& asset) = 0;
};

struct PriceGuardPolicy {
  std::uint64_t max_age_seconds = 3600;
  std::uint32_t min_confidence_bps = 9500;
};

// Throws StalePriceData when now - timestamp > max_age, LowConfidencePrice when
// confidence is below the minimum, PriceUnavailable on a zero price. A
// timestamp ahead of now counts as age zero.
void ValidatePrice(const std::string& asset, const PriceData& data, std::uint64_t now, const PriceGuardPolicy& policy);

// Fetches and validates in one step; any non-LendingError thrown by the feed is
// reported as PriceUnavailable.
Amount FetchValidatedPrice(PriceFeed& feed, const std::string& asset, std::uint64_t now, const PriceGuardPolicy& policy);
