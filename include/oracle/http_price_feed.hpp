#pragma once
#include <string>
#include "oracle/price_feed.hpp"
#include "net/http_client.hpp"

// Queries GET <base_url>/<asset>; the answer is a JSON object
//   {"price": "2500.25", "timestamp": 1700000000, "confidence_bps": 9900}
// where price is a decimal string (or a whole-number integer) in USD.
class HttpPriceFeed : public PriceFeed {
public:
  HttpPriceFeed(HttpClient& http, const std::string& base_url, int timeout_ms,
                const HttpHeaders& headers = HttpHeaders{})
    : http_(http), base_url_(base_url), timeout_ms_(timeout_ms), headers_(headers) {}
  PriceData GetPrice(const std::string& asset) override;
  // Exposed for tests.
  static PriceData ParseResponse(const std::string& asset, const std::string& body);
private:
  HttpClient& http_;
  std::string base_url_;
  int timeout_ms_;
  HttpHeaders headers_;
};
