#pragma once
#include <cstdint>
#include "math/fixed_point.hpp"

struct InterestRateCurve {
  std::uint32_t base_rate_bps = 200;
  std::uint32_t slope1_bps = 400;
  std::uint32_t slope2_bps = 6000;
  std::uint32_t optimal_utilization_bps = 8000;
  std::uint32_t reserve_factor_bps = 1000;

  // optimal utilization must lie in (0, 10000], reserve factor in [0, 10000].
  void Validate() const;
  bool operator==(const InterestRateCurve& o) const;
};

// Kinked utilization curve. All rates are annual fractions at 1e18 scale.
class InterestRateModel {
public:
  explicit InterestRateModel(const InterestRateCurve& curve) : curve_(curve) {}

  // borrows / deposits at 1e18 scale; zero when there are no deposits.
  static Amount Utilization(const Amount& total_borrows, const Amount& total_deposits);

  Amount BorrowRate(const Amount& total_borrows, const Amount& total_deposits) const;
  // borrowRate * utilization * (1 - reserveFactor)
  Amount SupplyRate(const Amount& total_borrows, const Amount& total_deposits) const;
  std::uint32_t BorrowRateBps(const Amount& total_borrows, const Amount& total_deposits) const;
  std::uint32_t SupplyRateBps(const Amount& total_borrows, const Amount& total_deposits) const;

  const InterestRateCurve& curve() const { return curve_; }
private:
  InterestRateCurve curve_;
};
