#include "pool/interest_rate_model.hpp"
#include "common/lending_error.hpp"

using namespace FixedPoint;

void InterestRateCurve::Validate() const {
  if (optimal_utilization_bps == 0 || optimal_utilization_bps > BPS_DENOMINATOR) {
    throw LendingError(LendingErrc::InvalidParameter,
      "optimal utilization must be in (0, 10000] bps, got " + std::to_string(optimal_utilization_bps));
  }
  if (reserve_factor_bps > BPS_DENOMINATOR) {
    throw LendingError(LendingErrc::InvalidParameter,
      "reserve factor must be at most 10000 bps, got " + std::to_string(reserve_factor_bps));
  }
}

bool InterestRateCurve::operator==(const InterestRateCurve& o) const {
  return base_rate_bps == o.base_rate_bps && slope1_bps == o.slope1_bps && slope2_bps == o.slope2_bps &&
         optimal_utilization_bps == o.optimal_utilization_bps && reserve_factor_bps == o.reserve_factor_bps;
}

Amount InterestRateModel::Utilization(const Amount& total_borrows, const Amount& total_deposits) {
  if (total_deposits == 0) return Amount(0);
  return MulDiv(total_borrows, PRECISION, total_deposits);
}

Amount InterestRateModel::BorrowRate(const Amount& total_borrows, const Amount& total_deposits) const {
  const Amount base = BpsToWad(curve_.base_rate_bps);
  const Amount slope1 = BpsToWad(curve_.slope1_bps);
  const Amount slope2 = BpsToWad(curve_.slope2_bps);
  const Amount optimal = BpsToWad(curve_.optimal_utilization_bps);
  const Amount utilization = Utilization(total_borrows, total_deposits);

  if (utilization <= optimal) {
    return base + MulDiv(slope1, utilization, optimal);
  }
  const Amount excess = utilization - optimal;
  const Amount headroom = Amount(PRECISION) - optimal;
  // optimal == 100% leaves no room above the kink; charge the whole second slope
  if (headroom == 0) return base + slope1 + slope2;
  return base + slope1 + MulDiv(slope2, excess, headroom);
}

Amount InterestRateModel::SupplyRate(const Amount& total_borrows, const Amount& total_deposits) const {
  const Amount borrow_rate = BorrowRate(total_borrows, total_deposits);
  const Amount utilization = Utilization(total_borrows, total_deposits);
  const Amount gross = MulDiv(borrow_rate, utilization, PRECISION);
  return MulDiv(gross, BPS_DENOMINATOR - curve_.reserve_factor_bps, BPS_DENOMINATOR);
}

std::uint32_t InterestRateModel::BorrowRateBps(const Amount& total_borrows, const Amount& total_deposits) const {
  return static_cast<std::uint32_t>(WadToBps(BorrowRate(total_borrows, total_deposits)));
}

std::uint32_t InterestRateModel::SupplyRateBps(const Amount& total_borrows, const Amount& total_deposits) const {
  return static_cast<std::uint32_t>(WadToBps(SupplyRate(total_borrows, total_deposits)));
}
