#include "math/valuation.hpp"

namespace Valuation {

Amount UsdValue(const Amount& amount, const Amount& price) {
  return FixedPoint::MulDiv(amount, price, FixedPoint::PRECISION);
}

Amount Convert(const Amount& amount, const Amount& from_price, const Amount& to_price) {
  return FixedPoint::MulDiv(amount, from_price, to_price);
}

}
