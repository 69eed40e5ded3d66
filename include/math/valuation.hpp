#pragma once
#include "math/fixed_point.hpp"

// Conversions between asset units and USD. Prices are USD per whole unit at
// 1e18 scale; every asset uses 18 decimals. All results truncate.
namespace Valuation {
  Amount UsdValue(const Amount& amount, const Amount& price);
  // How many `to` units are worth `amount` of `from`: amount * from_price / to_price.
  Amount Convert(const Amount& amount, const Amount& from_price, const Amount& to_price);
}
