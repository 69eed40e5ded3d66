#pragma once
#include <cstdint>
#include <string>
#include <boost/multiprecision/cpp_int.hpp>

// Token amounts, USD values and prices are unsigned integers with 18 implied
// decimals. The checked type throws on overflow and on negative results
// instead of wrapping.
using Amount = boost::multiprecision::checked_uint256_t;

namespace FixedPoint {
  inline constexpr unsigned DECIMALS = 18;
  inline constexpr std::uint64_t PRECISION = 1000000000000000000ULL; // 1e18
  inline constexpr std::uint64_t BPS_DENOMINATOR = 10000;
  inline constexpr std::uint64_t SECONDS_PER_YEAR = 365ULL * 24 * 60 * 60;
  // 1 bps expressed at 1e18 scale
  inline constexpr std::uint64_t WAD_PER_BPS = PRECISION / BPS_DENOMINATOR;

  // value * mul / div, truncated. Throws LendingError(AccountingInvariant) on div == 0.
  Amount MulDiv(const Amount& value, const Amount& mul, const Amount& div);
  // Like MulDiv but rounds up; used only where rounding must favour the protocol.
  Amount MulDivUp(const Amount& value, const Amount& mul, const Amount& div);

  // Whole units to the 18-decimal scale: Tokens(5) == 5e18.
  Amount Tokens(std::uint64_t whole);
  Amount BpsToWad(std::uint64_t bps);
  // Truncating inverse of BpsToWad.
  std::uint64_t WadToBps(const Amount& wad);

  // "1250.5" -> 1250500000000000000000. Rejects signs, exponents and more than 18
  // fractional digits with LendingError(InvalidParameter).
  Amount ParseDecimal(const std::string& text);
  // Raw integer in base units, no implied scaling.
  Amount ParseRaw(const std::string& text);
  // Inverse of ParseDecimal; trailing fractional zeros are trimmed ("1250.5").
  std::string FormatDecimal(const Amount& value);

  inline Amount Min(const Amount& a, const Amount& b) { return a < b ? a : b; }
}
