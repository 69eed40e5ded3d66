#include "math/fixed_point.hpp"
#include "common/lending_error.hpp"
#include <cctype>

namespace FixedPoint {

Amount MulDiv(const Amount& value, const Amount& mul, const Amount& div) {
  if (div == 0) throw LendingError(LendingErrc::AccountingInvariant, "division by zero in MulDiv");
  return (value * mul) / div;
}

Amount MulDivUp(const Amount& value, const Amount& mul, const Amount& div) {
  if (div == 0) throw LendingError(LendingErrc::AccountingInvariant, "division by zero in MulDivUp");
  Amount product = value * mul;
  Amount q = product / div;
  if (q * div != product) q += 1;
  return q;
}

Amount Tokens(std::uint64_t whole) {
  return Amount(whole) * PRECISION;
}

Amount BpsToWad(std::uint64_t bps) {
  return Amount(bps) * WAD_PER_BPS;
}

std::uint64_t WadToBps(const Amount& wad) {
  Amount bps = wad / WAD_PER_BPS;
  return static_cast<std::uint64_t>(bps);
}

static bool AllDigits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

Amount ParseRaw(const std::string& text) {
  if (!AllDigits(text)) throw LendingError(LendingErrc::InvalidParameter, "not an unsigned integer: '" + text + "'");
  try {
    return Amount(text.c_str());
  } catch (const std::exception&) {
    throw LendingError(LendingErrc::InvalidParameter, "integer out of range: '" + text + "'");
  }
}

Amount ParseDecimal(const std::string& text) {
  if (text.empty()) throw LendingError(LendingErrc::InvalidParameter, "empty decimal amount");
  auto dot = text.find('.');
  std::string whole = dot == std::string::npos ? text : text.substr(0, dot);
  std::string frac = dot == std::string::npos ? std::string() : text.substr(dot + 1);
  if (whole.empty()) whole = "0";
  if (!AllDigits(whole) || (dot != std::string::npos && !frac.empty() && !AllDigits(frac))) {
    throw LendingError(LendingErrc::InvalidParameter, "not a decimal amount: '" + text + "'");
  }
  if (dot != std::string::npos && frac.empty() && text.size() == 1) {
    throw LendingError(LendingErrc::InvalidParameter, "not a decimal amount: '" + text + "'");
  }
  if (frac.size() > DECIMALS) {
    throw LendingError(LendingErrc::InvalidParameter, "more than 18 fractional digits: '" + text + "'");
  }
  frac.append(DECIMALS - frac.size(), '0');
  return ParseRaw(whole) * PRECISION + ParseRaw(frac);
}

std::string FormatDecimal(const Amount& value) {
  Amount whole = value / PRECISION;
  Amount frac = value % PRECISION;
  std::string out = whole.str();
  if (frac == 0) return out;
  std::string f = frac.str();
  f.insert(0, DECIMALS - f.size(), '0');
  while (!f.empty() && f.back() == '0') f.pop_back();
  return out + "." + f;
}

}
