#include <decimal.hpp>
#include <errors.hpp>
#include <algorithm>

namespace {

bool all_digits(const string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return c >= '0' && c <= '9'; });
}

string u128_to_string(uint128_t v) {
  if (v == 0) return "0";
  string rv;
  while (v > 0) {
    rv.insert(rv.begin(), char('0' + int(v % 10)));
    v /= 10;
  }
  return rv;
}

}

decimal parse_decimal(const string& s) {
  size_t start = (!s.empty() && s[0] == '-') ? 1 : 0;
  size_t dp = s.find('.', start);
  string whole = s.substr(start, dp == string::npos ? string::npos : dp - start);
  string frac = dp == string::npos ? "" : s.substr(dp+1);
  check(!whole.empty() && all_digits(whole), invalid_decimal(s));
  check(dp == string::npos || (!frac.empty() && all_digits(frac)), invalid_decimal(s));
  check(frac.size() <= decimal::fractional_digits, invalid_decimal(s) + " (too many decimals)");
  // 10^20 * 10^18 still fits in 127 bits
  check(whole.size() <= 20, invalid_decimal(s) + " (out of range)");

  int128_t rv = 0;
  for (char c : whole) {
    rv = rv*10 + (c - '0');
  }
  int128_t f = 0;
  for (char c : frac) {
    f = f*10 + (c - '0');
  }
  for (int i = frac.size(); i < decimal::fractional_digits; ++i) {
    f *= 10;
  }
  rv = rv*decimal::one + f;
  return decimal{start ? -rv : rv};
}

string to_string(const decimal& d) {
  bool negative = d.atomics < 0;
  uint128_t v = negative ? uint128_t(-d.atomics) : uint128_t(d.atomics);
  string rv = negative ? "-" : "";
  rv += u128_to_string(v / decimal::one);
  uint128_t frac = v % decimal::one;
  if (frac != 0) {
    string f = u128_to_string(frac);
    f.insert(0, decimal::fractional_digits - f.size(), '0');
    f.erase(f.find_last_not_of('0') + 1);
    rv += "." + f;
  }
  return rv;
}

fee_split split_fee(int64_t amount, const std::optional<decimal>& requested, const decimal& ceiling) {
  decimal effective = requested.value_or(decimal{});
  effective = std::max(effective, decimal{});
  effective = std::min(effective, ceiling);

  int128_t product;
  check(!__builtin_mul_overflow(int128_t(amount), effective.atomics, &product),
        mul_overflow(std::to_string(amount), to_string(effective)));
  // floor, both operands are non-negative
  int64_t fee = int64_t(product / (int128_t(100) * decimal::one));
  return fee_split{fee, amount - fee};
}
