#pragma once

#include <eosio/eosio.hpp>
#include <optional>
#include <string>

using namespace eosio;
using std::string;

   /**
    * `decimal` is a signed fixed-point number with 18 fractional digits, held as
    *   an integer count of 10^-18 units ("atomics"). Percentages travel through
    *   actions as strings (e.g. "1.5") and are converted with `parse_decimal`,
    *   so fee arithmetic never touches floating point.
    */
struct decimal {
  static constexpr int      fractional_digits = 18;
  static constexpr int64_t  one = 1000000000000000000; // 10^18

  int128_t atomics = 0;

  friend constexpr bool operator==(const decimal& a, const decimal& b) { return a.atomics == b.atomics; }
  friend constexpr bool operator!=(const decimal& a, const decimal& b) { return a.atomics != b.atomics; }
  friend constexpr bool operator<(const decimal& a, const decimal& b) { return a.atomics < b.atomics; }
  friend constexpr bool operator>(const decimal& a, const decimal& b) { return a.atomics > b.atomics; }
  friend constexpr bool operator<=(const decimal& a, const decimal& b) { return a.atomics <= b.atomics; }
  friend constexpr bool operator>=(const decimal& a, const decimal& b) { return a.atomics >= b.atomics; }

  EOSLIB_SERIALIZE(decimal, (atomics))
};

// parses "[-]digits[.digits]"; fails the action on anything else
decimal parse_decimal(const string& s);

// shortest form: "1.5", "10", "0", "-0.25"
string to_string(const decimal& d);

struct fee_split {
  int64_t fee;
  int64_t remaining;
};

/**
    * Splits a deposit into the affiliate fee and the amount forwarded to the swap.
    *   The requested percentage (absent means zero) is clamped into [0, ceiling],
    *   and fee = floor(amount * effective / 100) in exact integer arithmetic.
    *
    * @param amount - deposited quantity, in the token's smallest units
    * @param requested - caller-chosen fee percentage
    * @param ceiling - configured maximum fee percentage
*/
fee_split split_fee(int64_t amount, const std::optional<decimal>& requested, const decimal& ceiling);
