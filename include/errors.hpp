#pragma once

#include <cstdint>
#include <string>

using std::string;

// Failure messages of the affswap contract. Every failure is an `eosio::check`
// abort of the whole transaction; callers see the text below.

// validation
static constexpr const char* ERR_NOT_INITIALIZED      = "contract not initialized";
static constexpr const char* ERR_ALREADY_INITIALIZED  = "contract already initialized";
static constexpr const char* ERR_INVALID_MAX_FEE      = "Invalid max fee percentage. Must be between 0 and 10";
static constexpr const char* ERR_NO_FUNDS             = "No funds sent";
static constexpr const char* ERR_MULTIPLE_DENOMS      = "Sent more than one denomination";
static constexpr const char* ERR_NO_DEPOSITS          = "no deposit of that token";
static constexpr const char* ERR_TOKEN_EXISTS         = "token already accepted";
static constexpr const char* ERR_TOKEN_NOT_FOUND      = "token not accepted";
static constexpr const char* ERR_MEMO_TOO_LONG        = "swap request does not fit in a transfer memo";

// protocol invariants
static constexpr const char* ERR_ACTIVE_SWAP_EXISTS   = "An active swap already exists";

inline string invalid_decimal(const string& input) {
  return "invalid decimal: " + input;
}

inline string invalid_collector(const string& input) {
  return "Invalid fee collector address: " + input;
}

inline string unsupported_token(const string& token) {
  return "unsupported token: " + token;
}

inline string unauthorized_deposit(const string& account) {
  return "deposit not authorized by " + account;
}

inline string unexpected(const string& detail) {
  return "Unexpected error: " + detail;
}

inline string unknown_reply_id(uint64_t id) {
  return "unknown reply id: " + std::to_string(id);
}

// arithmetic
inline string mul_overflow(const string& a, const string& b) {
  return "Arithmetic overflow: Cannot Mul with " + a + " and " + b;
}

// decoding of the engine's result payload
inline string invalid_swap_response(const string& detail) {
  return "invalid swap response: " + detail;
}

// external outcome, reason passed through unmodified
inline string failed_swap(const string& reason) {
  return "Failed Swap: " + reason;
}
