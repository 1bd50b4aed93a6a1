#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace eosio;
using std::string;

// eosio.token rejects longer memos
static constexpr size_t MAX_MEMO_SIZE = 256;

// one hop of a swap route: the pool to trade in and the token it yields
struct swap_route {
  uint64_t pool_id;
  extended_symbol token_out_denom;

  EOSLIB_SERIALIZE(swap_route, (pool_id)(token_out_denom))
};

// the request handed to the swap engine; kept verbatim while the swap is in flight
struct swap_request {
  name sender;
  std::vector<swap_route> routes;
  extended_asset token_in;
  extended_asset token_out_min_amount;

  EOSLIB_SERIALIZE(swap_request, (sender)(routes)(token_in)(token_out_min_amount))
};

// engine outcomes delivered to `swapreply`
struct swap_success {
  std::optional<std::vector<char>> data;

  EOSLIB_SERIALIZE(swap_success, (data))
};

struct swap_failure {
  string reason;

  EOSLIB_SERIALIZE(swap_failure, (reason))
};

typedef std::variant<swap_success, swap_failure> swap_outcome;

// packed into swap_success::data by the engine
struct swap_exact_amount_in_response {
  string token_out_amount;

  EOSLIB_SERIALIZE(swap_exact_amount_in_response, (token_out_amount))
};

// return value of `swapreply`
struct swap_response {
  name original_sender;
  int64_t fee;
  name fee_collector;
  extended_symbol swap_in_denom;
  int64_t swap_in_amount;
  extended_symbol token_out_denom;
  int64_t token_out_amount;

  EOSLIB_SERIALIZE(swap_response, (original_sender)(fee)(fee_collector)
                   (swap_in_denom)(swap_in_amount)(token_out_denom)(token_out_amount))
};

// return value of `getmaxfee`
struct max_fee_response {
  string max_fee_percentage;

  EOSLIB_SERIALIZE(max_fee_response, (max_fee_percentage))
};

struct attribute {
  string key;
  string value;

  EOSLIB_SERIALIZE(attribute, (key)(value))
};

// "1.0000 SYS@eosio.token"
string to_string(const extended_asset& value);

// "4,SYS@eosio.token"
string to_string(const extended_symbol& sym);

/**
    * Encodes a swap request as the memo of the token transfer that funds it.
    *   Layout: swap;<reply_id>;always;<token_out_min_amount>;<route>|<route>...
    *   with each route written <pool_id>/<precision>,<CODE>@<contract>.
    *   "always" asks the engine to call back on failure as well as success.
    *
    * @param request - the request as recorded in the active swap
    * @param reply_id - correlation identifier echoed back in `swapreply`
*/
string encode_swap_memo(const swap_request& request, uint64_t reply_id);

/**
    * Extracts token_out_amount from the engine's packed
    *   `swap_exact_amount_in_response`. Missing, truncated or non-numeric
    *   payloads fail the action with an invalid swap response error.
*/
int64_t decode_token_out_amount(const std::optional<std::vector<char>>& data);

// collector must be a well-formed, existing account name
name validate_collector(const string& account);
