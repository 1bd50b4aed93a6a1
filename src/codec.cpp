#include <swap_types.hpp>
#include <errors.hpp>
#include <algorithm>

string to_string(const extended_asset& value) {
  return value.quantity.to_string() + "@" + value.contract.to_string();
}

string to_string(const extended_symbol& sym) {
  return std::to_string(sym.get_symbol().precision()) + ","
         + sym.get_symbol().code().to_string() + "@" + sym.get_contract().to_string();
}

string encode_swap_memo(const swap_request& request, uint64_t reply_id) {
  string memo = "swap;" + std::to_string(reply_id) + ";always;"
                + to_string(request.token_out_min_amount) + ";";
  for (size_t i = 0; i < request.routes.size(); ++i) {
    if (i > 0) memo += "|";
    memo += std::to_string(request.routes[i].pool_id) + "/" + to_string(request.routes[i].token_out_denom);
  }
  check(memo.size() <= MAX_MEMO_SIZE, ERR_MEMO_TOO_LONG);
  return memo;
}

int64_t decode_token_out_amount(const std::optional<std::vector<char>>& data) {
  check(data.has_value(), invalid_swap_response("no data"));
  const std::vector<char>& bytes = *data;

  // varuint32 length prefix of the packed string
  uint64_t len = 0;
  size_t pos = 0;
  for (int shift = 0; ; shift += 7) {
    check(pos < bytes.size() && shift < 35, invalid_swap_response("truncated length prefix"));
    uint8_t b = bytes[pos++];
    len |= uint64_t(b & 0x7f) << shift;
    if (!(b & 0x80)) break;
  }
  check(bytes.size() - pos == len, invalid_swap_response("length mismatch"));

  string amount(bytes.begin() + pos, bytes.end());
  bool numeric = !amount.empty() && amount.size() <= 19 &&
                 std::all_of(amount.begin(), amount.end(), [](unsigned char c) { return c >= '0' && c <= '9'; });
  check(numeric, invalid_swap_response("token_out_amount is not an integer: " + amount));
  uint64_t rv = std::stoull(amount);
  check(rv <= uint64_t(asset::max_amount), invalid_swap_response("token_out_amount out of range: " + amount));
  return int64_t(rv);
}

name validate_collector(const string& account) {
  bool well_formed = !account.empty() && account.size() <= 12 &&
                     std::all_of(account.begin(), account.end(), [](char c) {
                       return c == '.' || (c >= '1' && c <= '5') || (c >= 'a' && c <= 'z');
                     });
  check(well_formed, invalid_collector(account));
  name n(account);
  // trailing dots are dropped by the name encoding
  check(n.to_string() == account, invalid_collector(account));
  check(is_account(n), invalid_collector(account));
  return n;
}
