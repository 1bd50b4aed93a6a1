#include <affswap.hpp>

std::vector<attribute> affswap::init(std::optional<string> max_fee_percentage, name swap_engine) {
  require_auth(get_self());
  configs configset(get_self(), get_self().value);
  check(!configset.exists(), ERR_ALREADY_INITIALIZED);
  check(is_account(swap_engine), "swap engine account does not exist");
  decimal max_fee = max_fee_percentage ? parse_decimal(*max_fee_percentage) : DEFAULT_MAX_FEE;
  check(max_fee >= decimal{} && max_fee <= TRUE_MAX_FEE, ERR_INVALID_MAX_FEE);

  config cfg;
  cfg.max_fee_percentage = max_fee;
  cfg.swap_engine = swap_engine;
  configset.set(cfg, get_self());
  contractinfos infoset(get_self(), get_self().value);
  infoset.set(contractinfo{CONTRACT_NAME, CONTRACT_VERSION}, get_self());
  print("affswap max fee ", to_string(max_fee), " engine ", swap_engine, "|");

  return {
    attribute{"method", "instantiate"},
    attribute{"contract_name", CONTRACT_NAME},
    attribute{"contract_version", CONTRACT_VERSION}
  };
}

std::vector<attribute> affswap::swap(name sender, std::vector<swap_route> routes,
                                     extended_asset token_out_min_amount,
                                     std::optional<string> fee_percentage,
                                     string fee_collector) {
  require_auth(sender);
  auto cfg = get_config();
  std::optional<decimal> requested;
  if (fee_percentage) {
    requested = parse_decimal(*fee_percentage);
  }

  // nothing below may be written before every check has passed
  activeswaps active(get_self(), get_self().value);
  check(!active.exists(), ERR_ACTIVE_SWAP_EXISTS);
  extended_asset coin = one_coin(sender);
  name collector = validate_collector(fee_collector);

  fee_split split = split_fee(coin.quantity.amount, requested, cfg.max_fee_percentage);
  extended_asset fee(split.fee, coin.get_extended_symbol());
  swap_request request;
  request.sender = get_self();
  request.routes = routes;
  request.token_in = extended_asset(split.remaining, coin.get_extended_symbol());
  request.token_out_min_amount = token_out_min_amount;
  string memo = encode_swap_memo(request, SWAP_REPLY_ID);

  deposits deptable(get_self(), sender.value);
  deptable.erase(deptable.begin());

  if (split.fee > 0) {
    send_transfer(collector, fee, "affiliate fee");
  }
  send_transfer(cfg.swap_engine, request.token_in, memo);

  activeswap pending;
  pending.original_sender = sender;
  pending.fee_collector = collector;
  pending.fee = fee;
  pending.swap_msg = request;
  active.set(pending, get_self());
  print("affswap swap ", to_string(request.token_in), " fee ", to_string(fee), "|");

  return { attribute{"method", "swap"} };
}

swap_response affswap::swapreply(uint64_t id, swap_outcome result) {
  auto cfg = get_config();
  require_auth(cfg.swap_engine);
  check(id == SWAP_REPLY_ID, unknown_reply_id(id));

  activeswaps active(get_self(), get_self().value);
  check(active.exists(), unexpected("no active swap"));
  activeswap pending = active.get();
  // cleared on both outcomes
  active.remove();

  if (auto failure = std::get_if<swap_failure>(&result)) {
    check(false, failed_swap(failure->reason));
  }
  const auto& success = std::get<swap_success>(result);
  int64_t amount = decode_token_out_amount(success.data);
  const auto& routes = pending.swap_msg.routes;
  check(!routes.empty(), unexpected("swap routes are empty"));
  extended_asset token_out(amount, routes.back().token_out_denom);
  const extended_asset& token_in = pending.swap_msg.token_in;

  send_transfer(pending.original_sender, token_out, "affiliate swap payout");
  swaplog_action log(get_self(), permission_level{get_self(), "active"_n});
  log.send(pending.original_sender, pending.fee_collector, to_string(pending.fee),
           to_string(token_in), to_string(token_out));

  swap_response rv;
  rv.original_sender = pending.original_sender;
  rv.fee = pending.fee.quantity.amount;
  rv.fee_collector = pending.fee_collector;
  rv.swap_in_denom = token_in.get_extended_symbol();
  rv.swap_in_amount = token_in.quantity.amount;
  rv.token_out_denom = token_out.get_extended_symbol();
  rv.token_out_amount = token_out.quantity.amount;
  return rv;
}

max_fee_response affswap::getmaxfee() {
  auto cfg = get_config();
  return max_fee_response{to_string(cfg.max_fee_percentage)};
}

void affswap::addtoken(extended_symbol token) {
  require_auth(get_self());
  check(token.get_symbol().is_valid(), "invalid symbol");
  check(is_account(token.get_contract()), "token contract does not exist");
  check(!is_accepted(token), ERR_TOKEN_EXISTS);
  tokens tokentable(get_self(), get_self().value);
  tokentable.emplace(get_self(), [&](auto& t) {
    t.id = tokentable.available_primary_key();
    t.symbol = token;
  });
  print("affswap accepts ", to_string(token), "|");
}

void affswap::deltoken(extended_symbol token) {
  require_auth(get_self());
  tokens tokentable(get_self(), get_self().value);
  for (auto itr = tokentable.begin(); itr != tokentable.end(); ++itr) {
    if (itr->symbol == token) {
      tokentable.erase(itr);
      return;
    }
  }
  check(false, ERR_TOKEN_NOT_FOUND);
}

void affswap::refund(name owner, extended_symbol token) {
  require_auth(owner);
  deposits deptable(get_self(), owner.value);
  auto itr = find_deposit(deptable, token);
  check(itr != deptable.end(), ERR_NO_DEPOSITS);
  extended_asset balance = itr->balance;
  deptable.erase(itr);
  if (balance.quantity.amount > 0) {
    send_transfer(owner, balance, "affswap refund");
  }
}

void affswap::dropdeposit(name owner, extended_symbol token) {
  require_auth(owner);
  deposits deptable(get_self(), owner.value);
  auto itr = find_deposit(deptable, token);
  check(itr != deptable.end(), ERR_NO_DEPOSITS);
  deptable.erase(itr);
}

void affswap::swaplog(name sender, name fee_collector, string fee,
                      string swap_token_in, string token_out) {
  require_auth(get_self());
}

void affswap::ontransfer(name from, name to, eosio::asset quantity, string memo) {
  if (from == get_self()) return;
  check(to == get_self(), "This transfer is not for affswap");
  auto cfg = get_config();
  // swap output, paid out by swapreply
  if (from == cfg.swap_engine) return;
  // the notifying action must carry the depositor's authority
  check(has_auth(from), unauthorized_deposit(from.to_string()));
  check(quantity.amount > 0, "transfer quantity must be positive");
  extended_asset value(quantity, get_first_receiver());
  check(is_accepted(value.get_extended_symbol()), unsupported_token(to_string(value.get_extended_symbol())));

  deposits deptable(get_self(), from.value);
  auto itr = find_deposit(deptable, value.get_extended_symbol());
  if (itr != deptable.end()) {
    deptable.modify(itr, same_payer, [&](auto& s) {
      s.balance += value;
    });
    return;
  }
  deptable.emplace(get_self(), [&](auto& s) {
    s.id = deptable.available_primary_key();
    s.balance = value;
  });
}

affswap::config affswap::get_config() {
  configs configset(get_self(), get_self().value);
  check(configset.exists(), ERR_NOT_INITIALIZED);
  return configset.get();
}

bool affswap::is_accepted(const extended_symbol& sym) {
  tokens tokentable(get_self(), get_self().value);
  for (const auto& t : tokentable) {
    if (t.symbol == sym) return true;
  }
  return false;
}

affswap::deposits::const_iterator affswap::find_deposit(const deposits& deptable, const extended_symbol& sym) {
  auto itr = deptable.begin();
  while (itr != deptable.end() && !(itr->balance.get_extended_symbol() == sym)) {
    ++itr;
  }
  return itr;
}

extended_asset affswap::one_coin(name owner) {
  deposits deptable(get_self(), owner.value);
  auto itr = deptable.begin();
  check(itr != deptable.end(), ERR_NO_FUNDS);
  auto next = itr;
  ++next;
  check(next == deptable.end(), ERR_MULTIPLE_DENOMS);
  check(itr->balance.quantity.amount > 0, ERR_NO_FUNDS);
  return itr->balance;
}

void affswap::send_transfer(name to, const extended_asset& value, const string& memo) {
  action (
    permission_level{get_self(), "active"_n},
    value.contract,
    "transfer"_n,
    std::make_tuple(get_self(), to, value.quantity, memo)
  ).send();
}
