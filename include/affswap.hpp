#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <optional>

#include <decimal.hpp>
#include <errors.hpp>
#include <swap_types.hpp>

using namespace eosio;
using std::string;

static constexpr char     CONTRACT_NAME[]    = "affswap";
static constexpr char     CONTRACT_VERSION[] = "0.1.0";

static constexpr decimal  TRUE_MAX_FEE       {10 * decimal::one};      // 10%
static constexpr decimal  DEFAULT_MAX_FEE    {3 * decimal::one / 2};   // 1.5%
static constexpr uint64_t SWAP_REPLY_ID      = 1;

   /**
    * The `affswap` contract wraps a token swap with an affiliate fee. A caller
    *   deposits one token, the contract deducts a caller-chosen percentage
    *   (capped by a configured ceiling) and sends it to a fee collector, and
    *   forwards the remainder to an external swap engine. When the engine reports
    *   back, the output token is paid out to the original caller.
    *
    * Swaps proceed in two steps, in separate actions :
    *   First, the caller transfers the input token to the contract (any memo); the
    *     amount is credited to the caller's deposit table. Only tokens on the
    *     accepted list (`addtoken`) are credited. Then the caller
    *     executes `swap`, which consumes the deposit, pays the fee, sends the
    *     remainder to the swap engine with the swap request encoded in the
    *     transfer memo, and records the request in the `activeswap` slot.
    *   Second, the swap engine transfers the output tokens back and calls
    *     `swapreply` with the outcome. The slot is read and cleared, and on
    *     success the output is paid out to the original caller.
    *
    * Only one swap may be in flight: the `activeswap` slot is contract-wide, not
    *   per caller. The engine is expected to run the swap and call `swapreply`
    *   as inline actions of the same transaction, so a failed swap aborts the
    *   whole transaction, fee transfer included.
    *
    * Authorization model
    * The contract account initializes the contract once, naming the swap engine
    *   account. Only that engine may deliver `swapreply`. The contract account's
    *   active permission must include its own eosio.code permission so the
    *   contract can send token transfers.
    */

CONTRACT affswap : public contract {
  public:
      using contract::contract;

      /**
          * The one-time `init` action executed by the affswap contract account
          *  records the fee ceiling and the swap engine account
          *
          * @param max_fee_percentage - decimal string in [0, 10]; 1.5 when absent
          * @param swap_engine - the account executing swaps and calling `swapreply`
          *
          * @result - attributes method, contract_name, contract_version
      */
      [[eosio::action]] std::vector<attribute> init(std::optional<string> max_fee_percentage,
                                                    name swap_engine);

      /**
          * The `swap` action consumes the sender's single deposit, deducts the
          *   affiliate fee, and dispatches the remainder to the swap engine.
          * The fee percentage is clamped into [0, max_fee_percentage]; a fee that
          *   rounds to zero emits no fee transfer.
          *
          * @param sender - the account whose deposit is swapped and who receives the output
          * @param routes - pool hops; the last hop names the output token
          * @param token_out_min_amount - minimum output, passed through to the engine
          * @param fee_percentage - decimal string, e.g. "1.5"; zero when absent
          * @param fee_collector - account receiving the fee
          *
          * @result - attributes, method = swap
      */
      [[eosio::action]] std::vector<attribute> swap(name sender, std::vector<swap_route> routes,
                                                    extended_asset token_out_min_amount,
                                                    std::optional<string> fee_percentage,
                                                    string fee_collector);

      /**
          * The `swapreply` action is delivered by the swap engine once per swap,
          *   on success and on failure. It clears the active swap; on success it
          *   pays the output to the original sender and emits `swaplog`.
          *
          * @param id - correlation identifier from the swap request memo
          * @param result - swap_success with the packed engine response, or swap_failure
          *
          * @result - summary of the completed swap
      */
      [[eosio::action]] swap_response swapreply(uint64_t id, swap_outcome result);

      /**
          * The `getmaxfee` action returns the configured fee ceiling
      */
      [[eosio::action, eosio::read_only]] max_fee_response getmaxfee();

      /**
          * The `addtoken` action executed by the affswap contract account adds
          *   a token to the list of tokens accepted as deposits. Transfers of
          *   any other token to the contract are rejected.
          *
          * @param token - symbol and issuing contract of the token
      */
      ACTION addtoken(extended_symbol token);

      /**
          * The `deltoken` action removes a token from the accepted list. Existing
          *   deposits of that token may still be refunded.
      */
      ACTION deltoken(extended_symbol token);

      /**
          * The `refund` action returns the deposit of one token made by `owner`
          *   and not yet consumed by a swap
          *
          * @param owner - depositor
          * @param token - symbol and issuing contract of the deposit
      */
      ACTION refund(name owner, extended_symbol token);

      /**
          * The `dropdeposit` action deletes a deposit row without transferring
          *   it. The tokens stay with the contract.
      */
      ACTION dropdeposit(name owner, extended_symbol token);

      /**
          * The `swaplog` action records a completed swap for off-chain observers.
          *   It is sent inline by the contract to itself and changes no state.
      */
      ACTION swaplog(name sender, name fee_collector, string fee,
                     string swap_token_in, string token_out);

      [[eosio::on_notify("*::transfer")]]
      void ontransfer(name from, name to, eosio::asset quantity, string memo);

      using swaplog_action = action_wrapper<"swaplog"_n, &affswap::swaplog>;

      // config
      TABLE config { // singleton, scoped by contract account name
        decimal max_fee_percentage;
        name swap_engine;
      };

      // version record, written by init
      TABLE contractinfo { // singleton, scoped by contract account name
        string contract_name;
        string contract_version;
      };

      // the swap in flight between `swap` and `swapreply`
      TABLE activeswap { // singleton, scoped by contract account name
        name original_sender;
        name fee_collector;
        extended_asset fee;
        swap_request swap_msg;
      };

      // tokens transferred in and not yet swapped
      TABLE deposit { // scoped on owner account name
        uint64_t id;
        extended_asset balance;

        uint64_t primary_key() const { return id; }
      };

      typedef eosio::singleton< "config"_n, config > configs;
      typedef eosio::singleton< "contractinfo"_n, contractinfo > contractinfos;
      typedef eosio::singleton< "activeswap"_n, activeswap > activeswaps;
      typedef eosio::multi_index< "deposits"_n, deposit > deposits;

      // tokens accepted as deposits
      TABLE token { // single table, scoped by contract account name
        uint64_t id;
        extended_symbol symbol;

        uint64_t primary_key() const { return id; }
      };

      typedef eosio::multi_index< "tokens"_n, token > tokens;

  private:
      config get_config();
      bool is_accepted(const extended_symbol& sym);
      deposits::const_iterator find_deposit(const deposits& deptable, const extended_symbol& sym);
      extended_asset one_coin(name owner);
      void send_transfer(name to, const extended_asset& value, const string& memo);
};
