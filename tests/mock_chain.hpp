#pragma once

#include <eosio/action.hpp>
#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <string>
#include <vector>

namespace affswap_test {

using namespace eosio;

// argument layout of eosio.token::transfer
struct transfer_args {
   name        from;
   name        to;
   asset       quantity;
   std::string memo;

   EOSLIB_SERIALIZE( transfer_args, (from)(to)(quantity)(memo) )
};

/**
 * Host side of the native tests: installs the chain intrinsics the contract
 * uses (primary-index database, authorization, account lookup, inline action
 * dispatch) on top of in-memory state. Inline actions are captured instead of
 * executed so tests can inspect what a handler scheduled.
 */
class mock_chain {
public:
   // drops all tables, accounts, authorizations and captured actions
   static void reset( name receiver );

   static void add_account( name account );

   // the only account whose authority is present for the next calls
   static void authorize( name account );

   static const std::vector<action>& sent_actions();
   static void clear_actions();

   // number of rows in a table, all scopes included
   static size_t row_count( name table );
};

}
