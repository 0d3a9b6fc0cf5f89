#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/system.hpp>

#include <cheddar.token/vesting.hpp>

#include <string>

namespace cheddartoken {

   using eosio::contract;
   using eosio::symbol;
   using eosio::symbol_code;
   using std::string;

   /**
    * The `cheddar.token` contract is an `eosio.token` compatible ledger. On top of the standard
    * actions the issuer can mint tokens under a vesting schedule; a vested balance can't be
    * transferred below the amount still locked.
    */
   class [[eosio::contract("cheddar.token")]] token : public contract {
    public:
      using contract::contract;

      [[eosio::action]] void create(const name& issuer, const asset& maximum_supply);

      [[eosio::action]] void issue(const name& to, const asset& quantity, const string& memo);

      [[eosio::action]] void retire(const asset& quantity, const string& memo);

      [[eosio::action]] void transfer(const name& from, const name& to, const asset& quantity, const string& memo);

      [[eosio::action]] void open(const name& owner, const symbol& symbol, const name& ram_payer);

      [[eosio::action]] void close(const name& owner, const symbol& symbol);

      /**
       * Issues `quantity` to `to`, locked until `cliff` and then released linearly until `end`.
       * An account holds at most one vesting schedule per token.
       */
      [[eosio::action]] void mintvested(const name& to, const asset& quantity, const time_point_sec& cliff,
                                        const time_point_sec& end, const string& memo);

      // returns the amount of `sym` currently locked in `owner`'s balance
      [[eosio::action]] asset getlocked(const name& owner, const symbol& sym);

      // takes back the still locked part of a vesting schedule and retires it
      [[eosio::action]] void cancelvest(const name& owner, const symbol& sym);

      static asset get_supply(const name& token_contract_account, const symbol_code& sym_code) {
         stats       statstable(token_contract_account, sym_code.raw());
         const auto& st = statstable.get(sym_code.raw());
         return st.supply;
      }

      static asset get_balance(const name& token_contract_account, const name& owner, const symbol_code& sym_code) {
         accounts    accountstable(token_contract_account, owner.value);
         const auto& ac = accountstable.get(sym_code.raw());
         return ac.balance;
      }

      using create_action     = eosio::action_wrapper<"create"_n, &token::create>;
      using issue_action      = eosio::action_wrapper<"issue"_n, &token::issue>;
      using retire_action     = eosio::action_wrapper<"retire"_n, &token::retire>;
      using transfer_action   = eosio::action_wrapper<"transfer"_n, &token::transfer>;
      using open_action       = eosio::action_wrapper<"open"_n, &token::open>;
      using close_action      = eosio::action_wrapper<"close"_n, &token::close>;
      using mintvested_action = eosio::action_wrapper<"mintvested"_n, &token::mintvested>;
      using getlocked_action  = eosio::action_wrapper<"getlocked"_n, &token::getlocked>;
      using cancelvest_action = eosio::action_wrapper<"cancelvest"_n, &token::cancelvest>;

    private:
      struct [[eosio::table]] account {
         asset balance;

         uint64_t primary_key() const { return balance.symbol.code().raw(); }
      };

      struct [[eosio::table]] currency_stats {
         asset supply;
         asset max_supply;
         name  issuer;

         uint64_t primary_key() const { return supply.symbol.code().raw(); }
      };

      typedef eosio::multi_index<"accounts"_n, account>    accounts;
      typedef eosio::multi_index<"stat"_n, currency_stats> stats;

      static time_point_sec now();

      const currency_stats& get_stats(stats& statstable, const symbol& sym);
      void                  sub_balance(const name& owner, const asset& value);
      void                  add_balance(const name& owner, const asset& value, const name& ram_payer);
      void                  check_vesting(const name& owner, const asset& value);
   };

} // namespace cheddartoken
