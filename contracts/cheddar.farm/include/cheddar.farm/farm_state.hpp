#pragma once

#include <eosio/asset.hpp>
#include <eosio/multi_index.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <cheddar.farm/constants.hpp>
#include <cheddar.farm/fixed_point.hpp>
#include <cheddar.farm/round_clock.hpp>

namespace cheddarfarm {

   using eosio::asset;
   using eosio::extended_asset;
   using eosio::extended_symbol;
   using eosio::name;
   using eosio::time_point_sec;

   struct [[eosio::table("farmstate"), eosio::contract("cheddar.farm")]] farm_state {
      name                         admin;
      bool                         is_active       = true;
      bool                         setup_finalized = false;
      std::vector<extended_symbol> stake_tokens;     // first stake token carries rate 1e24
      std::vector<uint128_t>       stake_rates;      // stake token -> stake units, scaled by 1e24
      std::vector<extended_symbol> farm_tokens;      // tokens paid out for farm units
      std::vector<uint128_t>       farm_token_rates; // farm unit -> farm token, scaled by 1e24
      uint128_t                    emission_rate = 0; // farm units emitted per round
      time_point_sec               farming_start;
      time_point_sec               farming_end; // first second with no farming
      uint32_t                     round_length = default_round_length;
      extended_symbol              boost_token;
      uint32_t                     boost_bps = 0; // weight bonus for a deposited boost token
      uint32_t                     fee_rate  = 0; // charged on unstake, basis points
      name                         treasury;

      uint128_t            total_weight     = 0; // sum of all vaults' stake_weight
      uint128_t            reward_acc       = 0; // farm units per weight unit, times acc_overflow
      uint64_t             reward_acc_round = 0; // round at which reward_acc was last advanced
      std::vector<int64_t> total_stake;          // per stake token
      std::vector<int64_t> farm_deposits;        // per farm token, setup deposits received
      std::vector<int64_t> total_harvested;      // per farm token, claimed by vaults
      std::vector<int64_t> fee_collected;        // per stake token, not yet sent to treasury
      uint64_t             accounts_registered = 0;
      uint64_t             next_payout_id      = 0;

      uint64_t current_round(time_point_sec now) const {
         return round_number(farming_start.sec_since_epoch(), farming_end.sec_since_epoch(), now.sec_since_epoch(),
                             round_length);
      }

      uint64_t total_rounds() const { return current_round(farming_end); }

      // farm tokens required up front so every round can be paid
      int64_t expected_deposit(size_t farm_token_index) const {
         auto units = checked_mul(total_rounds(), emission_rate);
         return farmed_tokens(units, farm_token_rates[farm_token_index]);
      }

      // true when `units` convert to zero of every farm token
      bool below_one_token(uint128_t units) const {
         for (auto rate : farm_token_rates)
            if (farmed_tokens(units, rate) > 0)
               return false;
         return true;
      }

      // the accumulator value at `round`; nothing is attributed to rounds without weight
      uint128_t compute_reward_acc(uint64_t round) const {
         if (reward_acc_round == round || total_weight == 0)
            return reward_acc;
         eosio::check(round > reward_acc_round, "bug: round moved backwards");
         auto emitted = checked_mul(round - reward_acc_round, emission_rate);
         return checked_add(reward_acc, muldiv(emitted, acc_overflow, total_weight));
      }

      void update_reward_acc(uint64_t round) {
         auto new_acc = compute_reward_acc(round);
         // with no weight the round pointer must still move, otherwise the idle rounds would be
         // credited to whoever stakes next
         if (total_weight == 0 || new_acc != reward_acc) {
            reward_acc       = new_acc;
            reward_acc_round = round;
         }
      }

      // applies a vault's weight change; callers settle the vault first
      void adjust_weight(uint128_t old_weight, uint128_t new_weight) {
         if (new_weight > old_weight)
            total_weight = checked_add(total_weight, new_weight - old_weight);
         else
            total_weight = checked_sub(total_weight, old_weight - new_weight);
      }

      size_t stake_token_index(const extended_symbol& token) const {
         for (size_t i = 0; i < stake_tokens.size(); ++i)
            if (stake_tokens[i] == token)
               return i;
         eosio::check(false, "invalid stake token");
         return 0;
      }

      size_t farm_token_index(const extended_symbol& token) const {
         for (size_t i = 0; i < farm_tokens.size(); ++i)
            if (farm_tokens[i] == token)
               return i;
         eosio::check(false, "invalid farm token");
         return 0;
      }

      bool has_boost_token() const { return boost_token.get_contract().value != 0; }

      EOSLIB_SERIALIZE(farm_state, (admin)(is_active)(setup_finalized)(stake_tokens)(stake_rates)(farm_tokens)(
                                         farm_token_rates)(emission_rate)(farming_start)(farming_end)(round_length)(
                                         boost_token)(boost_bps)(fee_rate)(treasury)(total_weight)(reward_acc)(
                                         reward_acc_round)(total_stake)(farm_deposits)(total_harvested)(
                                         fee_collected)(accounts_registered)(next_payout_id))
   };

   typedef eosio::singleton<"farmstate"_n, farm_state> farm_state_singleton;

   struct [[eosio::table, eosio::contract("cheddar.farm")]] vault {
      name                 owner;
      std::vector<int64_t> staked;           // per stake token
      uint128_t            stake_weight = 0; // memoized result of stake_weight()
      uint128_t            reward_acc   = 0; // farm_state::reward_acc at the last settlement
      uint128_t            accrued      = 0; // farm units not yet claimed
      asset                boost;            // deposited boost token; zero when none

      uint64_t primary_key() const { return owner.value; }

      bool has_boost() const { return boost.amount > 0; }

      bool empty() const {
         for (auto s : staked)
            if (s)
               return false;
         return accrued == 0 && !has_boost();
      }

      /**
       * Credits the rewards earned since the last settlement. Repeated calls within a round are
       * no-ops since reward_acc only moves on a round transition.
       */
      void ping(uint128_t current_acc, uint64_t round) {
         if (round == 0 || reward_acc >= current_acc)
            return;
         accrued    = checked_add(accrued, muldiv(stake_weight, current_acc - reward_acc, acc_overflow));
         reward_acc = current_acc;
      }

      EOSLIB_SERIALIZE(vault, (owner)(staked)(stake_weight)(reward_acc)(accrued)(boost))
   };

   typedef eosio::multi_index<"vaults"_n, vault> vault_table;

   enum payout_kind : uint8_t {
      payout_staked = 0,
      payout_farmed = 1,
      payout_boost  = 2,
   };

   // an outbound transfer already debited from a vault, waiting for execpayout or failpayout
   struct [[eosio::table, eosio::contract("cheddar.farm")]] payout {
      uint64_t                    id;
      name                        owner;
      uint8_t                     kind        = payout_staked;
      uint32_t                    token_index = 0; // payout_staked: index into stake_tokens
      std::vector<extended_asset> quantities;      // sent to owner
      extended_asset              fee;             // payout_staked: kept for the treasury
      uint128_t                   units = 0;       // payout_farmed: farm units reserved from accrued

      uint64_t primary_key() const { return id; }

      EOSLIB_SERIALIZE(payout, (id)(owner)(kind)(token_index)(quantities)(fee)(units))
   };

   typedef eosio::multi_index<"payouts"_n, payout> payout_table;

   // returned by the status action
   struct farm_status {
      std::vector<asset> staked;
      uint128_t          stake_weight = 0;
      uint128_t          accrued      = 0; // farm units
      std::vector<asset> farmed;           // accrued converted to each farm token
      asset              boost;
      uint64_t           round = 0;
      time_point_sec     timestamp; // start of the last completed round

      EOSLIB_SERIALIZE(farm_status, (staked)(stake_weight)(accrued)(farmed)(boost)(round)(timestamp))
   };

} // namespace cheddarfarm
