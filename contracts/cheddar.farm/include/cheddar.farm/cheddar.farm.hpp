#pragma once

#include <eosio/action.hpp>
#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/system.hpp>

#include <cheddar.farm/constants.hpp>
#include <cheddar.farm/farm_state.hpp>
#include <cheddar.farm/stake_weight.hpp>

#include <optional>
#include <string>
#include <vector>

namespace cheddarfarm {

   using eosio::contract;
   using eosio::datastream;

   class farm_contract;

   // loads the farm state on construction and writes it back when the action finishes
   struct farm_state_autosave {
      farm_contract& self;
      farm_state&    state;

      farm_state_autosave(farm_contract& self, bool init_if_not_exist = false);
      ~farm_state_autosave();

      farm_state* operator->() { return &state; }
      farm_state& operator*() { return state; }
   };

   /**
    * The `cheddar.farm` contract distributes a fixed per-round emission of farm units among
    * registered vaults, proportionally to each vault's stake weight. Farm units are paid out in
    * one or more farm tokens at configured rates.
    *
    * Rewards are settled lazily: a global accumulator tracks farm units per unit of weight and each
    * vault is credited against it whenever the vault is touched, so no action ever iterates over
    * vaults. Outbound token movements are queued as payouts which either execute or get recovered
    * back into the vault.
    */
   class [[eosio::contract("cheddar.farm")]] farm_contract : public contract {
    public:
      farm_contract(name s, name code, datastream<const char*> ds);

      /**
       * Configures the farm. The first call, authorized by the contract account, must provide the
       * token vectors, rates, emission and the farming period. Later calls are authorized by the
       * admin and may only change the period (before finalize), the admin, boost_bps, fee_rate and
       * treasury.
       */
      [[eosio::action]] void cfgfarm(const std::optional<name>&                         admin,
                                     const std::optional<std::vector<extended_symbol>>& stake_tokens,
                                     const std::optional<std::vector<uint128_t>>&       stake_rates,
                                     const std::optional<uint128_t>&                    emission_rate,
                                     const std::optional<std::vector<extended_symbol>>& farm_tokens,
                                     const std::optional<std::vector<uint128_t>>&       farm_token_rates,
                                     const std::optional<time_point_sec>&               farming_start,
                                     const std::optional<time_point_sec>&               farming_end,
                                     const std::optional<uint32_t>&                     round_length,
                                     const std::optional<extended_symbol>&              boost_token,
                                     const std::optional<uint32_t>&                     boost_bps,
                                     const std::optional<uint32_t>&                     fee_rate,
                                     const std::optional<name>&                         treasury);

      // opens the farm once every farm token deposit is in, at least one round before the start
      [[eosio::action]] void finalize();

      [[eosio::action]] void setactive(bool is_active);

      // registers a vault; the owner pays for its RAM
      [[eosio::action]] void open(const name& owner);

      // removes an empty vault, releasing its RAM
      [[eosio::action]] void close(const name& owner);

      // returns the remaining stake weight
      [[eosio::action]] uint128_t unstake(const name& owner, const name& token_contract, const asset& quantity);

      // returns the claimed farm units
      [[eosio::action]] uint128_t claim(const name& owner);

      [[eosio::action]] void withdrawboost(const name& owner);

      [[eosio::action]] farm_status status(const name& owner);

      // sends the transfers of a queued payout; anyone may run it
      [[eosio::action]] void execpayout(uint64_t payout_id);

      // reports a payout that can't be delivered and credits it back to the owner's vault
      [[eosio::action]] void failpayout(uint64_t payout_id);

      [[eosio::action]] void withdrawfees();

      // receipts, notifying the vault owner
      [[eosio::action]] void logstake(const name& owner, const extended_asset& quantity, uint128_t stake_weight);
      [[eosio::action]] void logunstake(const name& owner, const extended_asset& quantity, const asset& fee,
                                        uint128_t stake_weight, uint64_t payout_id);
      [[eosio::action]] void logclaim(const name& owner, uint128_t units, const std::vector<extended_asset>& farmed,
                                      uint64_t payout_id);
      [[eosio::action]] void logpayout(const name& owner, uint64_t payout_id,
                                       const std::vector<extended_asset>& quantities);
      [[eosio::action]] void logrecover(const name& owner, uint64_t payout_id, uint8_t kind,
                                        uint128_t stake_weight, uint128_t accrued);

      [[eosio::on_notify("*::transfer")]] void on_transfer(const name& from, const name& to, const asset& quantity,
                                                           const std::string& memo);

      using logstake_action   = eosio::action_wrapper<"logstake"_n, &farm_contract::logstake>;
      using logunstake_action = eosio::action_wrapper<"logunstake"_n, &farm_contract::logunstake>;
      using logclaim_action   = eosio::action_wrapper<"logclaim"_n, &farm_contract::logclaim>;
      using logpayout_action  = eosio::action_wrapper<"logpayout"_n, &farm_contract::logpayout>;
      using logrecover_action = eosio::action_wrapper<"logrecover"_n, &farm_contract::logrecover>;

      static constexpr eosio::name active_permission{ "active"_n };

    private:
      friend struct farm_state_autosave;

      farm_state_singleton& get_farm_state_singleton();
      farm_state&           get_farm_state_mutable(bool init_if_not_exist = false);
      const farm_state&     get_farm_state();
      void                  save_farm_state();
      vault_table&          get_vault_table();
      payout_table&         get_payout_table();

      static time_point_sec now();
      void                  check_active(const farm_state& state);

      // settles `v` against the accumulator at the current round
      void ping_all(farm_state& state, vault& v);
      void recompute_stake(farm_state& state, vault& v);
      vault new_vault(const farm_state& state, const name& owner);

      void stake(farm_state_autosave& state, const name& owner, const extended_asset& quantity);
      void deposit_boost(farm_state_autosave& state, const name& owner, const extended_asset& quantity);
      void setup_deposit(farm_state_autosave& state, const name& from, const extended_asset& quantity);

      uint64_t queue_payout(farm_state& state, const name& owner, payout_kind kind,
                            std::vector<extended_asset> quantities, uint32_t token_index = 0,
                            extended_asset fee = {}, uint128_t units = 0);
      void     send_transfer(const extended_asset& quantity, const name& to, const std::string& memo);
      void     recover_payout(farm_state& state, const payout& p);
   };

} // namespace cheddarfarm
