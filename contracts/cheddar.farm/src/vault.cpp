#include <cheddar.farm/cheddar.farm.hpp>

namespace cheddarfarm {

   void farm_contract::ping_all(farm_state& state, vault& v) {
      auto round = state.current_round(now());
      state.update_reward_acc(round);
      v.ping(state.reward_acc, round);
   }

   void farm_contract::recompute_stake(farm_state& state, vault& v) {
      auto weight = stake_weight(v.staked, state.stake_rates, v.has_boost(), state.boost_bps);
      state.adjust_weight(v.stake_weight, weight);
      v.stake_weight = weight;
   }

   vault farm_contract::new_vault(const farm_state& state, const name& owner) {
      vault v;
      v.owner      = owner;
      v.reward_acc = state.reward_acc;
      v.staked.resize(state.stake_tokens.size());
      if (state.has_boost_token())
         v.boost = asset{ 0, state.boost_token.get_symbol() };
      return v;
   }

   void farm_contract::stake(farm_state_autosave& state, const name& owner, const extended_asset& quantity) {
      check_active(*state);
      eosio::check(now() < state->farming_end, "farm is inactive: farming has ended");

      auto  i      = state->stake_token_index(quantity.get_extended_symbol());
      auto& vaults = get_vault_table();
      auto& row    = vaults.get(owner.value, "account not registered");
      vault v      = row;

      ping_all(*state, v);
      v.staked[i] += quantity.quantity.amount;
      eosio::check(v.staked[i] <= asset::max_amount, "arithmetic overflow: stake exceeds max amount");
      recompute_stake(*state, v);
      state->total_stake[i] += quantity.quantity.amount;
      vaults.modify(row, eosio::same_payer, [&](auto& r) { r = v; });

      logstake_action{ get_self(), { get_self(), active_permission } }.send(owner, quantity, v.stake_weight);
   }

   uint128_t farm_contract::unstake(const name& owner, const name& token_contract, const asset& quantity) {
      require_auth(owner);
      farm_state_autosave state{ *this };
      check_active(*state);
      eosio::check(quantity.is_valid(), "invalid quantity");
      eosio::check(quantity.amount > 0, "unstake amount must be positive");

      auto  i      = state->stake_token_index(extended_symbol{ quantity.symbol, token_contract });
      auto& vaults = get_vault_table();
      auto& row    = vaults.get(owner.value, "account not registered");
      eosio::check(quantity.amount <= row.staked[i], "insufficient stake");

      vault v = row;
      ping_all(*state, v);
      v.staked[i] -= quantity.amount;
      recompute_stake(*state, v);
      state->total_stake[i] -= quantity.amount;
      vaults.modify(row, eosio::same_payer, [&](auto& r) { r = v; });

      asset fee{ to_amount(muldiv(quantity.amount, state->fee_rate, basis_points)), quantity.symbol };
      auto  id = queue_payout(*state, owner, payout_staked, { extended_asset{ quantity - fee, token_contract } },
                             i, extended_asset{ fee, token_contract });

      logunstake_action{ get_self(), { get_self(), active_permission } }.send(
            owner, extended_asset{ quantity, token_contract }, fee, v.stake_weight, id);
      return v.stake_weight;
   }

   uint128_t farm_contract::claim(const name& owner) {
      require_auth(owner);
      farm_state_autosave state{ *this };
      check_active(*state);

      auto& vaults = get_vault_table();
      auto& row    = vaults.get(owner.value, "account not registered");
      vault v      = row;
      ping_all(*state, v);
      eosio::check(v.accrued > 0, "nothing to claim");

      std::vector<extended_asset> farmed;
      bool                        any = false;
      for (size_t i = 0; i < state->farm_tokens.size(); ++i) {
         auto& token  = state->farm_tokens[i];
         auto  amount = farmed_tokens(v.accrued, state->farm_token_rates[i]);
         farmed.push_back(extended_asset{ asset{ amount, token.get_symbol() }, token.get_contract() });
         any |= amount > 0;
      }
      eosio::check(any, "nothing to claim: accrued farm units are below one token unit");

      auto units = v.accrued;
      v.accrued  = 0;
      for (size_t i = 0; i < farmed.size(); ++i)
         state->total_harvested[i] += farmed[i].quantity.amount;
      vaults.modify(row, eosio::same_payer, [&](auto& r) { r = v; });

      auto id = queue_payout(*state, owner, payout_farmed, farmed, 0, {}, units);
      logclaim_action{ get_self(), { get_self(), active_permission } }.send(owner, units, farmed, id);
      return units;
   }

   void farm_contract::deposit_boost(farm_state_autosave& state, const name& owner, const extended_asset& quantity) {
      check_active(*state);
      eosio::check(now() < state->farming_end, "farm is inactive: farming has ended");
      eosio::check(state->has_boost_token() && quantity.get_extended_symbol() == state->boost_token,
                   "invalid boost token");

      auto& vaults = get_vault_table();
      auto& row    = vaults.get(owner.value, "account not registered");
      eosio::check(!row.has_boost(), "vault already has a boost deposited");

      vault v = row;
      ping_all(*state, v);
      v.boost = quantity.quantity;
      recompute_stake(*state, v);
      vaults.modify(row, eosio::same_payer, [&](auto& r) { r = v; });

      logstake_action{ get_self(), { get_self(), active_permission } }.send(owner, quantity, v.stake_weight);
   }

   void farm_contract::withdrawboost(const name& owner) {
      require_auth(owner);
      farm_state_autosave state{ *this };
      check_active(*state);

      auto& vaults = get_vault_table();
      auto& row    = vaults.get(owner.value, "account not registered");
      eosio::check(row.has_boost(), "no boost deposited");

      vault v = row;
      ping_all(*state, v);
      auto boost = v.boost;
      v.boost.amount = 0;
      recompute_stake(*state, v);
      vaults.modify(row, eosio::same_payer, [&](auto& r) { r = v; });

      queue_payout(*state, owner, payout_boost, { extended_asset{ boost, state->boost_token.get_contract() } });
   }

   farm_status farm_contract::status(const name& owner) {
      auto  state  = get_farm_state();
      auto& vaults = get_vault_table();
      vault v      = vaults.get(owner.value, "account not registered");

      auto round = state.current_round(now());
      v.ping(state.compute_reward_acc(round), round);

      farm_status result;
      for (size_t i = 0; i < state.stake_tokens.size(); ++i)
         result.staked.push_back(asset{ v.staked[i], state.stake_tokens[i].get_symbol() });
      result.stake_weight = v.stake_weight;
      result.accrued      = v.accrued;
      for (size_t i = 0; i < state.farm_tokens.size(); ++i)
         result.farmed.push_back(
               asset{ farmed_tokens(v.accrued, state.farm_token_rates[i]), state.farm_tokens[i].get_symbol() });
      result.boost     = v.boost;
      result.round     = round;
      result.timestamp = time_point_sec{ round_timestamp(state.farming_start.sec_since_epoch(), round,
                                                         state.round_length) };
      return result;
   }

} // namespace cheddarfarm
