#include <cheddar.farm/cheddar.farm.hpp>
#include <cheddar.token/cheddar.token.hpp>

namespace cheddarfarm {

   namespace {
      const char* payout_memo(uint8_t kind) {
         switch (kind) {
            case payout_staked: return "unstaking";
            case payout_farmed: return "farming";
            default: return "boost withdraw";
         }
      }
   } // namespace

   uint64_t farm_contract::queue_payout(farm_state& state, const name& owner, payout_kind kind,
                                        std::vector<extended_asset> quantities, uint32_t token_index,
                                        extended_asset fee, uint128_t units) {
      auto& payouts = get_payout_table();
      auto  id      = state.next_payout_id++;
      payouts.emplace(owner, [&](auto& p) {
         p.id          = id;
         p.owner       = owner;
         p.kind        = kind;
         p.token_index = token_index;
         p.quantities  = std::move(quantities);
         p.fee         = fee;
         p.units       = units;
      });
      return id;
   }

   void farm_contract::send_transfer(const extended_asset& quantity, const name& to, const std::string& memo) {
      cheddartoken::token::transfer_action transfer_act{ quantity.contract, { get_self(), active_permission } };
      transfer_act.send(get_self(), to, quantity.quantity, memo);
   }

   void farm_contract::execpayout(uint64_t payout_id) {
      farm_state_autosave state{ *this };
      auto&               payouts = get_payout_table();
      auto&               p       = payouts.get(payout_id, "payout not found");

      for (auto& q : p.quantities)
         if (q.quantity.amount > 0)
            send_transfer(q, p.owner, payout_memo(p.kind));
      if (p.kind == payout_staked)
         state->fee_collected[p.token_index] += p.fee.quantity.amount;

      logpayout_action{ get_self(), { get_self(), active_permission } }.send(p.owner, p.id, p.quantities);
      payouts.erase(p);
   }

   void farm_contract::failpayout(uint64_t payout_id) {
      farm_state_autosave state{ *this };
      auto&               payouts = get_payout_table();
      auto&               p       = payouts.get(payout_id, "payout not found");
      eosio::check(has_auth(p.owner) || has_auth(state->admin), "missing authority of " + p.owner.to_string());

      recover_payout(*state, p);
      payouts.erase(p);
   }

   void farm_contract::recover_payout(farm_state& state, const payout& p) {
      auto& vaults = get_vault_table();
      auto  it     = vaults.find(p.owner.value);
      bool  closed = it == vaults.end();

      // the vault may have been closed while the payout was pending
      vault v = closed ? new_vault(state, p.owner) : *it;
      ping_all(state, v);

      switch (p.kind) {
         case payout_staked: {
            auto amount = p.quantities[0].quantity.amount + p.fee.quantity.amount;
            v.staked[p.token_index] += amount;
            eosio::check(v.staked[p.token_index] <= asset::max_amount, "arithmetic overflow: stake exceeds max amount");
            state.total_stake[p.token_index] += amount;
            break;
         }
         case payout_farmed:
            v.accrued = checked_add(v.accrued, p.units);
            for (size_t i = 0; i < p.quantities.size(); ++i)
               state.total_harvested[i] -= p.quantities[i].quantity.amount;
            break;
         case payout_boost:
            eosio::check(!v.has_boost(), "vault already has a boost deposited, withdraw it first");
            v.boost = p.quantities[0].quantity;
            break;
         default: eosio::check(false, "bug: unknown payout kind");
      }
      recompute_stake(state, v);

      if (closed) {
         vaults.emplace(get_self(), [&](auto& r) { r = v; });
         ++state.accounts_registered;
      } else {
         vaults.modify(it, eosio::same_payer, [&](auto& r) { r = v; });
      }

      logrecover_action{ get_self(), { get_self(), active_permission } }.send(p.owner, p.id, p.kind, v.stake_weight,
                                                                            v.accrued);
   }

   void farm_contract::withdrawfees() {
      farm_state_autosave state{ *this };
      require_auth(state->admin);
      eosio::check(state->treasury.value != 0, "treasury is not set");

      bool any = false;
      for (size_t i = 0; i < state->fee_collected.size(); ++i) {
         auto amount = state->fee_collected[i];
         if (!amount)
            continue;
         auto& token = state->stake_tokens[i];
         send_transfer(extended_asset{ asset{ amount, token.get_symbol() }, token.get_contract() }, state->treasury,
                       "fee withdraw");
         state->fee_collected[i] = 0;
         any                     = true;
      }
      eosio::check(any, "no fees collected");
   }

   void farm_contract::logstake(const name& owner, const extended_asset&, uint128_t) {
      require_auth(get_self());
      require_recipient(owner);
   }

   void farm_contract::logunstake(const name& owner, const extended_asset&, const asset&, uint128_t, uint64_t) {
      require_auth(get_self());
      require_recipient(owner);
   }

   void farm_contract::logclaim(const name& owner, uint128_t, const std::vector<extended_asset>&, uint64_t) {
      require_auth(get_self());
      require_recipient(owner);
   }

   void farm_contract::logpayout(const name& owner, uint64_t, const std::vector<extended_asset>&) {
      require_auth(get_self());
      require_recipient(owner);
   }

   void farm_contract::logrecover(const name& owner, uint64_t, uint8_t, uint128_t, uint128_t) {
      require_auth(get_self());
      require_recipient(owner);
   }

} // namespace cheddarfarm
