#include <cheddar.farm/cheddar.farm.hpp>

namespace cheddarfarm {

   farm_state_autosave::farm_state_autosave(farm_contract& self, bool init_if_not_exist)
       : self{ self }, state{ self.get_farm_state_mutable(init_if_not_exist) } {}

   farm_state_autosave::~farm_state_autosave() { self.save_farm_state(); }

   farm_contract::farm_contract(name s, name code, datastream<const char*> ds) : contract(s, code, ds) {}

   farm_state_singleton& farm_contract::get_farm_state_singleton() {
      static std::optional<farm_state_singleton> sing;
      if (!sing)
         sing.emplace(get_self(), get_self().value);
      return *sing;
   }

   farm_state& farm_contract::get_farm_state_mutable(bool init_if_not_exist) {
      static std::optional<farm_state> state;
      if (!state) {
         if (init_if_not_exist && !get_farm_state_singleton().exists()) {
            state.emplace();
         } else {
            eosio::check(get_farm_state_singleton().exists(), "farm is not configured");
            state = get_farm_state_singleton().get();
         }
      }
      return *state;
   }

   const farm_state& farm_contract::get_farm_state() { return get_farm_state_mutable(); }

   void farm_contract::save_farm_state() { get_farm_state_singleton().set(get_farm_state_mutable(), get_self()); }

   vault_table& farm_contract::get_vault_table() {
      static std::optional<vault_table> table;
      if (!table)
         table.emplace(get_self(), get_self().value);
      return *table;
   }

   payout_table& farm_contract::get_payout_table() {
      static std::optional<payout_table> table;
      if (!table)
         table.emplace(get_self(), get_self().value);
      return *table;
   }

   time_point_sec farm_contract::now() { return time_point_sec(eosio::current_time_point()); }

   void farm_contract::check_active(const farm_state& state) {
      eosio::check(state.setup_finalized, "farm is inactive: setup is not finalized");
      eosio::check(state.is_active, "farm is inactive: farm is paused");
   }

   void farm_contract::cfgfarm(const std::optional<name>&                         admin,
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
                               const std::optional<name>&                         treasury) {
      bool is_first_time = !get_farm_state_singleton().exists();
      if (is_first_time)
         require_auth(get_self());
      else
         require_auth(get_farm_state().admin);
      farm_state_autosave state{ *this, true };

      if (is_first_time) {
         eosio::check(admin.has_value(), "admin is required on first use of cfgfarm");
         eosio::check(stake_tokens.has_value(), "stake_tokens is required on first use of cfgfarm");
         eosio::check(stake_rates.has_value(), "stake_rates is required on first use of cfgfarm");
         eosio::check(emission_rate.has_value(), "emission_rate is required on first use of cfgfarm");
         eosio::check(farm_tokens.has_value(), "farm_tokens is required on first use of cfgfarm");
         eosio::check(farm_token_rates.has_value(), "farm_token_rates is required on first use of cfgfarm");
         eosio::check(farming_start.has_value(), "farming_start is required on first use of cfgfarm");
         eosio::check(farming_end.has_value(), "farming_end is required on first use of cfgfarm");
         eosio::check(!stake_tokens->empty(), "stake_tokens is empty");
         eosio::check(!farm_tokens->empty(), "farm_tokens is empty");
         eosio::check(stake_rates->size() == stake_tokens->size(), "mismatched vector sizes");
         eosio::check(farm_token_rates->size() == farm_tokens->size(), "mismatched vector sizes");
         eosio::check(stake_rates->front() == e24, "stake_rates[0] must be 1e24");
         eosio::check(*emission_rate > 0, "emission_rate must be positive");

         for (size_t i = 0; i < stake_tokens->size(); ++i) {
            eosio::check(stake_tokens.value()[i].get_symbol().is_valid(), "invalid stake token symbol");
            eosio::check(stake_rates.value()[i] > 0, "stake rate must be positive");
            for (size_t j = 0; j < i; ++j)
               eosio::check(stake_tokens.value()[j] != stake_tokens.value()[i], "duplicate stake token");
         }
         for (size_t i = 0; i < farm_tokens->size(); ++i) {
            eosio::check(farm_tokens.value()[i].get_symbol().is_valid(), "invalid farm token symbol");
            eosio::check(farm_token_rates.value()[i] > 0, "farm token rate must be positive");
            for (size_t j = 0; j < i; ++j)
               eosio::check(farm_tokens.value()[j] != farm_tokens.value()[i], "duplicate farm token");
         }

         if (round_length) {
            eosio::check(*round_length > 0, "round_length must be positive");
            state->round_length = *round_length;
         }
         if (boost_token) {
            eosio::check(boost_token->get_symbol().is_valid(), "invalid boost token symbol");
            state->boost_token = *boost_token;
         }

         state->stake_tokens     = *stake_tokens;
         state->stake_rates      = *stake_rates;
         state->emission_rate    = *emission_rate;
         state->farm_tokens      = *farm_tokens;
         state->farm_token_rates = *farm_token_rates;
         state->total_stake.resize(stake_tokens->size());
         state->fee_collected.resize(stake_tokens->size());
         state->farm_deposits.resize(farm_tokens->size());
         state->total_harvested.resize(farm_tokens->size());
      } else {
         eosio::check(!stake_tokens.has_value(), "stake_tokens can't change");
         eosio::check(!stake_rates.has_value(), "stake_rates can't change");
         eosio::check(!emission_rate.has_value(), "emission_rate can't change");
         eosio::check(!farm_tokens.has_value(), "farm_tokens can't change");
         eosio::check(!farm_token_rates.has_value(), "farm_token_rates can't change");
         eosio::check(!round_length.has_value(), "round_length can't change");
         eosio::check(!boost_token.has_value(), "boost_token can't change");
      }

      if (admin) {
         eosio::check(eosio::is_account(*admin), "admin account does not exist");
         state->admin = *admin;
      }

      if (farming_start || farming_end) {
         eosio::check(!state->setup_finalized, "farming period can't change after setup is finalized");
         for (auto d : state->farm_deposits)
            eosio::check(d == 0, "farming period can't change after setup deposits");
         if (farming_start)
            state->farming_start = *farming_start;
         if (farming_end)
            state->farming_end = *farming_end;
         eosio::check(state->farming_start > now(), "farming_start must be in the future");
         eosio::check(state->farming_start < state->farming_end, "farming_start must be before farming_end");
      }

      if (boost_bps) {
         eosio::check(!state->setup_finalized, "boost_bps can't change after setup is finalized");
         eosio::check(*boost_bps <= basis_points, "boost_bps out of range");
         state->boost_bps = *boost_bps;
      }

      if (fee_rate) {
         eosio::check(*fee_rate < basis_points, "fee_rate out of range");
         state->fee_rate = *fee_rate;
      }

      if (treasury) {
         eosio::check(eosio::is_account(*treasury), "treasury account does not exist");
         state->treasury = *treasury;
      }
   } // farm_contract::cfgfarm

   void farm_contract::finalize() {
      farm_state_autosave state{ *this };
      require_auth(state->admin);
      eosio::check(!state->setup_finalized, "setup is already finalized");
      eosio::check(now().sec_since_epoch() + state->round_length < state->farming_start.sec_since_epoch(),
                   "must be finalized at least one round before farming_start");
      for (size_t i = 0; i < state->farm_deposits.size(); ++i)
         eosio::check(state->farm_deposits[i] != 0,
                      "setup deposit missing for " + state->farm_tokens[i].get_symbol().code().to_string());
      state->setup_finalized = true;
   }

   void farm_contract::setactive(bool is_active) {
      farm_state_autosave state{ *this };
      require_auth(state->admin);
      state->is_active = is_active;
   }

   void farm_contract::open(const name& owner) {
      require_auth(owner);
      farm_state_autosave state{ *this };
      auto&               vaults = get_vault_table();
      eosio::check(vaults.find(owner.value) == vaults.end(), "account already registered");
      vaults.emplace(owner, [&](auto& v) { v = new_vault(*state, owner); });
      ++state->accounts_registered;
   }

   void farm_contract::close(const name& owner) {
      require_auth(owner);
      farm_state_autosave state{ *this };
      check_active(*state);

      auto& vaults = get_vault_table();
      auto& row    = vaults.get(owner.value, "account not registered");
      vault v      = row;
      ping_all(*state, v);
      // less than one unit of every farm token can't be claimed, so it is dropped
      if (state->below_one_token(v.accrued))
         v.accrued = 0;
      eosio::check(v.empty(), "account is not empty: unstake, claim and withdraw the boost first");

      vaults.erase(row);
      --state->accounts_registered;
   }

   void farm_contract::on_transfer(const name& from, const name& to, const asset& quantity, const std::string& memo) {
      if (from == get_self() || to != get_self())
         return;
      eosio::check(quantity.amount > 0, "must transfer positive quantity");

      farm_state_autosave state{ *this };
      extended_asset      received{ quantity, get_first_receiver() };
      if (memo == stake_memo)
         stake(state, from, received);
      else if (memo == boost_memo)
         deposit_boost(state, from, received);
      else if (memo == setup_deposit_memo)
         setup_deposit(state, from, received);
      else
         eosio::check(false, "unsupported memo, expected \"stake\", \"boost\" or \"setup deposit\"");
   }

   void farm_contract::setup_deposit(farm_state_autosave& state, const name& from, const extended_asset& quantity) {
      eosio::check(from == state->admin, "only the admin can make setup deposits");
      eosio::check(!state->setup_finalized, "setup deposits must be done before setup is finalized");

      auto i = state->farm_token_index(quantity.get_extended_symbol());
      eosio::check(state->farm_deposits[i] == 0, "deposit already done for the given token");
      auto expected = state->expected_deposit(i);
      eosio::check(quantity.quantity.amount == expected,
                   "expected setup deposit of " + asset{ expected, quantity.quantity.symbol }.to_string());
      state->farm_deposits[i] = expected;
   }

} // namespace cheddarfarm
