#include <cheddar.token/cheddar.token.hpp>

namespace cheddartoken {

   time_point_sec token::now() { return time_point_sec(eosio::current_time_point()); }

   void token::create(const name& issuer, const asset& maximum_supply) {
      require_auth(get_self());

      auto sym = maximum_supply.symbol;
      eosio::check(sym.is_valid(), "invalid symbol name");
      eosio::check(maximum_supply.is_valid(), "invalid supply");
      eosio::check(maximum_supply.amount > 0, "max-supply must be positive");

      stats statstable(get_self(), sym.code().raw());
      eosio::check(statstable.find(sym.code().raw()) == statstable.end(), "token with symbol already exists");

      statstable.emplace(get_self(), [&](auto& s) {
         s.supply.symbol = maximum_supply.symbol;
         s.max_supply    = maximum_supply;
         s.issuer        = issuer;
      });
   }

   const token::currency_stats& token::get_stats(stats& statstable, const symbol& sym) {
      eosio::check(sym.is_valid(), "invalid symbol name");
      const auto& st = statstable.get(sym.code().raw(), "token with symbol does not exist");
      eosio::check(sym == st.supply.symbol, "symbol precision mismatch");
      return st;
   }

   void token::issue(const name& to, const asset& quantity, const string& memo) {
      eosio::check(memo.size() <= 256, "memo has more than 256 bytes");

      stats statstable(get_self(), quantity.symbol.code().raw());
      auto& st = get_stats(statstable, quantity.symbol);
      eosio::check(to == st.issuer, "tokens can only be issued to issuer account");

      require_auth(st.issuer);
      eosio::check(quantity.is_valid(), "invalid quantity");
      eosio::check(quantity.amount > 0, "must issue positive quantity");
      eosio::check(quantity.amount <= st.max_supply.amount - st.supply.amount, "quantity exceeds available supply");

      statstable.modify(st, eosio::same_payer, [&](auto& s) { s.supply += quantity; });
      add_balance(st.issuer, quantity, st.issuer);
   }

   void token::retire(const asset& quantity, const string& memo) {
      eosio::check(memo.size() <= 256, "memo has more than 256 bytes");

      stats statstable(get_self(), quantity.symbol.code().raw());
      auto& st = get_stats(statstable, quantity.symbol);

      require_auth(st.issuer);
      eosio::check(quantity.is_valid(), "invalid quantity");
      eosio::check(quantity.amount > 0, "must retire positive quantity");

      statstable.modify(st, eosio::same_payer, [&](auto& s) { s.supply -= quantity; });
      sub_balance(st.issuer, quantity);
      check_vesting(st.issuer, quantity);
   }

   void token::transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
      eosio::check(from != to, "cannot transfer to self");
      require_auth(from);
      eosio::check(eosio::is_account(to), "to account does not exist");

      stats statstable(get_self(), quantity.symbol.code().raw());
      get_stats(statstable, quantity.symbol);

      require_recipient(from);
      require_recipient(to);

      eosio::check(quantity.is_valid(), "invalid quantity");
      eosio::check(quantity.amount > 0, "must transfer positive quantity");
      eosio::check(memo.size() <= 256, "memo has more than 256 bytes");

      auto payer = has_auth(to) ? to : from;

      sub_balance(from, quantity);
      check_vesting(from, quantity);
      add_balance(to, quantity, payer);
   }

   void token::mintvested(const name& to, const asset& quantity, const time_point_sec& cliff,
                          const time_point_sec& end, const string& memo) {
      eosio::check(memo.size() <= 256, "memo has more than 256 bytes");
      eosio::check(eosio::is_account(to), "to account does not exist");

      stats statstable(get_self(), quantity.symbol.code().raw());
      auto& st = get_stats(statstable, quantity.symbol);

      require_auth(st.issuer);
      eosio::check(quantity.is_valid(), "invalid quantity");
      eosio::check(quantity.amount > 0, "vesting amount must be positive");
      eosio::check(cliff <= end, "cliff can't be later than the vesting end");
      eosio::check(quantity.amount <= st.max_supply.amount - st.supply.amount, "quantity exceeds available supply");

      vesting_table vestings(get_self(), quantity.symbol.code().raw());
      eosio::check(vestings.find(to.value) == vestings.end(), "account already has a vesting schedule");
      vestings.emplace(st.issuer, [&](auto& v) {
         v.owner  = to;
         v.amount = quantity;
         v.cliff  = cliff;
         v.end    = end;
      });

      statstable.modify(st, eosio::same_payer, [&](auto& s) { s.supply += quantity; });
      add_balance(to, quantity, st.issuer);
      require_recipient(to);
   }

   asset token::getlocked(const name& owner, const symbol& sym) {
      stats statstable(get_self(), sym.code().raw());
      get_stats(statstable, sym);

      vesting_table vestings(get_self(), sym.code().raw());
      auto          it = vestings.find(owner.value);
      if (it == vestings.end())
         return asset{ 0, sym };
      return asset{ it->locked_amount(now()), sym };
   }

   void token::cancelvest(const name& owner, const symbol& sym) {
      stats statstable(get_self(), sym.code().raw());
      auto& st = get_stats(statstable, sym);
      require_auth(st.issuer);

      vesting_table vestings(get_self(), sym.code().raw());
      auto&         v = vestings.get(owner.value, "account has no vesting schedule");
      asset         locked{ v.locked_amount(now()), sym };
      eosio::check(locked.amount > 0, "nothing left locked");
      vestings.erase(v);

      statstable.modify(st, eosio::same_payer, [&](auto& s) { s.supply -= locked; });
      sub_balance(owner, locked);
      require_recipient(owner);
   }

   void token::check_vesting(const name& owner, const asset& value) {
      vesting_table vestings(get_self(), value.symbol.code().raw());
      auto          it = vestings.find(owner.value);
      if (it == vestings.end())
         return;

      auto locked = it->locked_amount(now());
      if (!locked) {
         vestings.erase(it);
         return;
      }
      accounts acnts(get_self(), owner.value);
      auto&    acnt = acnts.get(value.symbol.code().raw(), "no balance object found");
      eosio::check(acnt.balance.amount >= locked,
                   "vesting violation: " + asset{ locked, value.symbol }.to_string() + " is still locked");
   }

   void token::sub_balance(const name& owner, const asset& value) {
      accounts from_acnts(get_self(), owner.value);

      const auto& from = from_acnts.get(value.symbol.code().raw(), "no balance object found");
      eosio::check(from.balance.amount >= value.amount, "overdrawn balance");

      from_acnts.modify(from, eosio::same_payer, [&](auto& a) { a.balance -= value; });
   }

   void token::add_balance(const name& owner, const asset& value, const name& ram_payer) {
      accounts to_acnts(get_self(), owner.value);
      auto     to = to_acnts.find(value.symbol.code().raw());
      if (to == to_acnts.end()) {
         to_acnts.emplace(ram_payer, [&](auto& a) { a.balance = value; });
      } else {
         to_acnts.modify(to, eosio::same_payer, [&](auto& a) { a.balance += value; });
      }
   }

   void token::open(const name& owner, const symbol& symbol, const name& ram_payer) {
      require_auth(ram_payer);
      eosio::check(eosio::is_account(owner), "owner account does not exist");

      auto        sym_code_raw = symbol.code().raw();
      stats       statstable(get_self(), sym_code_raw);
      const auto& st = statstable.get(sym_code_raw, "symbol does not exist");
      eosio::check(st.supply.symbol == symbol, "symbol precision mismatch");

      accounts acnts(get_self(), owner.value);
      if (acnts.find(sym_code_raw) == acnts.end())
         acnts.emplace(ram_payer, [&](auto& a) { a.balance = asset{ 0, symbol }; });
   }

   void token::close(const name& owner, const symbol& symbol) {
      require_auth(owner);
      accounts acnts(get_self(), owner.value);
      auto     it = acnts.find(symbol.code().raw());
      eosio::check(it != acnts.end(), "Balance row already deleted or never existed. Action won't have any effect.");
      eosio::check(it->balance.amount == 0, "Cannot close because the balance is not zero.");
      acnts.erase(it);
   }

} // namespace cheddartoken
