#pragma once

#include <eosio/asset.hpp>
#include <eosio/check.hpp>
#include <eosio/multi_index.hpp>
#include <eosio/time.hpp>

namespace cheddartoken {

   using eosio::asset;
   using eosio::name;
   using eosio::time_point_sec;

   /**
    * Amount still locked by a vesting schedule at `now`. Everything is locked before `cliff`,
    * nothing from `end` on; in between the locked amount decreases linearly, rounded down.
    */
   inline int64_t compute_amount_locked(int64_t amount, uint32_t cliff, uint32_t end, uint32_t now) {
      if (now < cliff)
         return amount;
      if (now >= end)
         return 0;
      // now < end implies cliff < end
      int128_t time_left  = end - now;
      int128_t total_time = end - cliff;
      return static_cast<int64_t>(int128_t(amount) * time_left / total_time);
   }

   // scoped by symbol code; one record per account and token
   struct [[eosio::table, eosio::contract("cheddar.token")]] vesting_record {
      name           owner;
      asset          amount;
      time_point_sec cliff;
      time_point_sec end;

      uint64_t primary_key() const { return owner.value; }

      int64_t locked_amount(time_point_sec now) const {
         return compute_amount_locked(amount.amount, cliff.sec_since_epoch(), end.sec_since_epoch(),
                                      now.sec_since_epoch());
      }

      EOSLIB_SERIALIZE(vesting_record, (owner)(amount)(cliff)(end))
   };

   typedef eosio::multi_index<"vestings"_n, vesting_record> vesting_table;

} // namespace cheddartoken
