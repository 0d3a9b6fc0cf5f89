#pragma once

#include <cheddar.farm/constants.hpp>
#include <cheddar.farm/fixed_point.hpp>
#include <vector>

namespace cheddarfarm {

   /**
    * Weight of a set of staked quantities: the scarcest asset, valued at its rate, caps the
    * weight. `staked[i]` is valued as `staked[i] * rates[i] / 1e24`.
    */
   inline uint128_t min_stake(const std::vector<int64_t>& staked, const std::vector<uint128_t>& rates) {
      eosio::check(staked.size() == rates.size(), "stake vector size mismatch");
      uint128_t min = ~uint128_t(0);
      for (size_t i = 0; i < rates.size(); ++i) {
         eosio::check(staked[i] >= 0, "negative stake");
         auto s = muldiv(uint128_t(staked[i]), rates[i], e24);
         if (s < min)
            min = s;
      }
      return rates.empty() ? 0 : min;
   }

   inline uint128_t apply_boost(uint128_t weight, uint32_t boost_bps) {
      return checked_add(weight, muldiv(weight, boost_bps, basis_points));
   }

   inline uint128_t stake_weight(const std::vector<int64_t>& staked, const std::vector<uint128_t>& rates,
                                 bool boosted, uint32_t boost_bps) {
      auto w = min_stake(staked, rates);
      return boosted ? apply_boost(w, boost_bps) : w;
   }

} // namespace cheddarfarm
