#pragma once

#include <stdint.h>

namespace cheddarfarm {
   static constexpr uint32_t seconds_per_minute   = 60;
   static constexpr uint32_t default_round_length = seconds_per_minute; // seconds
   static constexpr uint32_t basis_points         = 10'000;             // 100%

   static constexpr const char* stake_memo         = "stake";
   static constexpr const char* boost_memo         = "boost";
   static constexpr const char* setup_deposit_memo = "setup deposit";
} // namespace cheddarfarm
