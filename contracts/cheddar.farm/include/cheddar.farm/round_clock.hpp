#pragma once

#include <stdint.h>

namespace cheddarfarm {

   /**
    * Number of whole rounds elapsed since `start`.
    *
    * Rounds are half-open: [start, start+len) is round 0, [start+len, start+2len) is round 1, ...
    * Round 0 therefore covers both "not started" and the first round; a vault starts earning once
    * round 1 begins. After `end` the value saturates; when `end - start` is not a multiple of the
    * round length the trailing partial round still counts as one round.
    */
   inline uint64_t round_number(uint32_t start, uint32_t end, uint32_t now, uint32_t round_length) {
      if (now < start)
         return 0;
      uint64_t adjust = 0;
      if (now >= end) {
         now = end;
         if ((end - start) % round_length != 0)
            adjust = 1;
      }
      return (now - start) / round_length + adjust;
   }

   // beginning of the last fully elapsed round, as reported by status
   inline uint32_t round_timestamp(uint32_t start, uint64_t round, uint32_t round_length) {
      uint64_t r0 = round > 1 ? round - 1 : 0;
      return start + uint32_t(r0 * round_length);
   }

} // namespace cheddarfarm
