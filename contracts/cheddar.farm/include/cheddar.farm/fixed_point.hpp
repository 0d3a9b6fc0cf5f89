#pragma once

#include <eosio/check.hpp>
#include <eosio/eosio.hpp>
#include <limits>

namespace cheddarfarm {

   static constexpr uint128_t e24          = uint128_t(1'000'000'000'000ull) * 1'000'000'000'000ull;
   static constexpr uint128_t acc_overflow = 10'000'000; // 1e7, keeps precision when emission / weight < 1

   // 256-bit unsigned value as two 128-bit halves
   struct uint256_parts {
      uint128_t hi = 0;
      uint128_t lo = 0;
   };

   inline uint256_parts mul_wide(uint128_t a, uint128_t b) {
      constexpr uint128_t mask64 = std::numeric_limits<uint64_t>::max();

      uint128_t a0 = a & mask64, a1 = a >> 64;
      uint128_t b0 = b & mask64, b1 = b >> 64;

      uint128_t p00 = a0 * b0;
      uint128_t p01 = a0 * b1;
      uint128_t p10 = a1 * b0;
      uint128_t p11 = a1 * b1;

      uint128_t mid       = p01 + p10;
      uint128_t mid_carry = mid < p01 ? 1 : 0;

      uint256_parts r;
      r.lo = p00 + (mid << 64);
      r.hi = p11 + (mid >> 64) + (mid_carry << 64) + (r.lo < p00 ? 1 : 0);
      return r;
   }

   /**
    * a * b / c, rounded down, with a 256-bit intermediate product.
    * Fails when c is zero or the quotient does not fit in 128 bits.
    */
   inline uint128_t muldiv(uint128_t a, uint128_t b, uint128_t c) {
      eosio::check(c != 0, "arithmetic overflow: division by zero");
      auto p = mul_wide(a, b);
      if (p.hi == 0)
         return p.lo / c;
      eosio::check(p.hi < c, "arithmetic overflow: quotient exceeds 128 bits");

      // shift-subtract long division; rem < c holds at the top of each step
      uint128_t rem = p.hi;
      uint128_t q   = 0;
      for (int i = 127; i >= 0; --i) {
         bool top = (rem >> 127) != 0;
         rem      = (rem << 1) | ((p.lo >> i) & 1);
         q <<= 1;
         if (top || rem >= c) {
            rem -= c;
            q |= 1;
         }
      }
      return q;
   }

   inline uint128_t checked_mul(uint128_t a, uint128_t b) {
      auto p = mul_wide(a, b);
      eosio::check(p.hi == 0, "arithmetic overflow: multiplication");
      return p.lo;
   }

   inline uint128_t checked_add(uint128_t a, uint128_t b) {
      uint128_t r = a + b;
      eosio::check(r >= a, "arithmetic overflow: addition");
      return r;
   }

   inline uint128_t checked_sub(uint128_t a, uint128_t b) {
      eosio::check(a >= b, "arithmetic overflow: subtraction below zero");
      return a - b;
   }

   inline int64_t to_amount(uint128_t v) {
      eosio::check(v <= uint128_t(std::numeric_limits<int64_t>::max()), "arithmetic overflow: amount exceeds int64");
      return static_cast<int64_t>(v);
   }

   // converts farm units (or staked amounts) to a token amount at `rate` / 1e24
   inline int64_t farmed_tokens(uint128_t units, uint128_t rate) { return to_amount(muldiv(units, rate, e24)); }

} // namespace cheddarfarm
