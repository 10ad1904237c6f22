#pragma once

#include <eosio/eosio.hpp>
#include <limits>

namespace synthfi { namespace safemath {

   template<typename Int, typename LargerInt>
   Int narrow(LargerInt v) {
      eosio::check(v >= std::numeric_limits<Int>::min() && v <= std::numeric_limits<Int>::max(),
                   "overflow exception of safemath");
      return static_cast<Int>(v);
   }

   // a * b / c，向零取整
   inline int64_t mul_div(int64_t a, int64_t b, int64_t c) {
      eosio::check(c != 0, "divide by zero");
      return narrow<int64_t, int128_t>((int128_t)a * b / c);
   }

   inline int64_t multiply_decimal64(int64_t a, int64_t b, int64_t precision) {
      return mul_div(a, b, precision);
   }

   // 指数差值换算：amount * (idx_now - idx_last) / precision
   inline int64_t mul_index(int64_t amount, uint128_t idx_now, uint128_t idx_last, uint128_t precision) {
      if (amount <= 0 || idx_now <= idx_last) return 0;
      uint128_t v = (uint128_t)amount * (idx_now - idx_last) / precision;
      eosio::check(v <= (uint128_t)std::numeric_limits<int64_t>::max(), "overflow exception of safemath");
      return static_cast<int64_t>(v);
   }

} } //safemath
