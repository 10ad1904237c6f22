#pragma once

#include <synth.pool/synth.pool.db.hpp>

#include <algorithm>
#include <limits>

namespace synthfi { namespace policy {

// 抵押健康度
enum health_tier: uint8_t {
   LIQUIDATABLE         = 1,
   WARNING              = 2,
   HEALTHY              = 3
};

static constexpr uint64_t INFINITE_RATIO = std::numeric_limits<uint64_t>::max();

inline bool validate(const policy_conf& conf) {
   return conf.tier1 > 0
       && conf.tier2 > conf.tier1
       && conf.tier2 <= RATE_SCALE
       && conf.base_rate <= conf.rate1
       && conf.rate1 <= conf.max_rate
       && conf.user_liquidation_ratio > 0
       && conf.user_liquidation_ratio < conf.user_healthy_ratio
       && conf.lp_liquidation_ratio > 0
       && conf.lp_liquidation_ratio < conf.lp_healthy_ratio;
}

/**
 * Piecewise-linear annual rate (bps) for a utilization (bps):
 * base up to tier1, base -> rate1 over [tier1, tier2], rate1 -> max over [tier2, 100%], max above.
 */
inline uint64_t interest_rate(const policy_conf& conf, uint64_t util_bps) {
   if (util_bps <= conf.tier1)
      return conf.base_rate;

   if (util_bps <= conf.tier2)
      return conf.base_rate + (conf.rate1 - conf.base_rate) * (util_bps - conf.tier1) / (conf.tier2 - conf.tier1);

   if (util_bps >= RATE_SCALE)
      return conf.max_rate;

   return conf.rate1 + (conf.max_rate - conf.rate1) * (util_bps - conf.tier2) / (RATE_SCALE - conf.tier2);
}

inline int64_t required_collateral(int64_t exposure_value, uint64_t ratio) {
   if (exposure_value <= 0) return 0;
   return (int64_t)((int128_t)exposure_value * ratio / RATE_SCALE);
}

// (collateral - debt) / exposure，bps
inline uint64_t collateral_ratio(int64_t collateral, int64_t debt, int64_t exposure_value) {
   if (exposure_value <= 0) return INFINITE_RATIO;
   if (collateral <= debt) return 0;
   int128_t ratio = (int128_t)(collateral - debt) * RATE_SCALE / exposure_value;
   return ratio > (int128_t)INFINITE_RATIO ? INFINITE_RATIO : (uint64_t)ratio;
}

inline health_tier health(uint64_t current_ratio, uint64_t healthy_ratio, uint64_t liquidation_ratio) {
   if (current_ratio < liquidation_ratio) return LIQUIDATABLE;
   if (current_ratio < healthy_ratio) return WARNING;
   return HEALTHY;
}

inline health_tier health_of(int64_t collateral, int64_t debt, int64_t exposure_value,
                             uint64_t healthy_ratio, uint64_t liquidation_ratio) {
   if (exposure_value <= 0) return HEALTHY;
   return health(collateral_ratio(collateral, debt, exposure_value), healthy_ratio, liquidation_ratio);
}

inline uint64_t utilization_bps(int64_t utilized, int64_t committed) {
   if (utilized <= 0) return 0;
   if (committed <= 0) return RATE_SCALE;
   return (uint64_t)((int128_t)utilized * RATE_SCALE / committed);
}

inline int64_t available_liquidity(int64_t committed, int64_t pending_add, int64_t pending_reduce, int64_t utilized) {
   int64_t avl = committed + pending_add - pending_reduce - utilized;
   return std::max<int64_t>(avl, 0);
}

// index * (1 + rate * elapsed / year)
inline uint128_t accrue_index(uint128_t index, uint64_t rate_bps, uint32_t elapsed_sec) {
   if (rate_bps == 0 || elapsed_sec == 0) return index;
   return index + index * rate_bps * elapsed_sec / ((uint128_t)RATE_SCALE * SECONDS_PER_YEAR);
}

} } // namespace synthfi::policy
