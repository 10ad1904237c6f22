#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

namespace synthfi {

using namespace eosio;

// =====================================================
// 常量
// =====================================================
static constexpr uint64_t RATE_SCALE        = 10'000;                            // basis points
static constexpr uint32_t SECONDS_PER_YEAR  = 31'536'000;                        // 365 days
static constexpr uint128_t HIGH_PRECISION   = 1'000'000'000'000'000'000ULL;      // 1e18

#define TBL struct [[eosio::table, eosio::contract("synth.pool")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("synth.pool")]]

// 池子/周期状态
enum class cycle_status: uint8_t {
   ACTIVE               = 0,
   OFFCHAIN             = 1,      // REBALANCING_OFFCHAIN
   ONCHAIN              = 2,      // REBALANCING_ONCHAIN
   HALTED               = 3,
   SETTLED              = 4       // 仅用于周期记录
};

// 用户挂单
enum class request_kind: uint8_t {
   NONE                 = 0,
   DEPOSIT              = 1,
   REDEEM               = 2,
   LIQUIDATE            = 3
};

// LP 挂单
enum class lp_request_kind: uint8_t {
   NONE                 = 0,
   ADD                  = 1,
   REDUCE               = 2,
   LIQUIDATE            = 3
};

// 利率曲线与抵押率参数（bps）
struct policy_conf {
    uint64_t            base_rate               = 600;          // tier1 以下
    uint64_t            rate1                   = 1200;         // tier2 处
    uint64_t            max_rate                = 6000;         // 100% 利用率处
    uint64_t            tier1                   = 5000;
    uint64_t            tier2                   = 8000;
    uint64_t            user_healthy_ratio      = 2000;
    uint64_t            user_liquidation_ratio  = 1250;
    uint64_t            lp_healthy_ratio        = 3000;
    uint64_t            lp_liquidation_ratio    = 2000;

    EOSLIB_SERIALIZE( policy_conf, (base_rate)(rate1)(max_rate)(tier1)(tier2)
                                   (user_healthy_ratio)(user_liquidation_ratio)
                                   (lp_healthy_ratio)(lp_liquidation_ratio) )
};

// =====================================================
// 全局配置
// =====================================================
NTBL("global") global_t {
    name                admin;
    name                oracle_contract;
    name                oracle_code;                            // 预言机中的资产代码
    extended_symbol     reserve;                                // 储备币，如 6,USDT@usdt.token
    extended_symbol     synth;                                  // 合成资产，如 6,XAAPL@synth.token
    uint32_t            cycle_length_sec        = 86400;
    uint32_t            rebalance_length_sec    = 3600;
    uint32_t            halt_threshold_sec      = 21600;
    uint32_t            price_stale_sec         = 600;
    uint64_t            price_tolerance_bp      = 2000;         // 结算价偏离容忍度
    uint64_t            protocol_fee_bp         = 1000;         // 利息抽成
    uint64_t            max_liquidation_bp      = 3000;         // 单次清算上限
    policy_conf         policy;
    bool                enabled                 = false;

    EOSLIB_SERIALIZE( global_t, (admin)(oracle_contract)(oracle_code)(reserve)(synth)
                                (cycle_length_sec)(rebalance_length_sec)(halt_threshold_sec)(price_stale_sec)
                                (price_tolerance_bp)(protocol_fee_bp)(max_liquidation_bp)
                                (policy)(enabled) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

// =====================================================
// 池子状态
// =====================================================
NTBL("poolstate") pool_state_t {
    uint64_t            cycle_index             = 0;
    uint8_t             status                  = (uint8_t)cycle_status::ACTIVE;
    time_point_sec      status_updated_at;

    // 当前周期挂单汇总
    asset               cycle_deposits;                         // 储备
    asset               cycle_deposit_collateral;               // 储备
    asset               cycle_redeem_shares;                    // 合成资产份额（赎回 + 清算）
    asset               pending_add;                            // LP 待增加
    asset               pending_reduce;                         // LP 待减少

    // LP
    asset               total_committed;
    asset               total_lp_collateral;
    uint64_t            active_lp_count         = 0;

    // 用户
    asset               total_shares;                           // 已结算的合成资产份额
    asset               total_principal;
    asset               total_user_collateral;

    // 现金桶
    asset               backing_reserve;                        // 无 LP 周期留存
    asset               redemption_reserve;                     // 已结算待领取的赎回

    // 利息
    uint128_t           interest_index          = HIGH_PRECISION;
    uint128_t           settled_index           = HIGH_PRECISION;   // 上一个已结算周期的指数
    time_point_sec      interest_updated_at;
    uint64_t            interest_rate_bp        = 0;
    asset               interest_realized;                      // 用户实际支付的利息
    asset               interest_paid;                          // 已付给 LP/协议的利息
    asset               protocol_fees;                          // 协议待领取

    // 拆股
    uint64_t            split_multiplier;
    uint64_t            price_multiplier;                       // pricescaled 代币：预言机价格折回拆股前单位
    uint64_t            handled_split_id        = 0;
    asset               last_price;                             // 上一次结算价

    // 熔断
    time_point_sec      halted_at;
    asset               halt_price;
    asset               halt_reserve;
    asset               halt_shares;

    EOSLIB_SERIALIZE( pool_state_t, (cycle_index)(status)(status_updated_at)
                                    (cycle_deposits)(cycle_deposit_collateral)(cycle_redeem_shares)
                                    (pending_add)(pending_reduce)
                                    (total_committed)(total_lp_collateral)(active_lp_count)
                                    (total_shares)(total_principal)(total_user_collateral)
                                    (backing_reserve)(redemption_reserve)
                                    (interest_index)(settled_index)(interest_updated_at)(interest_rate_bp)
                                    (interest_realized)(interest_paid)(protocol_fees)
                                    (split_multiplier)(price_multiplier)(handled_split_id)(last_price)
                                    (halted_at)(halt_price)(halt_reserve)(halt_shares) )
};
typedef eosio::singleton< "poolstate"_n, pool_state_t > pool_state_singleton;

// =====================================================
// 周期记录，永不删除
// =====================================================
TBL cycle_t {
    uint64_t            index;
    uint8_t             status                  = (uint8_t)cycle_status::ACTIVE;
    time_point_sec      started_at;
    time_point_sec      offchain_at;
    time_point_sec      onchain_at;
    time_point_sec      finalized_at;

    asset               settlement_price;
    asset               session_high;                           // onchain 时的当日区间
    asset               session_low;
    uint64_t            multiplier              = 0;            // 结算时的拆股倍数
    uint128_t           interest_index          = 0;            // offchain 时快照

    asset               deposits;
    asset               deposit_collateral;
    asset               redeem_shares;
    asset               redeem_value;

    asset               net_flow;                               // >0 池子付给 LP，<0 LP 补足
    asset               settled_flow;
    asset               lp_interest;                            // LP 应得利息
    asset               settled_interest;
    asset               protocol_fee;

    uint64_t            lp_count                = 0;
    uint64_t            settled_lp_count        = 0;
    bool                deviation_resolved      = false;
    uint64_t            split_num               = 0;
    uint64_t            split_den               = 0;

    cycle_t() {}
    cycle_t(const uint64_t& i): index(i) {}

    uint64_t primary_key() const { return index; }

    typedef eosio::multi_index< "cycles"_n, cycle_t > tbl_t;

    EOSLIB_SERIALIZE( cycle_t, (index)(status)(started_at)(offchain_at)(onchain_at)(finalized_at)
                               (settlement_price)(session_high)(session_low)(multiplier)(interest_index)
                               (deposits)(deposit_collateral)(redeem_shares)(redeem_value)
                               (net_flow)(settled_flow)(lp_interest)(settled_interest)(protocol_fee)
                               (lp_count)(settled_lp_count)(deviation_resolved)(split_num)(split_den) )
};

// =====================================================
// 用户
// =====================================================
TBL request_t {
    name                owner;
    uint8_t             kind                    = (uint8_t)request_kind::NONE;
    asset               amount;                                 // DEPOSIT: 储备；REDEEM/LIQUIDATE: 合成资产份额
    asset               collateral;
    name                target;                                 // LIQUIDATE 对象
    uint64_t            cycle                   = 0;
    time_point_sec      created_at;

    request_t() {}
    request_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index< "requests"_n, request_t > tbl_t;

    EOSLIB_SERIALIZE( request_t, (owner)(kind)(amount)(collateral)(target)(cycle)(created_at) )
};

TBL position_t {
    name                owner;
    asset               shares;                                 // 合成资产份额（拆股前单位）
    asset               principal;
    asset               collateral;
    uint128_t           interest_index          = 0;            // 上次结算指数（加仓时加权）
    time_point_sec      updated_at;

    position_t() {}
    position_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index< "positions"_n, position_t > tbl_t;

    EOSLIB_SERIALIZE( position_t, (owner)(shares)(principal)(collateral)(interest_index)(updated_at) )
};

// 同一目标只保留一笔清算
TBL liquidation_t {
    name                target;
    name                liquidator;
    asset               shares;
    uint64_t            cycle                   = 0;

    uint64_t primary_key() const { return target.value; }

    typedef eosio::multi_index< "liquidations"_n, liquidation_t > tbl_t;

    EOSLIB_SERIALIZE( liquidation_t, (target)(liquidator)(shares)(cycle) )
};

// =====================================================
// LP
// =====================================================
TBL lp_t {
    name                owner;
    asset               committed;
    asset               collateral;
    asset               accrued_interest;
    asset               claimed_interest;
    uint64_t            rebalanced_cycle        = 0;
    asset               last_flow;
    asset               last_interest;
    time_point_sec      created_at;

    lp_t() {}
    lp_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index< "lps"_n, lp_t > tbl_t;

    EOSLIB_SERIALIZE( lp_t, (owner)(committed)(collateral)(accrued_interest)(claimed_interest)
                            (rebalanced_cycle)(last_flow)(last_interest)(created_at) )
};

TBL lp_request_t {
    name                owner;
    uint8_t             kind                    = (uint8_t)lp_request_kind::NONE;
    asset               amount;
    asset               escrow;                                 // LIQUIDATE 押金
    name                target;
    uint64_t            cycle                   = 0;
    time_point_sec      created_at;

    lp_request_t() {}
    lp_request_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index< "lprequests"_n, lp_request_t > tbl_t;

    EOSLIB_SERIALIZE( lp_request_t, (owner)(kind)(amount)(escrow)(target)(cycle)(created_at) )
};

TBL lp_liquidation_t {
    name                target;
    name                liquidator;
    asset               amount;
    asset               escrow;
    uint64_t            cycle                   = 0;

    uint64_t primary_key() const { return target.value; }

    typedef eosio::multi_index< "lpliqs"_n, lp_liquidation_t > tbl_t;

    EOSLIB_SERIALIZE( lp_liquidation_t, (target)(liquidator)(amount)(escrow)(cycle) )
};

// =====================================================
// 日志
// =====================================================
struct cycle_log_t {
    uint64_t            cycle;
    uint8_t             status;
    asset               price;
    time_point_sec      created_at;

    EOSLIB_SERIALIZE( cycle_log_t, (cycle)(status)(price)(created_at) )
};

struct rebalance_log_t {
    uint64_t            cycle;
    name                lp;
    asset               flow;
    asset               interest;
    time_point_sec      created_at;

    EOSLIB_SERIALIZE( rebalance_log_t, (cycle)(lp)(flow)(interest)(created_at) )
};

struct liquidation_log_t {
    uint64_t            cycle;
    name                liquidator;
    name                target;
    asset               amount;
    asset               reward;
    bool                lp_side;
    time_point_sec      created_at;

    EOSLIB_SERIALIZE( liquidation_log_t, (cycle)(liquidator)(target)(amount)(reward)(lp_side)(created_at) )
};

} // namespace synthfi
