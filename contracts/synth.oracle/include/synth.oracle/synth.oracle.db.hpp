#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

namespace synthfi {

using namespace eosio;

#define ORACLE_TBL struct [[eosio::table, eosio::contract("synth.oracle")]]
#define ORACLE_NTBL(name) struct [[eosio::table(name), eosio::contract("synth.oracle")]]

static constexpr uint64_t ORACLE_PCT_BOOST = 10000;

namespace oracle_err {
   static constexpr int NONE                 = 0;
   static constexpr int RECORD_NOT_FOUND     = 601;
   static constexpr int RECORD_EXISTING      = 602;
   static constexpr int PARAM_ERROR          = 202;
   static constexpr int SYMBOL_MISMATCH      = 204;
   static constexpr int NO_AUTH              = 301;
   static constexpr int PRICE_INVALID        = 502;
}

ORACLE_NTBL("global") oracle_global_t {
    name                admin;
    symbol              quote_symbol            = symbol("USDT", 6);
    uint64_t            max_change_bp           = 5000;         // 单次报价最大偏离 50%

    EOSLIB_SERIALIZE( oracle_global_t, (admin)(quote_symbol)(max_change_bp) )
};
typedef eosio::singleton< "global"_n, oracle_global_t > oracle_global_singleton;

ORACLE_TBL seer_t {
    name            seer;

    uint64_t primary_key() const { return seer.value; }

    typedef eosio::multi_index< "seers"_n, seer_t > idx_t;
    EOSLIB_SERIALIZE( seer_t, (seer) )
};

// 拆股标记
struct split_info {
    uint64_t        id          = 0;            // 每次标记 +1
    bool            detected    = false;
    uint64_t        num         = 0;
    uint64_t        den         = 0;
    asset           pre_split_price;
    time_point_sec  detected_at;

    EOSLIB_SERIALIZE( split_info, (id)(detected)(num)(den)(pre_split_price)(detected_at) )
};

struct price_info {
    name            code;
    asset           price;                      // 最新成交价
    asset           high;                       // 当日最高
    asset           low;                        // 当日最低
    bool            market_open = false;

    EOSLIB_SERIALIZE( price_info, (code)(price)(high)(low)(market_open) )
};

//scope: _self
ORACLE_TBL price_t {
    name            code;                       // 资产代码，如 aapl
    asset           price;                      // 以报价币计价
    asset           high;
    asset           low;
    bool            market_open = false;
    time_point_sec  updated_at;
    split_info      split;

    uint64_t primary_key() const { return code.value; }

    typedef eosio::multi_index< "prices"_n, price_t > idx_t;
    EOSLIB_SERIALIZE( price_t, (code)(price)(high)(low)(market_open)(updated_at)(split) )
};

} // namespace synthfi
