#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/action.hpp>
#include <string>
#include <vector>

#include "synth.oracle.db.hpp"

namespace synthfi {

using eosio::asset;
using eosio::check;
using eosio::datastream;
using eosio::name;
using eosio::symbol;

using std::string;

class [[eosio::contract("synth.oracle")]] synth_oracle : public eosio::contract {
private:
    oracle_global_singleton     _global;
    oracle_global_t             _gstate;

public:
    using contract::contract;
    synth_oracle(eosio::name receiver, eosio::name code, datastream<const char*> ds):
        contract(receiver, code, ds), _global(_self, _self.value) {
        _gstate = _global.exists() ? _global.get() : oracle_global_t{};
    }

    ~synth_oracle() {
        _global.set( _gstate, get_self() );
    }

    [[eosio::action]]
    void init( const name& admin, const symbol& quote_symbol );

    [[eosio::action]]
    void setmaxchange( const uint64_t& max_change_bp );

    [[eosio::action]]
    void addseer( const name& seer );

    [[eosio::action]]
    void removeseer( const name& seer );

    [[eosio::action]]
    void addcoin( const name& code );

    [[eosio::action]]
    void removecoin( const name& code );

    /**
     * seer 报价，同时上报开市状态
     */
    [[eosio::action]]
    void updateprice( const name& seer, const std::vector<price_info>& infos );

    /**
     * seer 标记拆股，num:den 如 2:1
     */
    [[eosio::action]]
    void flagsplit( const name& seer, const name& code, const uint64_t& num, const uint64_t& den );

    [[eosio::action]]
    void clearsplit( const name& code );

private:
    void _check_seer( const name& seer );
    void _updateprice( const price_info& info );

};

}
