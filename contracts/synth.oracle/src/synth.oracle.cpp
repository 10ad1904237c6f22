#include <synth.oracle/synth.oracle.hpp>
#include <synth.utils.hpp>
#include <safemath.hpp>

using namespace eosio;
using namespace std;

namespace synthfi {

using namespace safemath;

void synth_oracle::init( const name& admin, const symbol& quote_symbol ) {
    require_auth( get_self() );
    CHECKC( is_account(admin), oracle_err::PARAM_ERROR, "admin account does not exist" );
    CHECKC( quote_symbol.is_valid(), oracle_err::SYMBOL_MISMATCH, "invalid quote symbol" );

    _gstate.admin           = admin;
    _gstate.quote_symbol    = quote_symbol;
}

void synth_oracle::setmaxchange( const uint64_t& max_change_bp ) {
    require_auth( _gstate.admin );
    CHECKC( max_change_bp > 0 && max_change_bp < ORACLE_PCT_BOOST, oracle_err::PARAM_ERROR, "max change must be within (0, 100%)" );
    _gstate.max_change_bp = max_change_bp;
}

/**
 * 添加预言人
 */
void synth_oracle::addseer( const name& seer ) {
    require_auth( _gstate.admin );
    CHECKC( is_account(seer), oracle_err::PARAM_ERROR, "seer account does not exist" );

    seer_t::idx_t seers( _self, _self.value );
    CHECKC( seers.find(seer.value) == seers.end(), oracle_err::RECORD_EXISTING, "seer account is existing" );
    seers.emplace( _self, [&]( auto& s ) {
        s.seer = seer;
    });
}

void synth_oracle::removeseer( const name& seer ) {
    require_auth( _gstate.admin );

    seer_t::idx_t seers( _self, _self.value );
    auto itr = seers.find( seer.value );
    CHECKC( itr != seers.end(), oracle_err::RECORD_NOT_FOUND, "seer account is invalid" );
    seers.erase( itr );
}

void synth_oracle::addcoin( const name& code ) {
    require_auth( _gstate.admin );

    price_t::idx_t prices( _self, _self.value );
    CHECKC( prices.find(code.value) == prices.end(), oracle_err::RECORD_EXISTING, "coin is existing" );
    prices.emplace( _self, [&]( auto& p ) {
        p.code                      = code;
        p.price                     = asset( 0, _gstate.quote_symbol );
        p.high                      = asset( 0, _gstate.quote_symbol );
        p.low                       = asset( 0, _gstate.quote_symbol );
        p.market_open               = false;
        p.split.pre_split_price     = asset( 0, _gstate.quote_symbol );
    });
}

void synth_oracle::removecoin( const name& code ) {
    require_auth( _gstate.admin );

    price_t::idx_t prices( _self, _self.value );
    auto itr = prices.find( code.value );
    CHECKC( itr != prices.end(), oracle_err::RECORD_NOT_FOUND, "coin is not found" );
    prices.erase( itr );
}

void synth_oracle::updateprice( const name& seer, const std::vector<price_info>& infos ) {
    _check_seer( seer );
    CHECKC( !infos.empty(), oracle_err::PARAM_ERROR, "infos length must bigger than 0" )

    for( auto& info : infos ) {
        _updateprice( info );
    }
}

void synth_oracle::flagsplit( const name& seer, const name& code, const uint64_t& num, const uint64_t& den ) {
    _check_seer( seer );
    CHECKC( num > 0 && den > 0 && num != den, oracle_err::PARAM_ERROR, "invalid split ratio" );

    price_t::idx_t prices( _self, _self.value );
    auto itr = prices.find( code.value );
    CHECKC( itr != prices.end(), oracle_err::RECORD_NOT_FOUND, "coin is not found" );
    CHECKC( itr->price.amount > 0, oracle_err::PRICE_INVALID, "coin has no price yet" );

    prices.modify( itr, same_payer, [&]( auto& p ) {
        p.split.id++;
        p.split.detected            = true;
        p.split.num                 = num;
        p.split.den                 = den;
        p.split.pre_split_price     = p.price;
        p.split.detected_at         = current_time_point();
    });
}

void synth_oracle::clearsplit( const name& code ) {
    require_auth( _gstate.admin );

    price_t::idx_t prices( _self, _self.value );
    auto itr = prices.find( code.value );
    CHECKC( itr != prices.end(), oracle_err::RECORD_NOT_FOUND, "coin is not found" );
    CHECKC( itr->split.detected, oracle_err::PARAM_ERROR, "no split flagged" );

    prices.modify( itr, same_payer, [&]( auto& p ) {
        p.split.detected = false;
    });
}

void synth_oracle::_check_seer( const name& seer ) {
    require_auth( seer );
    seer_t::idx_t seers( _self, _self.value );
    CHECKC( seers.find(seer.value) != seers.end(), oracle_err::NO_AUTH, "seer account is invalid" );
}

void synth_oracle::_updateprice( const price_info& info ) {
    CHECKC( info.price.symbol == _gstate.quote_symbol, oracle_err::SYMBOL_MISMATCH, "price symbol mismatch" );
    CHECKC( info.price.amount > 0, oracle_err::PRICE_INVALID, "price must be positive" );
    CHECKC( info.high.symbol == info.price.symbol && info.low.symbol == info.price.symbol,
            oracle_err::SYMBOL_MISMATCH, "session range symbol mismatch" );
    CHECKC( info.low.amount > 0 && info.low <= info.price && info.price <= info.high,
            oracle_err::PRICE_INVALID, "price outside session range" );

    price_t::idx_t prices( _self, _self.value );
    auto itr = prices.find( info.code.value );
    CHECKC( itr != prices.end(), oracle_err::RECORD_NOT_FOUND, "coin is not found" );

    // 已标记拆股时放开区间限制
    auto older_price = itr->price.amount;
    if( older_price != 0 && !itr->split.detected ) {
        auto upper_limit = older_price + multiply_decimal64( older_price, _gstate.max_change_bp, ORACLE_PCT_BOOST );
        auto down_limit  = older_price - multiply_decimal64( older_price, _gstate.max_change_bp, ORACLE_PCT_BOOST );
        CHECKC( info.price.amount > down_limit && info.price.amount < upper_limit, oracle_err::PRICE_INVALID, "price not valid" )
    }

    prices.modify( itr, same_payer, [&]( auto& p ) {
        p.price         = info.price;
        p.high          = info.high;
        p.low           = info.low;
        p.market_open   = info.market_open;
        p.updated_at    = current_time_point();
    });
}

}
