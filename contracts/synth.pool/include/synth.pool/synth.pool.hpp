#pragma once

#include <eosio/action.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <string>

#include <synth.pool/synth.pool.db.hpp>
#include <synth.pool/policy.hpp>
#include <synth.oracle/synth.oracle.db.hpp>

namespace synthfi {

using namespace eosio;
using std::string;

enum class err: uint32_t {
   NONE                    = 0,
   // StateError
   STATE_MISMATCH          = 101,
   PENDING_REQUEST         = 102,
   NOT_SETTLED             = 103,
   ALREADY_SETTLED         = 104,
   TIME_PREMATURE          = 105,
   MARKET_STATUS           = 106,
   PAUSED                  = 107,
   // ValidationError
   NOT_POSITIVE            = 201,
   PARAM_ERROR             = 202,
   MEMO_FORMAT_ERROR       = 203,
   SYMBOL_MISMATCH         = 204,
   CONTRACT_MISMATCH       = 205,
   EXCESSIVE_AMOUNT        = 206,
   SELF_LIQUIDATION        = 207,
   ACCOUNT_INVALID         = 208,
   AMOUNT_NOT_LARGER       = 209,
   // AuthorizationError
   NO_AUTH                 = 301,
   // ConsistencyError
   INSUFFICIENT_BALANCE    = 401,
   INSUFFICIENT_COLLATERAL = 402,
   INSUFFICIENT_LIQUIDITY  = 403,
   NOT_LIQUIDATABLE        = 404,
   // StalenessError
   PRICE_STALE             = 501,
   PRICE_DEVIATION_HIGH    = 502,
   INVALID_SPLIT           = 503,
   // NotFoundError
   RECORD_NOT_FOUND        = 601,
   NOTHING_TO_CLAIM        = 602,

   SYSTEM_ERROR            = 900
};

/**
 * `synth.pool` issues one synthetic asset against a reserve token.
 *
 * Users deposit reserve plus collateral, redeem or liquidate through transfers to this contract; LPs post
 * collateral and commit liquidity. Requests are batched per cycle: `offchain` closes the open phase and
 * snapshots the interest index, `onchain` fixes one oracle price and the net flow, every active LP then
 * calls `rebalance` for its pro-rata share, and the last settlement finalizes the cycle. A missing LP is
 * escalated with `forcerebal`: settled at the fixed price when its collateral covers the flow, otherwise
 * the pool halts and only exits remain.
 */
class [[eosio::contract("synth.pool")]] synth_pool : public contract {
public:
   using contract::contract;

   synth_pool(name receiver, name code, datastream<const char*> ds)
   : contract(receiver, code, ds),
     _global(get_self(), get_self().value),
     _pool(get_self(), get_self().value) {
      _gstate = _global.exists() ? _global.get() : global_t{};
      _pstate = _pool.exists() ? _pool.get() : pool_state_t{};
   }

   ~synth_pool() {
      _global.set(_gstate, get_self());
      _pool.set(_pstate, get_self());
   }

   // ========= admin =========
   ACTION init(const name& admin, const name& oracle_contract, const name& oracle_code,
               const extended_symbol& reserve, const extended_symbol& synth);
   ACTION setcycle(const uint32_t& cycle_length_sec, const uint32_t& rebalance_length_sec,
                   const uint32_t& halt_threshold_sec, const uint32_t& price_stale_sec);
   ACTION settolerance(const uint64_t& price_tolerance_bp);
   ACTION setpolicy(const policy_conf& conf);
   ACTION setfee(const uint64_t& protocol_fee_bp);
   ACTION setenabled(const bool& enabled);
   ACTION claimfees(const name& to);

   // ========= cycle =========
   ACTION offchain(const name& submitter);
   ACTION onchain(const name& submitter);
   ACTION resolvedev(const bool& is_split, const uint64_t& num, const uint64_t& den);
   ACTION rebalance(const name& lp, const asset& price);
   ACTION forcerebal(const name& lp);

   // ========= user =========
   ACTION cancelreq(const name& owner);
   ACTION claimasset(const name& submitter, const name& owner);
   ACTION claimreserve(const name& submitter, const name& owner);
   ACTION reducecoll(const name& owner, const asset& quantity);
   ACTION exitpool(const name& owner, const asset& quantity);

   // ========= lp =========
   ACTION addliq(const name& lp, const asset& quantity);
   ACTION reduceliq(const name& lp, const asset& quantity);
   ACTION lpcancel(const name& lp);
   ACTION lpwithdraw(const name& lp, const asset& quantity);
   ACTION lpreducecol(const name& lp, const asset& quantity);
   ACTION claimintr(const name& lp);
   ACTION lpexit(const name& lp);
   ACTION removelp(const name& lp);

   // ========= read-only =========
   ACTION tgetrate(const uint64_t& util_bps);
   ACTION tgetindex(const uint64_t& rate_bps, const uint32_t& elapsed_sec);
   ACTION tgethealth(const name& owner);
   ACTION tgetlphealth(const name& lp);
   ACTION tgetavail();

   // ========= logs =========
   ACTION notifycycle(const cycle_log_t& log);
   ACTION notifyrebal(const rebalance_log_t& log);
   ACTION notifyliq(const liquidation_log_t& log);

   using notifycycle_action   = action_wrapper<"notifycycle"_n, &synth_pool::notifycycle>;
   using notifyrebal_action   = action_wrapper<"notifyrebal"_n, &synth_pool::notifyrebal>;
   using notifyliq_action     = action_wrapper<"notifyliq"_n,   &synth_pool::notifyliq>;

   [[eosio::on_notify("*::transfer")]]
   void on_transfer(const name& from,
                    const name& to,
                    const asset& quantity,
                    const string& memo);

private:
   global_singleton        _global;
   global_t                _gstate;
   pool_state_singleton    _pool;
   pool_state_t            _pstate;

   // 仓位部分结算结果
   struct release_t {
      asset value;            // 赎回价值
      asset collateral;       // 释放的抵押
      asset principal;
      asset debt_paid;        // 从释放抵押中扣除的利息
   };

   // ========= transfer handlers =========
   void _on_deposit(const name& from, const asset& quantity, const string& collateral_str);
   void _on_redeem(const name& from, const asset& quantity);
   void _on_liquidate(const name& from, const name& target, const asset& quantity);
   void _on_add_collateral(const name& owner, const asset& quantity);
   void _on_lp_deposit(const name& lp, const asset& quantity, bool create);
   void _on_lp_liquidate(const name& liquidator, const name& target, const asset& amount, const asset& escrow);

   // ========= cycle =========
   void _settle_lp(cycle_t::tbl_t& cycles, const cycle_t& cycle, const name& lp);
   int64_t _lp_flow(const cycle_t& cycle, const lp_t& lp) const;
   int64_t _lp_interest(const cycle_t& cycle, const lp_t& lp) const;
   void _finalize_cycle(cycle_t::tbl_t& cycles, const cycle_t& cycle);
   void _apply_lp_requests();
   void _apply_lp_liquidations();
   void _halt_pool(cycle_t::tbl_t& cycles, const cycle_t& cycle);
   void _advance_index(time_point_sec now);
   uint64_t _scaled_multiplier(uint64_t multiplier, uint64_t num, uint64_t den) const;
   const price_t& _get_oracle_price(price_t::idx_t& prices) const;
   void _notify_cycle(uint64_t cycle, cycle_status status, const asset& price);
   void _open_cycle(cycle_t::tbl_t& cycles, uint64_t index, time_point_sec now);

   // ========= user =========
   release_t _release_position(const position_t& pos, int64_t shares, const asset& price,
                               uint64_t multiplier, uint128_t index) const;
   void _reduce_position(position_t::tbl_t& positions, position_t::tbl_t::const_iterator itr,
                         int64_t shares, const release_t& rel);
   void _refund_request(const request_t& req);
   int64_t _pending_liquidation_shares(const name& target) const;
   int64_t _redeemable_shares(int64_t amount, int64_t unreserved) const;
   int64_t _position_debt(const position_t& pos, const asset& price, uint128_t index) const;
   uint64_t _position_ratio(const position_t& pos) const;

   // ========= lp =========
   void _lp_exit(const name& lp);
   void _withdraw_lp_collateral(const name& lp, const asset& quantity, const string& memo);
   void _refund_lp_request(const lp_request_t& req);
   int64_t _pending_lp_liquidation(const name& target) const;
   int64_t _lp_exposure(const lp_t& lp) const;

   // ========= helpers =========
   void _check_enabled() const;
   void _check_status(cycle_status status, const string& msg) const;
   cycle_status _status() const { return (cycle_status)_pstate.status; }
   asset _reserve(int64_t amount) const { return asset(amount, _gstate.reserve.get_symbol()); }
   asset _synth(int64_t amount) const { return asset(amount, _gstate.synth.get_symbol()); }
   int64_t _shares_to_amount(int64_t shares, uint64_t multiplier) const;
   int64_t _amount_to_shares(int64_t amount, uint64_t multiplier) const;
   int64_t _synth_value(int64_t synth_amount, const asset& price) const;
   asset _pool_price(const asset& oracle_price) const;
   int64_t _outstanding_value() const;
   int64_t _utilized() const;
   int64_t _available_liquidity() const;
   void _transfer_out(const extended_symbol& token, const name& to, int64_t amount, const string& memo);
};

} // namespace synthfi
