#include <synth.pool/synth.pool.hpp>
#include <synth.token/synth.token.hpp>

#include <synth.utils.hpp>
#include <safemath.hpp>

#include <algorithm>

namespace synthfi {

using namespace std;
using namespace safemath;

// |price - ref| / ref <= tolerance
static bool within_tolerance(int64_t price, int64_t ref, uint64_t tolerance_bp) {
   int128_t diff = price > ref ? (int128_t)price - ref : (int128_t)ref - price;
   return diff * RATE_SCALE <= (int128_t)ref * tolerance_bp;
}

void synth_pool::offchain(const name& submitter) {
   require_auth(submitter);
   _check_enabled();
   _check_status(cycle_status::ACTIVE, "pool not active");

   cycle_t::tbl_t cycles(get_self(), get_self().value);
   const auto& cycle = cycles.get(_pstate.cycle_index, "cycle not found");

   auto now = time_point_sec(current_time_point());
   CHECKC(now.sec_since_epoch() >= cycle.started_at.sec_since_epoch() + _gstate.cycle_length_sec,
          err::TIME_PREMATURE, "cycle not finished yet");

   price_t::idx_t prices(_gstate.oracle_contract, _gstate.oracle_contract.value);
   const auto& price = _get_oracle_price(prices);
   CHECKC(price.market_open, err::MARKET_STATUS, "market is closed");

   _advance_index(now);

   cycles.modify(cycle, same_payer, [&](auto& c) {
      c.status          = (uint8_t)cycle_status::OFFCHAIN;
      c.offchain_at     = now;
      c.interest_index  = _pstate.interest_index;
   });

   _pstate.status             = (uint8_t)cycle_status::OFFCHAIN;
   _pstate.status_updated_at  = now;
   _notify_cycle(cycle.index, cycle_status::OFFCHAIN, _pool_price(price.price));
}

void synth_pool::onchain(const name& submitter) {
   require_auth(submitter);
   _check_enabled();
   _check_status(cycle_status::OFFCHAIN, "pool not in offchain rebalancing");

   cycle_t::tbl_t cycles(get_self(), get_self().value);
   const auto& cycle = cycles.get(_pstate.cycle_index, "cycle not found");

   auto now = time_point_sec(current_time_point());
   CHECKC(now.sec_since_epoch() >= cycle.offchain_at.sec_since_epoch() + _gstate.rebalance_length_sec,
          err::TIME_PREMATURE, "offchain rebalance not finished yet");

   price_t::idx_t prices(_gstate.oracle_contract, _gstate.oracle_contract.value);
   const auto& oracle = _get_oracle_price(prices);
   CHECKC(!oracle.market_open, err::MARKET_STATUS, "market is still open");
   CHECKC(oracle.price.amount > 0, err::PRICE_STALE, "oracle price not set");
   CHECKC(now.sec_since_epoch() <= oracle.updated_at.sec_since_epoch() + _gstate.price_stale_sec,
          err::PRICE_STALE, "oracle price is stale");

   auto price        = _pool_price(oracle.price);
   if (!cycle.deviation_resolved) {
      CHECKC(!(oracle.split.detected && oracle.split.id > _pstate.handled_split_id), err::PRICE_DEVIATION_HIGH,
             "split flagged by oracle, resolution required");
      if (_pstate.last_price.amount > 0)
         CHECKC(within_tolerance(price.amount, _pstate.last_price.amount, _gstate.price_tolerance_bp),
                err::PRICE_DEVIATION_HIGH, "price deviation too high: " + price.to_string()
                + " vs " + _pstate.last_price.to_string());
   }

   auto multiplier   = _pstate.split_multiplier;

   int64_t redeem_value = _synth_value(_shares_to_amount(_pstate.cycle_redeem_shares.amount, multiplier), price);
   int64_t net_flow     = _pstate.cycle_deposits.amount - redeem_value;

   // 本周期利息：已结算份额 * 指数增量
   int64_t outstanding  = _shares_to_amount(_pstate.total_shares.amount, multiplier);
   int64_t interest     = _synth_value(mul_index(outstanding, cycle.interest_index, _pstate.settled_index, HIGH_PRECISION), price);
   int64_t fee          = mul_div(interest, _gstate.protocol_fee_bp, RATE_SCALE);

   TRACE("cycle ", cycle.index, " net flow ", net_flow, " interest ", interest);

   cycles.modify(cycle, same_payer, [&](auto& c) {
      c.status             = (uint8_t)cycle_status::ONCHAIN;
      c.onchain_at         = now;
      c.settlement_price   = price;
      c.session_high       = _pool_price(oracle.high);
      c.session_low        = _pool_price(oracle.low);
      c.multiplier         = multiplier;
      c.deposits           = _pstate.cycle_deposits;
      c.deposit_collateral = _pstate.cycle_deposit_collateral;
      c.redeem_shares      = _pstate.cycle_redeem_shares;
      c.redeem_value       = _reserve(redeem_value);
      c.net_flow           = _reserve(net_flow);
      c.settled_flow       = _reserve(0);
      c.lp_interest        = _reserve(interest - fee);
      c.settled_interest   = _reserve(0);
      c.protocol_fee       = _reserve(fee);
      c.lp_count           = _pstate.active_lp_count;
      c.settled_lp_count   = 0;
   });

   _pstate.status             = (uint8_t)cycle_status::ONCHAIN;
   _pstate.status_updated_at  = now;
   _notify_cycle(cycle.index, cycle_status::ONCHAIN, price);

   if (cycle.lp_count == 0) {
      // 无 LP：赎回只能由留存储备兑付
      if (_pstate.backing_reserve.amount + net_flow < 0)
         _halt_pool(cycles, cycle);
      else
         _finalize_cycle(cycles, cycle);
   }
}

void synth_pool::resolvedev(const bool& is_split, const uint64_t& num, const uint64_t& den) {
   require_auth(_gstate.admin);
   _check_status(cycle_status::OFFCHAIN, "pool not in offchain rebalancing");

   cycle_t::tbl_t cycles(get_self(), get_self().value);
   const auto& cycle = cycles.get(_pstate.cycle_index, "cycle not found");
   CHECKC(!cycle.deviation_resolved, err::STATE_MISMATCH, "deviation already resolved");

   if (!is_split) {
      cycles.modify(cycle, same_payer, [&](auto& c) {
         c.deviation_resolved = true;
      });
      return;
   }

   CHECKC(num > 0 && den > 0 && num != den, err::PARAM_ERROR, "invalid split ratio");

   price_t::idx_t prices(_gstate.oracle_contract, _gstate.oracle_contract.value);
   const auto& oracle = _get_oracle_price(prices);
   CHECKC(oracle.split.detected && oracle.split.id > _pstate.handled_split_id, err::INVALID_SPLIT,
          "no unhandled split flagged by oracle");
   CHECKC(oracle.split.num == num && oracle.split.den == den, err::INVALID_SPLIT,
          "split ratio not confirmed by oracle: " + to_string(oracle.split.num) + ":" + to_string(oracle.split.den));

   auto token       = _gstate.synth.get_contract();
   auto code        = _gstate.synth.get_symbol().code();
   auto mode        = synth_token::get_accounting(token, code);
   CHECKC(mode != accounting::PEGGED, err::INVALID_SPLIT, "pegged synth can not split");

   if (mode == accounting::SCALED) {
      // 余额随倍数缩放，池内份额倍数与代币同步
      CHECKC(synth_token::get_multiplier(token, code) == _pstate.split_multiplier, err::SYSTEM_ERROR,
             "split multiplier out of sync with token");
      _pstate.split_multiplier = _scaled_multiplier(_pstate.split_multiplier, num, den);
      if (_pstate.last_price.amount > 0)
         _pstate.last_price.amount = mul_div(_pstate.last_price.amount, den, num);
   } else {
      // 余额不变，预言机报价折回拆股前单位
      _pstate.price_multiplier = _scaled_multiplier(_pstate.price_multiplier, num, den);
   }
   _pstate.handled_split_id   = oracle.split.id;

   cycles.modify(cycle, same_payer, [&](auto& c) {
      c.deviation_resolved = true;
      c.split_num          = num;
      c.split_den          = den;
   });

   APPLY_SPLIT(token, code, num, den)
}

uint64_t synth_pool::_scaled_multiplier(uint64_t multiplier, uint64_t num, uint64_t den) const {
   int128_t v = (int128_t)multiplier * num / den;
   CHECKC(v > 0 && v <= (int128_t)std::numeric_limits<uint64_t>::max(), err::PARAM_ERROR,
          "split multiplier out of range");
   return (uint64_t)v;
}

void synth_pool::rebalance(const name& lp, const asset& price) {
   require_auth(lp);
   _check_status(cycle_status::ONCHAIN, "pool not in onchain rebalancing");

   cycle_t::tbl_t cycles(get_self(), get_self().value);
   const auto& cycle = cycles.get(_pstate.cycle_index, "cycle not found");

   CHECKC(price.symbol == cycle.settlement_price.symbol, err::SYMBOL_MISMATCH, "price symbol mismatch");
   CHECKC(price.amount > 0, err::NOT_POSITIVE, "price must be positive");
   // 落在当日区间内，或在结算价容忍度内
   auto pool_price = _pool_price(price);
   bool in_session = cycle.session_low.amount > 0
                  && pool_price >= cycle.session_low && pool_price <= cycle.session_high;
   CHECKC(in_session || within_tolerance(pool_price.amount, cycle.settlement_price.amount, _gstate.price_tolerance_bp),
          err::PRICE_DEVIATION_HIGH, "price deviates from settlement price " + cycle.settlement_price.to_string());

   _settle_lp(cycles, cycle, lp);
}

void synth_pool::forcerebal(const name& lp) {
   require_auth(_gstate.admin);
   _check_status(cycle_status::ONCHAIN, "pool not in onchain rebalancing");

   cycle_t::tbl_t cycles(get_self(), get_self().value);
   const auto& cycle = cycles.get(_pstate.cycle_index, "cycle not found");

   auto now = time_point_sec(current_time_point());
   CHECKC(now.sec_since_epoch() >= cycle.onchain_at.sec_since_epoch() + _gstate.halt_threshold_sec,
          err::TIME_PREMATURE, "halt threshold not reached");

   lp_t::tbl_t lps(get_self(), get_self().value);
   auto itr = lps.find(lp.value);
   CHECKC(itr != lps.end(), err::RECORD_NOT_FOUND, "lp not found: " + lp.to_string());
   CHECKC(itr->committed.amount > 0, err::STATE_MISMATCH, "lp not active");
   CHECKC(itr->rebalanced_cycle < cycle.index, err::ALREADY_SETTLED, "lp already rebalanced");

   // 抵押足以覆盖时按结算价代为结算，否则熔断
   auto flow = _lp_flow(cycle, *itr);
   if (flow >= 0 || itr->collateral.amount >= -flow) {
      _settle_lp(cycles, cycle, lp);
      return;
   }
   _halt_pool(cycles, cycle);
}

void synth_pool::_settle_lp(cycle_t::tbl_t& cycles, const cycle_t& cycle, const name& lp) {
   lp_t::tbl_t lps(get_self(), get_self().value);
   auto itr = lps.find(lp.value);
   CHECKC(itr != lps.end(), err::RECORD_NOT_FOUND, "lp not found: " + lp.to_string());
   CHECKC(itr->committed.amount > 0, err::STATE_MISMATCH, "lp not active");
   CHECKC(itr->rebalanced_cycle < cycle.index, err::ALREADY_SETTLED, "lp already rebalanced");

   auto flow      = _lp_flow(cycle, *itr);
   auto interest  = _lp_interest(cycle, *itr);
   if (flow < 0)
      CHECKC(itr->collateral.amount >= -flow, err::INSUFFICIENT_COLLATERAL,
             "lp collateral can not cover flow: " + _reserve(-flow).to_string());

   lps.modify(itr, same_payer, [&](auto& l) {
      if (flow < 0) l.collateral.amount += flow;
      l.accrued_interest.amount  += interest;
      l.rebalanced_cycle         = cycle.index;
      l.last_flow                = _reserve(flow);
      l.last_interest            = _reserve(interest);
   });
   if (flow < 0) _pstate.total_lp_collateral.amount += flow;

   cycles.modify(cycle, same_payer, [&](auto& c) {
      c.settled_flow.amount      += flow;
      c.settled_interest.amount  += interest;
      c.settled_lp_count++;
   });

   if (flow > 0)
      _transfer_out(_gstate.reserve, lp, flow, "rebalance:" + to_string(cycle.index));

   notifyrebal_action act{ _self, { {_self, active_perm} } };
   act.send(rebalance_log_t{ cycle.index, lp, _reserve(flow), _reserve(interest), time_point_sec(current_time_point()) });

   if (cycle.settled_lp_count >= cycle.lp_count)
      _finalize_cycle(cycles, cycle);
}

// 最后一个结算的 LP 承担尾差
int64_t synth_pool::_lp_flow(const cycle_t& cycle, const lp_t& lp) const {
   if (cycle.settled_lp_count + 1 >= cycle.lp_count)
      return cycle.net_flow.amount - cycle.settled_flow.amount;
   return mul_div(cycle.net_flow.amount, lp.committed.amount, _pstate.total_committed.amount);
}

int64_t synth_pool::_lp_interest(const cycle_t& cycle, const lp_t& lp) const {
   if (cycle.settled_lp_count + 1 >= cycle.lp_count)
      return cycle.lp_interest.amount - cycle.settled_interest.amount;
   return mul_div(cycle.lp_interest.amount, lp.committed.amount, _pstate.total_committed.amount);
}

void synth_pool::_finalize_cycle(cycle_t::tbl_t& cycles, const cycle_t& cycle) {
   auto now = time_point_sec(current_time_point());

   _pstate.protocol_fees.amount += cycle.protocol_fee.amount + cycle.lp_interest.amount - cycle.settled_interest.amount;

   _pstate.backing_reserve.amount += cycle.deposits.amount - cycle.redeem_value.amount - cycle.settled_flow.amount;
   CHECKC(_pstate.backing_reserve.amount >= 0, err::INSUFFICIENT_LIQUIDITY, "backing reserve exhausted");
   _pstate.redemption_reserve += cycle.redeem_value;

   int64_t minted = 0;
   if (cycle.deposits.amount > 0) {
      auto synth_amount = mul_div(cycle.deposits.amount, calc_precision(_gstate.synth.get_symbol().precision()),
                                  cycle.settlement_price.amount);
      minted = _amount_to_shares(synth_amount, cycle.multiplier);
   }
   _pstate.total_shares.amount      += minted - cycle.redeem_shares.amount;
   _pstate.total_principal          += cycle.deposits;
   _pstate.total_user_collateral    += cycle.deposit_collateral;

   _pstate.cycle_deposits.amount             = 0;
   _pstate.cycle_deposit_collateral.amount   = 0;
   _pstate.cycle_redeem_shares.amount        = 0;

   _apply_lp_requests();
   _apply_lp_liquidations();

   uint64_t active = 0;
   lp_t::tbl_t lps(get_self(), get_self().value);
   for (auto itr = lps.begin(); itr != lps.end(); ++itr) {
      if (itr->committed.amount > 0) active++;
   }
   _pstate.active_lp_count       = active;
   _pstate.pending_add.amount    = 0;
   _pstate.pending_reduce.amount = 0;

   _pstate.last_price      = cycle.settlement_price;
   _pstate.settled_index   = cycle.interest_index;

   cycles.modify(cycle, same_payer, [&](auto& c) {
      c.status       = (uint8_t)cycle_status::SETTLED;
      c.finalized_at = now;
   });
   _notify_cycle(cycle.index, cycle_status::SETTLED, cycle.settlement_price);

   _pstate.cycle_index++;
   _open_cycle(cycles, _pstate.cycle_index, now);
}

void synth_pool::_apply_lp_requests() {
   lp_request_t::tbl_t requests(get_self(), get_self().value);
   lp_t::tbl_t lps(get_self(), get_self().value);

   for (auto itr = requests.begin(); itr != requests.end(); ) {
      auto kind = (lp_request_kind)itr->kind;
      if (kind != lp_request_kind::ADD && kind != lp_request_kind::REDUCE) {
         ++itr;
         continue;
      }

      auto lp = lps.find(itr->owner.value);
      CHECKC(lp != lps.end(), err::RECORD_NOT_FOUND, "lp not found: " + itr->owner.to_string());

      auto delta = kind == lp_request_kind::ADD ? itr->amount.amount : -itr->amount.amount;
      lps.modify(lp, same_payer, [&](auto& l) {
         l.committed.amount += delta;
      });
      _pstate.total_committed.amount += delta;
      CHECKC(lp->committed.amount >= 0 && _pstate.total_committed.amount >= 0, err::SYSTEM_ERROR, "committed liquidity underflow");

      itr = requests.erase(itr);
   }
}

void synth_pool::_apply_lp_liquidations() {
   lp_liquidation_t::tbl_t liqs(get_self(), get_self().value);
   lp_request_t::tbl_t requests(get_self(), get_self().value);
   lp_t::tbl_t lps(get_self(), get_self().value);
   auto now = time_point_sec(current_time_point());

   for (auto itr = liqs.begin(); itr != liqs.end(); ) {
      auto target = lps.find(itr->target.value);
      CHECKC(target != lps.end(), err::RECORD_NOT_FOUND, "lp not found: " + itr->target.to_string());

      auto amount = std::min(itr->amount.amount, target->committed.amount);
      auto reward = target->committed.amount > 0
                  ? mul_div(target->collateral.amount, amount, target->committed.amount) : 0;

      lps.modify(target, same_payer, [&](auto& l) {
         l.committed.amount   -= amount;
         l.collateral.amount  -= reward;
      });

      auto liquidator = lps.find(itr->liquidator.value);
      if (liquidator == lps.end()) {
         liquidator = lps.emplace(get_self(), [&](auto& l) {
            l.owner              = itr->liquidator;
            l.committed          = _reserve(0);
            l.collateral         = _reserve(0);
            l.accrued_interest   = _reserve(0);
            l.claimed_interest   = _reserve(0);
            l.rebalanced_cycle   = _pstate.cycle_index;
            l.last_flow          = _reserve(0);
            l.last_interest      = _reserve(0);
            l.created_at         = now;
         });
      }
      lps.modify(liquidator, same_payer, [&](auto& l) {
         l.committed.amount   += amount;
         l.collateral.amount  += reward + itr->escrow.amount;
      });
      _pstate.total_lp_collateral += itr->escrow;

      auto req = requests.find(itr->liquidator.value);
      if (req != requests.end() && req->kind == (uint8_t)lp_request_kind::LIQUIDATE)
         requests.erase(req);

      notifyliq_action act{ _self, { {_self, active_perm} } };
      act.send(liquidation_log_t{ itr->cycle, itr->liquidator, itr->target, _reserve(amount), _reserve(reward), true, now });

      itr = liqs.erase(itr);
   }
}

void synth_pool::_halt_pool(cycle_t::tbl_t& cycles, const cycle_t& cycle) {
   auto now   = time_point_sec(current_time_point());
   auto price = cycle.settlement_price;

   lp_t::tbl_t lps(get_self(), get_self().value);

   // 回滚本周期已完成的 LP 结算
   for (auto itr = lps.begin(); itr != lps.end(); ++itr) {
      if (itr->rebalanced_cycle != cycle.index) continue;

      int64_t flow         = itr->last_flow.amount;
      int64_t coll_delta   = 0;
      if (flow > 0) {
         coll_delta = -std::min(flow, itr->collateral.amount);
         int64_t shortfall = flow + coll_delta;
         _pstate.backing_reserve.amount -= std::min(shortfall, _pstate.backing_reserve.amount);
      } else {
         coll_delta = -flow;
      }

      lps.modify(itr, same_payer, [&](auto& l) {
         l.collateral.amount        += coll_delta;
         l.accrued_interest.amount  -= l.last_interest.amount;
         l.rebalanced_cycle         = cycle.index - 1;
         l.last_flow.amount         = 0;
         l.last_interest.amount     = 0;
      });
      _pstate.total_lp_collateral.amount += coll_delta;
   }

   // 用户持仓价值对应的 LP 抵押划入熔断储备
   int64_t halt_value   = _synth_value(_shares_to_amount(_pstate.total_shares.amount, _pstate.split_multiplier), price);
   int64_t halt_reserve = _pstate.backing_reserve.amount;
   for (auto itr = lps.begin(); itr != lps.end(); ++itr) {
      if (itr->committed.amount <= 0 || _pstate.total_committed.amount <= 0) continue;

      auto exposure = mul_div(halt_value, itr->committed.amount, _pstate.total_committed.amount);
      auto earmark  = std::min(exposure, itr->collateral.amount);
      if (earmark <= 0) continue;

      lps.modify(itr, same_payer, [&](auto& l) {
         l.collateral.amount -= earmark;
      });
      _pstate.total_lp_collateral.amount -= earmark;
      halt_reserve += earmark;
   }

   cycles.modify(cycle, same_payer, [&](auto& c) {
      c.status                   = (uint8_t)cycle_status::HALTED;
      c.settled_flow.amount      = 0;
      c.settled_interest.amount  = 0;
      c.settled_lp_count         = 0;
   });

   _pstate.status                   = (uint8_t)cycle_status::HALTED;
   _pstate.status_updated_at        = now;
   _pstate.halted_at                = now;
   _pstate.halt_price               = price;
   _pstate.halt_reserve.amount      = halt_reserve;
   _pstate.halt_shares              = _pstate.total_shares;
   _pstate.backing_reserve.amount   = 0;

   TRACE("pool halted at cycle ", cycle.index, " reserve ", _pstate.halt_reserve);
   _notify_cycle(cycle.index, cycle_status::HALTED, price);
}

void synth_pool::_advance_index(time_point_sec now) {
   auto last = _pstate.interest_updated_at.sec_since_epoch();
   if (now.sec_since_epoch() <= last) return;

   auto util = policy::utilization_bps(_outstanding_value(), _pstate.total_committed.amount);
   auto rate = policy::interest_rate(_gstate.policy, util);

   _pstate.interest_index        = policy::accrue_index(_pstate.interest_index, rate, now.sec_since_epoch() - last);
   _pstate.interest_rate_bp      = rate;
   _pstate.interest_updated_at   = now;
}

void synth_pool::_open_cycle(cycle_t::tbl_t& cycles, uint64_t index, time_point_sec now) {
   cycles.emplace(get_self(), [&](auto& c) {
      c.index              = index;
      c.status             = (uint8_t)cycle_status::ACTIVE;
      c.started_at         = now;
      c.settlement_price   = _reserve(0);
      c.multiplier         = _pstate.split_multiplier;
      c.deposits           = _reserve(0);
      c.deposit_collateral = _reserve(0);
      c.redeem_shares      = _synth(0);
      c.redeem_value       = _reserve(0);
      c.net_flow           = _reserve(0);
      c.settled_flow       = _reserve(0);
      c.lp_interest        = _reserve(0);
      c.settled_interest   = _reserve(0);
      c.protocol_fee       = _reserve(0);
   });

   _pstate.status             = (uint8_t)cycle_status::ACTIVE;
   _pstate.status_updated_at  = now;
}

} // namespace synthfi
