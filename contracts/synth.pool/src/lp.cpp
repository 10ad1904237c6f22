#include <synth.pool/synth.pool.hpp>
#include <synth.token/synth.token.hpp>

#include <synth.utils.hpp>
#include <safemath.hpp>

#include <algorithm>

namespace synthfi {

using namespace std;
using namespace safemath;

void synth_pool::_on_lp_deposit(const name& lp, const asset& quantity, bool create) {
   lp_t::tbl_t lps(get_self(), get_self().value);
   auto itr = lps.find(lp.value);
   if (itr == lps.end()) {
      CHECKC(create, err::RECORD_NOT_FOUND, "lp not found: " + lp.to_string());
      CHECKC(_status() != cycle_status::HALTED, err::STATE_MISMATCH, "pool halted");
      lps.emplace(get_self(), [&](auto& l) {
         l.owner              = lp;
         l.committed          = _reserve(0);
         l.collateral         = quantity;
         l.accrued_interest   = _reserve(0);
         l.claimed_interest   = _reserve(0);
         l.last_flow          = _reserve(0);
         l.last_interest      = _reserve(0);
         l.created_at         = time_point_sec(current_time_point());
      });
   } else {
      lps.modify(itr, same_payer, [&](auto& l) {
         l.collateral += quantity;
      });
   }
   _pstate.total_lp_collateral += quantity;
}

void synth_pool::addliq(const name& lp, const asset& quantity) {
   require_auth(lp);
   _check_enabled();
   _check_status(cycle_status::ACTIVE, "pool not active");
   CHECKC(quantity.symbol == _gstate.reserve.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
   CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "quantity must be positive");

   lp_t::tbl_t lps(get_self(), get_self().value);
   auto itr = lps.find(lp.value);
   CHECKC(itr != lps.end(), err::RECORD_NOT_FOUND, "lp not found, deposit collateral first: " + lp.to_string());

   lp_request_t::tbl_t requests(get_self(), get_self().value);
   CHECKC(requests.find(lp.value) == requests.end(), err::PENDING_REQUEST, "lp request already pending");

   auto required = policy::required_collateral(itr->committed.amount + quantity.amount, _gstate.policy.lp_healthy_ratio);
   CHECKC(itr->collateral.amount >= required, err::INSUFFICIENT_COLLATERAL,
          "insufficient collateral, required: " + _reserve(required).to_string());

   requests.emplace(get_self(), [&](auto& r) {
      r.owner        = lp;
      r.kind         = (uint8_t)lp_request_kind::ADD;
      r.amount       = quantity;
      r.escrow       = _reserve(0);
      r.cycle        = _pstate.cycle_index;
      r.created_at   = time_point_sec(current_time_point());
   });
   _pstate.pending_add += quantity;
}

void synth_pool::reduceliq(const name& lp, const asset& quantity) {
   require_auth(lp);
   _check_enabled();
   _check_status(cycle_status::ACTIVE, "pool not active");
   CHECKC(quantity.symbol == _gstate.reserve.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
   CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "quantity must be positive");

   lp_t::tbl_t lps(get_self(), get_self().value);
   auto itr = lps.find(lp.value);
   CHECKC(itr != lps.end(), err::RECORD_NOT_FOUND, "lp not found: " + lp.to_string());

   lp_request_t::tbl_t requests(get_self(), get_self().value);
   CHECKC(requests.find(lp.value) == requests.end(), err::PENDING_REQUEST, "lp request already pending");
   CHECKC(quantity.amount <= itr->committed.amount - _pending_lp_liquidation(lp), err::INSUFFICIENT_BALANCE,
          "exceeds committed liquidity");

   auto available = _available_liquidity();
   CHECKC(available >= quantity.amount, err::INSUFFICIENT_LIQUIDITY,
          "insufficient liquidity, available: " + _reserve(available).to_string());

   requests.emplace(get_self(), [&](auto& r) {
      r.owner        = lp;
      r.kind         = (uint8_t)lp_request_kind::REDUCE;
      r.amount       = quantity;
      r.escrow       = _reserve(0);
      r.cycle        = _pstate.cycle_index;
      r.created_at   = time_point_sec(current_time_point());
   });
   _pstate.pending_reduce += quantity;
}

void synth_pool::lpcancel(const name& lp) {
   require_auth(lp);
   // 熔断后清算人仍可取回托管
   CHECKC(_status() == cycle_status::ACTIVE || _status() == cycle_status::HALTED, err::STATE_MISMATCH,
          "pool not active");

   lp_request_t::tbl_t requests(get_self(), get_self().value);
   auto itr = requests.find(lp.value);
   CHECKC(itr != requests.end(), err::RECORD_NOT_FOUND, "lp request not found: " + lp.to_string());
   CHECKC(_status() == cycle_status::HALTED || itr->cycle == _pstate.cycle_index, err::ALREADY_SETTLED,
          "lp request already settled");

   _refund_lp_request(*itr);
   requests.erase(itr);
}

void synth_pool::lpwithdraw(const name& lp, const asset& quantity) {
   require_auth(lp);
   _withdraw_lp_collateral(lp, quantity, "lp withdraw");
}

void synth_pool::lpreducecol(const name& lp, const asset& quantity) {
   require_auth(lp);
   _withdraw_lp_collateral(lp, quantity, "lp reduce collateral");
}

// 剩余抵押须覆盖已承诺流动性与当前敞口中的较大者
void synth_pool::_withdraw_lp_collateral(const name& lp, const asset& quantity, const string& memo) {
   _check_status(cycle_status::ACTIVE, "pool not active");
   CHECKC(quantity.symbol == _gstate.reserve.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
   CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "quantity must be positive");

   lp_t::tbl_t lps(get_self(), get_self().value);
   auto itr = lps.find(lp.value);
   CHECKC(itr != lps.end(), err::RECORD_NOT_FOUND, "lp not found: " + lp.to_string());

   lp_request_t::tbl_t requests(get_self(), get_self().value);
   CHECKC(requests.find(lp.value) == requests.end(), err::PENDING_REQUEST, "lp request pending");
   CHECKC(_pending_lp_liquidation(lp) == 0, err::PENDING_REQUEST, "liquidation pending against lp");
   CHECKC(quantity <= itr->collateral, err::INSUFFICIENT_BALANCE, "exceeds lp collateral");

   auto base     = std::max(itr->committed.amount, _lp_exposure(*itr));
   auto required = policy::required_collateral(base, _gstate.policy.lp_healthy_ratio);
   CHECKC(itr->collateral.amount - quantity.amount >= required, err::INSUFFICIENT_COLLATERAL,
          "remaining collateral below required: " + _reserve(required).to_string());

   lps.modify(itr, same_payer, [&](auto& l) {
      l.collateral -= quantity;
   });
   _pstate.total_lp_collateral -= quantity;
   _transfer_out(_gstate.reserve, lp, quantity.amount, memo);
}

void synth_pool::claimintr(const name& lp) {
   require_auth(lp);

   lp_t::tbl_t lps(get_self(), get_self().value);
   auto itr = lps.find(lp.value);
   CHECKC(itr != lps.end(), err::RECORD_NOT_FOUND, "lp not found: " + lp.to_string());

   auto interest = itr->accrued_interest;
   CHECKC(interest.amount > 0, err::NOTHING_TO_CLAIM, "no interest to claim");

   auto available = _pstate.interest_realized - _pstate.interest_paid;
   CHECKC(available >= interest, err::INSUFFICIENT_LIQUIDITY,
          "interest not yet realized, available: " + available.to_string());

   lps.modify(itr, same_payer, [&](auto& l) {
      l.claimed_interest         += interest;
      l.accrued_interest.amount  = 0;
   });
   _pstate.interest_paid += interest;
   _transfer_out(_gstate.reserve, lp, interest.amount, "lp interest");
}

void synth_pool::lpexit(const name& lp) {
   require_auth(lp);
   _lp_exit(lp);
}

void synth_pool::removelp(const name& lp) {
   require_auth(_gstate.admin);
   _lp_exit(lp);
}

void synth_pool::_on_lp_liquidate(const name& liquidator, const name& target, const asset& amount, const asset& escrow) {
   _check_status(cycle_status::ACTIVE, "pool not active");
   CHECKC(liquidator != target, err::SELF_LIQUIDATION, "can not liquidate self");
   CHECKC(amount.amount > 0, err::NOT_POSITIVE, "liquidation amount must be positive");

   lp_request_t::tbl_t requests(get_self(), get_self().value);
   CHECKC(requests.find(liquidator.value) == requests.end(), err::PENDING_REQUEST, "lp request already pending");

   lp_t::tbl_t lps(get_self(), get_self().value);
   auto lp = lps.find(target.value);
   CHECKC(lp != lps.end() && lp->committed.amount > 0, err::RECORD_NOT_FOUND, "lp not active: " + target.to_string());

   auto tier = policy::health_of(lp->collateral.amount, 0, _lp_exposure(*lp),
                                 _gstate.policy.lp_healthy_ratio, _gstate.policy.lp_liquidation_ratio);
   CHECKC(tier == policy::LIQUIDATABLE, err::NOT_LIQUIDATABLE, "lp not liquidatable: " + target.to_string());
   CHECKC((int128_t)amount.amount * RATE_SCALE <= (int128_t)lp->committed.amount * _gstate.max_liquidation_bp,
          err::EXCESSIVE_AMOUNT, "liquidation exceeds max share of committed liquidity");

   auto required = policy::required_collateral(amount.amount, _gstate.policy.lp_healthy_ratio);
   CHECKC(escrow.amount >= required, err::INSUFFICIENT_COLLATERAL,
          "insufficient escrow, required: " + _reserve(required).to_string());

   lp_liquidation_t::tbl_t liqs(get_self(), get_self().value);
   auto liq = liqs.find(target.value);
   if (liq != liqs.end()) {
      CHECKC(liq->cycle == _pstate.cycle_index, err::STATE_MISMATCH, "liquidation from previous cycle pending");
      CHECKC(amount > liq->amount, err::AMOUNT_NOT_LARGER,
             "must be larger than pending liquidation: " + liq->amount.to_string());

      auto prev = requests.find(liq->liquidator.value);
      if (prev != requests.end()) requests.erase(prev);
      _transfer_out(_gstate.reserve, liq->liquidator, liq->escrow.amount, "lp liquidation replaced: " + target.to_string());
      liqs.erase(liq);
   }

   int64_t reserved = 0;
   auto own = requests.find(target.value);
   if (own != requests.end() && own->kind == (uint8_t)lp_request_kind::REDUCE)
      reserved = own->amount.amount;
   CHECKC(lp->committed.amount - reserved >= amount.amount, err::INSUFFICIENT_BALANCE,
          "liquidation exceeds unreserved committed liquidity");

   auto now = time_point_sec(current_time_point());
   liqs.emplace(get_self(), [&](auto& l) {
      l.target       = target;
      l.liquidator   = liquidator;
      l.amount       = amount;
      l.escrow       = escrow;
      l.cycle        = _pstate.cycle_index;
   });
   requests.emplace(get_self(), [&](auto& r) {
      r.owner        = liquidator;
      r.kind         = (uint8_t)lp_request_kind::LIQUIDATE;
      r.amount       = amount;
      r.escrow       = escrow;
      r.target       = target;
      r.cycle        = _pstate.cycle_index;
      r.created_at   = now;
   });
}

void synth_pool::_refund_lp_request(const lp_request_t& req) {
   switch ((lp_request_kind)req.kind) {
      case lp_request_kind::ADD:
         _pstate.pending_add -= req.amount;
         break;

      case lp_request_kind::REDUCE:
         _pstate.pending_reduce -= req.amount;
         break;

      case lp_request_kind::LIQUIDATE: {
         lp_liquidation_t::tbl_t liqs(get_self(), get_self().value);
         auto liq = liqs.find(req.target.value);
         if (liq != liqs.end() && liq->liquidator == req.owner) liqs.erase(liq);
         _transfer_out(_gstate.reserve, req.owner, req.escrow.amount, "lp liquidation refund");
         break;
      }

      default:
         CHECKC(false, err::SYSTEM_ERROR, "unknown lp request kind");
   }
}

void synth_pool::_lp_exit(const name& lp) {
   lp_t::tbl_t lps(get_self(), get_self().value);
   auto itr = lps.find(lp.value);
   CHECKC(itr != lps.end(), err::RECORD_NOT_FOUND, "lp not found: " + lp.to_string());

   lp_request_t::tbl_t requests(get_self(), get_self().value);
   lp_liquidation_t::tbl_t liqs(get_self(), get_self().value);
   auto req    = requests.find(lp.value);
   auto halted = _status() == cycle_status::HALTED;

   if (!halted) {
      _check_status(cycle_status::ACTIVE, "pool is rebalancing");
      CHECKC(itr->committed.amount == 0, err::STATE_MISMATCH, "committed liquidity must be withdrawn first");
      CHECKC(req == requests.end(), err::PENDING_REQUEST, "lp request pending");
      CHECKC(liqs.find(lp.value) == liqs.end(), err::PENDING_REQUEST, "liquidation pending against lp");
   } else {
      if (req != requests.end()) {
         _refund_lp_request(*req);
         requests.erase(req);
      }
      auto liq = liqs.find(lp.value);
      if (liq != liqs.end()) {
         auto prev = requests.find(liq->liquidator.value);
         if (prev != requests.end()) requests.erase(prev);
         _transfer_out(_gstate.reserve, liq->liquidator, liq->escrow.amount, "lp liquidation refund");
         liqs.erase(liq);
      }
   }

   // 熔断时未实现的利息作废
   auto interest  = itr->accrued_interest.amount;
   auto available = (_pstate.interest_realized - _pstate.interest_paid).amount;
   if (interest > available) {
      CHECKC(halted, err::INSUFFICIENT_LIQUIDITY, "interest not yet realized, available: " + _reserve(available).to_string());
      interest = std::max<int64_t>(available, 0);
   }

   if (itr->committed.amount > 0 && _pstate.active_lp_count > 0)
      _pstate.active_lp_count--;
   _pstate.total_committed       -= itr->committed;
   _pstate.total_lp_collateral   -= itr->collateral;
   _pstate.interest_paid.amount  += interest;

   auto payout = itr->collateral.amount + interest;
   lps.erase(itr);
   _transfer_out(_gstate.reserve, lp, payout, "lp exit");
}

int64_t synth_pool::_pending_lp_liquidation(const name& target) const {
   lp_liquidation_t::tbl_t liqs(get_self(), get_self().value);
   auto liq = liqs.find(target.value);
   return liq == liqs.end() ? 0 : liq->amount.amount;
}

// LP 按承诺份额承担的未平仓合成资产价值
int64_t synth_pool::_lp_exposure(const lp_t& lp) const {
   if (_pstate.total_committed.amount <= 0 || lp.committed.amount <= 0) return 0;
   return mul_div(_outstanding_value(), lp.committed.amount, _pstate.total_committed.amount);
}

} // namespace synthfi
