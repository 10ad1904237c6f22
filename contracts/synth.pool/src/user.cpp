#include <synth.pool/synth.pool.hpp>
#include <synth.token/synth.token.hpp>

#include <synth.utils.hpp>
#include <safemath.hpp>

#include <algorithm>

namespace synthfi {

using namespace std;
using namespace safemath;

void synth_pool::_on_deposit(const name& from, const asset& quantity, const string& collateral_str) {
   _check_status(cycle_status::ACTIVE, "pool not active");

   request_t::tbl_t requests(get_self(), get_self().value);
   CHECKC(requests.find(from.value) == requests.end(), err::PENDING_REQUEST, "request already pending: " + from.to_string());

   auto collateral = to_uint64(collateral_str, "collateral");
   CHECKC(collateral < (uint64_t)quantity.amount, err::PARAM_ERROR, "collateral must be less than quantity");
   int64_t amount = quantity.amount - (int64_t)collateral;

   auto required = policy::required_collateral(amount, _gstate.policy.user_healthy_ratio);
   CHECKC((int64_t)collateral >= required, err::INSUFFICIENT_COLLATERAL,
          "insufficient collateral, required: " + _reserve(required).to_string());

   auto available = _available_liquidity();
   CHECKC(available >= amount, err::INSUFFICIENT_LIQUIDITY,
          "insufficient liquidity, available: " + _reserve(available).to_string());

   requests.emplace(get_self(), [&](auto& r) {
      r.owner        = from;
      r.kind         = (uint8_t)request_kind::DEPOSIT;
      r.amount       = _reserve(amount);
      r.collateral   = _reserve((int64_t)collateral);
      r.cycle        = _pstate.cycle_index;
      r.created_at   = time_point_sec(current_time_point());
   });

   _pstate.cycle_deposits.amount            += amount;
   _pstate.cycle_deposit_collateral.amount  += (int64_t)collateral;
}

void synth_pool::_on_redeem(const name& from, const asset& quantity) {
   _check_status(cycle_status::ACTIVE, "pool not active");

   request_t::tbl_t requests(get_self(), get_self().value);
   CHECKC(requests.find(from.value) == requests.end(), err::PENDING_REQUEST, "request already pending: " + from.to_string());

   position_t::tbl_t positions(get_self(), get_self().value);
   auto pos = positions.find(from.value);
   CHECKC(pos != positions.end(), err::RECORD_NOT_FOUND, "position not found: " + from.to_string());

   auto unreserved = pos->shares.amount - _pending_liquidation_shares(from);
   auto shares     = _redeemable_shares(quantity.amount, unreserved);
   CHECKC(unreserved >= shares, err::INSUFFICIENT_BALANCE, "redeem exceeds unreserved position");

   requests.emplace(get_self(), [&](auto& r) {
      r.owner        = from;
      r.kind         = (uint8_t)request_kind::REDEEM;
      r.amount       = _synth(shares);
      r.collateral   = _reserve(0);
      r.cycle        = _pstate.cycle_index;
      r.created_at   = time_point_sec(current_time_point());
   });

   _pstate.cycle_redeem_shares.amount += shares;
}

// 整数倍拆股以外会产生零头，全额赎回时直接取全部未锁定份额
int64_t synth_pool::_redeemable_shares(int64_t amount, int64_t unreserved) const {
   auto multiplier = _pstate.split_multiplier;
   if (unreserved > 0 && amount == _shares_to_amount(unreserved, multiplier)) return unreserved;

   auto shares = _amount_to_shares(amount, multiplier);
   CHECKC(shares > 0 && _shares_to_amount(shares, multiplier) == amount, err::PARAM_ERROR,
          "amount not representable at current split multiplier");
   return shares;
}

void synth_pool::_on_liquidate(const name& from, const name& target, const asset& quantity) {
   _check_status(cycle_status::ACTIVE, "pool not active");
   CHECKC(from != target, err::SELF_LIQUIDATION, "can not liquidate self");

   request_t::tbl_t requests(get_self(), get_self().value);
   CHECKC(requests.find(from.value) == requests.end(), err::PENDING_REQUEST, "request already pending: " + from.to_string());

   auto multiplier = _pstate.split_multiplier;
   auto shares     = _amount_to_shares(quantity.amount, multiplier);
   CHECKC(shares > 0 && _shares_to_amount(shares, multiplier) == quantity.amount, err::PARAM_ERROR,
          "amount not representable at current split multiplier");

   position_t::tbl_t positions(get_self(), get_self().value);
   auto pos = positions.find(target.value);
   CHECKC(pos != positions.end(), err::RECORD_NOT_FOUND, "position not found: " + target.to_string());

   auto value = _synth_value(_shares_to_amount(pos->shares.amount, multiplier), _pstate.last_price);
   auto tier  = policy::health(_position_ratio(*pos), _gstate.policy.user_healthy_ratio, _gstate.policy.user_liquidation_ratio);
   CHECKC(value > 0 && tier == policy::LIQUIDATABLE, err::NOT_LIQUIDATABLE, "position not liquidatable: " + target.to_string());
   CHECKC((int128_t)shares * RATE_SCALE <= (int128_t)pos->shares.amount * _gstate.max_liquidation_bp, err::EXCESSIVE_AMOUNT,
          "liquidation exceeds max share of position");

   liquidation_t::tbl_t liqs(get_self(), get_self().value);
   auto liq = liqs.find(target.value);
   if (liq != liqs.end()) {
      CHECKC(liq->cycle == _pstate.cycle_index, err::STATE_MISMATCH, "settled liquidation not claimed yet");
      CHECKC(shares > liq->shares.amount, err::AMOUNT_NOT_LARGER,
             "must be larger than pending liquidation: " + liq->shares.to_string());

      // 替换前一笔清算，原清算人押金退回
      auto prev = requests.find(liq->liquidator.value);
      if (prev != requests.end()) requests.erase(prev);
      _pstate.cycle_redeem_shares.amount -= liq->shares.amount;
      _transfer_out(_gstate.synth, liq->liquidator, _shares_to_amount(liq->shares.amount, multiplier),
                    "liquidation replaced: " + target.to_string());
      liqs.erase(liq);
   }

   int64_t reserved = 0;
   auto own = requests.find(target.value);
   if (own != requests.end() && own->kind == (uint8_t)request_kind::REDEEM)
      reserved = own->amount.amount;
   CHECKC(pos->shares.amount - reserved >= shares, err::INSUFFICIENT_BALANCE, "liquidation exceeds unreserved position");

   auto now = time_point_sec(current_time_point());
   liqs.emplace(get_self(), [&](auto& l) {
      l.target       = target;
      l.liquidator   = from;
      l.shares       = _synth(shares);
      l.cycle        = _pstate.cycle_index;
   });
   requests.emplace(get_self(), [&](auto& r) {
      r.owner        = from;
      r.kind         = (uint8_t)request_kind::LIQUIDATE;
      r.amount       = _synth(shares);
      r.collateral   = _reserve(0);
      r.target       = target;
      r.cycle        = _pstate.cycle_index;
      r.created_at   = now;
   });

   _pstate.cycle_redeem_shares.amount += shares;
}

void synth_pool::_on_add_collateral(const name& owner, const asset& quantity) {
   position_t::tbl_t positions(get_self(), get_self().value);
   auto pos = positions.find(owner.value);
   CHECKC(pos != positions.end(), err::RECORD_NOT_FOUND, "position not found: " + owner.to_string());

   positions.modify(pos, same_payer, [&](auto& p) {
      p.collateral  += quantity;
      p.updated_at  = time_point_sec(current_time_point());
   });
   _pstate.total_user_collateral += quantity;
}

void synth_pool::cancelreq(const name& owner) {
   require_auth(owner);
   _check_status(cycle_status::ACTIVE, "pool not active");

   request_t::tbl_t requests(get_self(), get_self().value);
   auto itr = requests.find(owner.value);
   CHECKC(itr != requests.end(), err::RECORD_NOT_FOUND, "request not found: " + owner.to_string());
   CHECKC(itr->cycle == _pstate.cycle_index, err::ALREADY_SETTLED, "request already settled");

   _refund_request(*itr);
   requests.erase(itr);
}

void synth_pool::claimasset(const name& submitter, const name& owner) {
   require_auth(submitter);

   request_t::tbl_t requests(get_self(), get_self().value);
   auto req = requests.find(owner.value);
   CHECKC(req != requests.end() && req->kind == (uint8_t)request_kind::DEPOSIT, err::NOTHING_TO_CLAIM,
          "no deposit to claim: " + owner.to_string());
   CHECKC(req->cycle < _pstate.cycle_index, err::NOT_SETTLED, "cycle not settled yet");

   cycle_t::tbl_t cycles(get_self(), get_self().value);
   const auto& cycle = cycles.get(req->cycle, "cycle not found");
   CHECKC(cycle.status == (uint8_t)cycle_status::SETTLED, err::NOT_SETTLED, "cycle not settled yet");

   auto synth_amount = mul_div(req->amount.amount, calc_precision(_gstate.synth.get_symbol().precision()),
                               cycle.settlement_price.amount);
   auto shares       = _amount_to_shares(synth_amount, cycle.multiplier);
   CHECKC(shares > 0, err::PARAM_ERROR, "deposit too small to mint");

   auto now = time_point_sec(current_time_point());
   position_t::tbl_t positions(get_self(), get_self().value);
   auto pos = positions.find(owner.value);
   if (pos == positions.end()) {
      positions.emplace(get_self(), [&](auto& p) {
         p.owner           = owner;
         p.shares          = _synth(shares);
         p.principal       = req->amount;
         p.collateral      = req->collateral;
         p.interest_index  = cycle.interest_index;
         p.updated_at      = now;
      });
   } else {
      // 加仓：按份额加权指数，向下取整
      uint128_t total = (uint128_t)pos->shares.amount + shares;
      uint128_t index = ((uint128_t)pos->shares.amount * pos->interest_index + (uint128_t)shares * cycle.interest_index) / total;
      positions.modify(pos, same_payer, [&](auto& p) {
         p.shares.amount   += shares;
         p.principal       += req->amount;
         p.collateral      += req->collateral;
         p.interest_index  = index;
         p.updated_at      = now;
      });
   }

   MINT(_gstate.synth.get_contract(), owner, _synth(_shares_to_amount(shares, _pstate.split_multiplier)),
        "claim asset: " + to_string(req->cycle))
   requests.erase(req);
}

void synth_pool::claimreserve(const name& submitter, const name& owner) {
   require_auth(submitter);

   request_t::tbl_t requests(get_self(), get_self().value);
   auto req = requests.find(owner.value);
   CHECKC(req != requests.end() && (req->kind == (uint8_t)request_kind::REDEEM || req->kind == (uint8_t)request_kind::LIQUIDATE),
          err::NOTHING_TO_CLAIM, "no redemption to claim: " + owner.to_string());
   CHECKC(req->cycle < _pstate.cycle_index, err::NOT_SETTLED, "cycle not settled yet");

   cycle_t::tbl_t cycles(get_self(), get_self().value);
   const auto& cycle = cycles.get(req->cycle, "cycle not found");
   CHECKC(cycle.status == (uint8_t)cycle_status::SETTLED, err::NOT_SETTLED, "cycle not settled yet");

   auto is_liquidation  = req->kind == (uint8_t)request_kind::LIQUIDATE;
   auto target          = is_liquidation ? req->target : owner;
   auto shares          = req->amount.amount;

   position_t::tbl_t positions(get_self(), get_self().value);
   auto pos = positions.find(target.value);
   CHECKC(pos != positions.end(), err::RECORD_NOT_FOUND, "position not found: " + target.to_string());
   CHECKC(pos->shares.amount >= shares, err::SYSTEM_ERROR, "position shares less than request");

   auto rel = _release_position(*pos, shares, cycle.settlement_price, cycle.multiplier, cycle.interest_index);
   _reduce_position(positions, pos, shares, rel);

   CHECKC(_pstate.redemption_reserve >= rel.value, err::SYSTEM_ERROR, "redemption reserve underflow");
   _pstate.redemption_reserve -= rel.value;

   BURN(_gstate.synth.get_contract(), get_self(), _synth(_shares_to_amount(shares, _pstate.split_multiplier)),
        "redeem burn: " + to_string(req->cycle))

   auto payout = rel.value + rel.collateral - rel.debt_paid;
   _transfer_out(_gstate.reserve, owner, payout.amount, "claim reserve: " + to_string(req->cycle));

   if (is_liquidation) {
      liquidation_t::tbl_t liqs(get_self(), get_self().value);
      auto liq = liqs.find(target.value);
      if (liq != liqs.end() && liq->liquidator == owner) liqs.erase(liq);

      notifyliq_action act{ _self, { {_self, active_perm} } };
      act.send(liquidation_log_t{ req->cycle, owner, target, rel.value, rel.collateral - rel.debt_paid, false,
                                  time_point_sec(current_time_point()) });
   }
   requests.erase(req);
}

void synth_pool::reducecoll(const name& owner, const asset& quantity) {
   require_auth(owner);
   CHECKC(_status() != cycle_status::HALTED, err::STATE_MISMATCH, "pool halted");
   CHECKC(quantity.symbol == _gstate.reserve.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");
   CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "quantity must be positive");

   request_t::tbl_t requests(get_self(), get_self().value);
   CHECKC(requests.find(owner.value) == requests.end(), err::PENDING_REQUEST, "request pending");
   CHECKC(_pending_liquidation_shares(owner) == 0, err::PENDING_REQUEST, "liquidation pending against position");

   position_t::tbl_t positions(get_self(), get_self().value);
   auto pos = positions.find(owner.value);
   CHECKC(pos != positions.end(), err::RECORD_NOT_FOUND, "position not found: " + owner.to_string());
   CHECKC(quantity <= pos->collateral, err::INSUFFICIENT_BALANCE, "exceeds position collateral");

   auto value     = _synth_value(_shares_to_amount(pos->shares.amount, _pstate.split_multiplier), _pstate.last_price);
   auto debt      = _position_debt(*pos, _pstate.last_price, _pstate.interest_index);
   auto required  = policy::required_collateral(value, _gstate.policy.user_healthy_ratio);
   CHECKC(pos->collateral.amount - quantity.amount - debt >= required, err::INSUFFICIENT_COLLATERAL,
          "remaining collateral below required: " + _reserve(required).to_string());

   positions.modify(pos, same_payer, [&](auto& p) {
      p.collateral  -= quantity;
      p.updated_at  = time_point_sec(current_time_point());
   });
   _pstate.total_user_collateral -= quantity;
   _transfer_out(_gstate.reserve, owner, quantity.amount, "reduce collateral");
}

void synth_pool::exitpool(const name& owner, const asset& quantity) {
   require_auth(owner);
   _check_status(cycle_status::HALTED, "pool not halted");

   bool exited = false;

   request_t::tbl_t requests(get_self(), get_self().value);
   auto req = requests.find(owner.value);
   if (req != requests.end()) {
      CHECKC(req->cycle == _pstate.cycle_index, err::STATE_MISMATCH, "settled request must be claimed first");
      _refund_request(*req);
      requests.erase(req);
      exited = true;
   }

   if (quantity.amount > 0) {
      CHECKC(quantity.symbol == _gstate.synth.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch");

      position_t::tbl_t positions(get_self(), get_self().value);
      auto pos        = positions.find(owner.value);
      auto unreserved = pos != positions.end() ? pos->shares.amount - _pending_liquidation_shares(owner) : 0;

      auto multiplier = _pstate.split_multiplier;
      auto shares     = quantity.amount == _shares_to_amount(unreserved, multiplier) && unreserved > 0
                      ? unreserved : _amount_to_shares(quantity.amount, multiplier);
      CHECKC(shares > 0 && shares <= _pstate.halt_shares.amount, err::INSUFFICIENT_BALANCE, "exceeds outstanding shares");

      auto reserve_part = mul_div(_pstate.halt_reserve.amount, shares, _pstate.halt_shares.amount);
      auto payout       = reserve_part;

      if (pos != positions.end()) {
         auto released = std::min(shares, unreserved);
         if (released > 0) {
            auto rel = _release_position(*pos, released, _pstate.halt_price, multiplier, _pstate.interest_index);
            _reduce_position(positions, pos, released, rel);
            payout += rel.collateral.amount - rel.debt_paid.amount;
         }
      }

      _pstate.halt_reserve.amount  -= reserve_part;
      _pstate.halt_shares.amount   -= shares;
      _pstate.total_shares.amount  -= shares;

      BURN(_gstate.synth.get_contract(), owner, quantity, "exit pool")
      _transfer_out(_gstate.reserve, owner, payout, "exit pool");
      exited = true;
   }

   CHECKC(exited, err::NOTHING_TO_CLAIM, "nothing to exit");
}

void synth_pool::_refund_request(const request_t& req) {
   switch ((request_kind)req.kind) {
      case request_kind::DEPOSIT:
         _pstate.cycle_deposits            -= req.amount;
         _pstate.cycle_deposit_collateral  -= req.collateral;
         _transfer_out(_gstate.reserve, req.owner, (req.amount + req.collateral).amount, "deposit refund");
         break;

      case request_kind::LIQUIDATE: {
         liquidation_t::tbl_t liqs(get_self(), get_self().value);
         auto liq = liqs.find(req.target.value);
         if (liq != liqs.end() && liq->liquidator == req.owner) liqs.erase(liq);
      }
      // fall through
      case request_kind::REDEEM:
         _pstate.cycle_redeem_shares -= req.amount;
         _transfer_out(_gstate.synth, req.owner, _shares_to_amount(req.amount.amount, _pstate.split_multiplier), "redeem refund");
         break;

      default:
         CHECKC(false, err::SYSTEM_ERROR, "unknown request kind");
   }
}

int64_t synth_pool::_pending_liquidation_shares(const name& target) const {
   liquidation_t::tbl_t liqs(get_self(), get_self().value);
   auto liq = liqs.find(target.value);
   return liq == liqs.end() ? 0 : liq->shares.amount;
}

synth_pool::release_t synth_pool::_release_position(const position_t& pos, int64_t shares, const asset& price,
                                                    uint64_t multiplier, uint128_t index) const {
   auto amount = _shares_to_amount(shares, multiplier);

   release_t rel;
   rel.value      = _reserve(_synth_value(amount, price));
   rel.collateral = _reserve(mul_div(pos.collateral.amount, shares, pos.shares.amount));
   rel.principal  = _reserve(mul_div(pos.principal.amount, shares, pos.shares.amount));

   // 利息从释放的抵押中扣除
   auto debt      = _synth_value(mul_index(amount, index, pos.interest_index, HIGH_PRECISION), price);
   rel.debt_paid  = _reserve(std::min(debt, rel.collateral.amount));
   return rel;
}

void synth_pool::_reduce_position(position_t::tbl_t& positions, position_t::tbl_t::const_iterator itr,
                                  int64_t shares, const release_t& rel) {
   _pstate.total_user_collateral   -= rel.collateral;
   _pstate.total_principal         -= rel.principal;
   _pstate.interest_realized       += rel.debt_paid;

   if (shares >= itr->shares.amount) {
      positions.erase(itr);
      return;
   }
   positions.modify(itr, same_payer, [&](auto& p) {
      p.shares.amount   -= shares;
      p.collateral      -= rel.collateral;
      p.principal       -= rel.principal;
      p.updated_at      = time_point_sec(current_time_point());
   });
}

int64_t synth_pool::_position_debt(const position_t& pos, const asset& price, uint128_t index) const {
   auto amount = _shares_to_amount(pos.shares.amount, _pstate.split_multiplier);
   return _synth_value(mul_index(amount, index, pos.interest_index, HIGH_PRECISION), price);
}

uint64_t synth_pool::_position_ratio(const position_t& pos) const {
   auto exposure = _synth_value(_shares_to_amount(pos.shares.amount, _pstate.split_multiplier), _pstate.last_price);
   auto debt     = _position_debt(pos, _pstate.last_price, _pstate.interest_index);
   return policy::collateral_ratio(pos.collateral.amount, debt, exposure);
}

} // namespace synthfi
