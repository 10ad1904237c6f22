#include <synth.pool/synth.pool.hpp>
#include <synth.token/synth.token.hpp>

#include <synth.utils.hpp>
#include <safemath.hpp>

namespace synthfi {

using namespace std;
using namespace safemath;

static const string MEMO_DEPOSIT        = "deposit";
static const string MEMO_REDEEM         = "redeem";
static const string MEMO_LIQUIDATE      = "liquidate";
static const string MEMO_COLLATERAL     = "collateral";
static const string MEMO_LP_DEPOSIT     = "lpdeposit";
static const string MEMO_LP_COLLATERAL  = "lpcollateral";
static const string MEMO_LP_LIQUIDATE   = "liqlp";

void synth_pool::init(const name& admin, const name& oracle_contract, const name& oracle_code,
                      const extended_symbol& reserve, const extended_symbol& synth) {
   require_auth(get_self());
   CHECKC(_pstate.cycle_index == 0, err::STATE_MISMATCH, "pool already initialized");
   CHECKC(is_account(admin), err::ACCOUNT_INVALID, "admin not exist");
   CHECKC(is_account(oracle_contract), err::ACCOUNT_INVALID, "oracle contract not exist");
   CHECKC(is_account(reserve.get_contract()), err::ACCOUNT_INVALID, "reserve contract not exist");
   CHECKC(is_account(synth.get_contract()), err::ACCOUNT_INVALID, "synth contract not exist");
   CHECKC(reserve.get_symbol().is_valid() && synth.get_symbol().is_valid(), err::SYMBOL_MISMATCH, "invalid symbol");
   CHECKC(reserve.get_symbol().code() != synth.get_symbol().code(), err::SYMBOL_MISMATCH, "reserve and synth must differ");

   _gstate.admin              = admin;
   _gstate.oracle_contract    = oracle_contract;
   _gstate.oracle_code        = oracle_code;
   _gstate.reserve            = reserve;
   _gstate.synth              = synth;

   auto now = time_point_sec(current_time_point());
   auto zero_reserve = _reserve(0);
   auto zero_synth   = _synth(0);

   _pstate.cycle_index                = 1;
   _pstate.status                     = (uint8_t)cycle_status::ACTIVE;
   _pstate.status_updated_at          = now;
   _pstate.cycle_deposits             = zero_reserve;
   _pstate.cycle_deposit_collateral   = zero_reserve;
   _pstate.cycle_redeem_shares        = zero_synth;
   _pstate.pending_add                = zero_reserve;
   _pstate.pending_reduce             = zero_reserve;
   _pstate.total_committed            = zero_reserve;
   _pstate.total_lp_collateral        = zero_reserve;
   _pstate.total_shares               = zero_synth;
   _pstate.total_principal            = zero_reserve;
   _pstate.total_user_collateral      = zero_reserve;
   _pstate.backing_reserve            = zero_reserve;
   _pstate.redemption_reserve         = zero_reserve;
   _pstate.interest_updated_at        = now;
   _pstate.interest_realized          = zero_reserve;
   _pstate.interest_paid              = zero_reserve;
   _pstate.protocol_fees              = zero_reserve;
   _pstate.split_multiplier           = MULTIPLIER_BOOST;
   _pstate.price_multiplier           = MULTIPLIER_BOOST;
   _pstate.last_price                 = zero_reserve;
   _pstate.halt_price                 = zero_reserve;
   _pstate.halt_reserve               = zero_reserve;
   _pstate.halt_shares                = zero_synth;

   cycle_t::tbl_t cycles(get_self(), get_self().value);
   _open_cycle(cycles, _pstate.cycle_index, now);
}

void synth_pool::setcycle(const uint32_t& cycle_length_sec, const uint32_t& rebalance_length_sec,
                          const uint32_t& halt_threshold_sec, const uint32_t& price_stale_sec) {
   require_auth(_gstate.admin);
   CHECKC(cycle_length_sec > 0 && rebalance_length_sec > 0, err::NOT_POSITIVE, "cycle lengths must be positive");
   CHECKC(halt_threshold_sec > 0 && price_stale_sec > 0, err::NOT_POSITIVE, "thresholds must be positive");

   _gstate.cycle_length_sec      = cycle_length_sec;
   _gstate.rebalance_length_sec  = rebalance_length_sec;
   _gstate.halt_threshold_sec    = halt_threshold_sec;
   _gstate.price_stale_sec       = price_stale_sec;
}

void synth_pool::settolerance(const uint64_t& price_tolerance_bp) {
   require_auth(_gstate.admin);
   CHECKC(price_tolerance_bp > 0 && price_tolerance_bp <= RATE_SCALE, err::PARAM_ERROR, "tolerance must be within 0-100% in bps");
   _gstate.price_tolerance_bp = price_tolerance_bp;
}

void synth_pool::setpolicy(const policy_conf& conf) {
   require_auth(_gstate.admin);
   CHECKC(policy::validate(conf), err::PARAM_ERROR, "invalid policy parameters");
   _gstate.policy = conf;
}

void synth_pool::setfee(const uint64_t& protocol_fee_bp) {
   require_auth(_gstate.admin);
   CHECKC(protocol_fee_bp <= RATE_SCALE, err::PARAM_ERROR, "fee must be within 0-100% in bps");
   _gstate.protocol_fee_bp = protocol_fee_bp;
}

void synth_pool::setenabled(const bool& enabled) {
   require_auth(_gstate.admin);
   _gstate.enabled = enabled;
}

void synth_pool::claimfees(const name& to) {
   require_auth(_gstate.admin);
   CHECKC(is_account(to), err::ACCOUNT_INVALID, "account not exist");

   auto fees = _pstate.protocol_fees;
   CHECKC(fees.amount > 0, err::NOTHING_TO_CLAIM, "no protocol fees");
   auto available = _pstate.interest_realized - _pstate.interest_paid;
   CHECKC(available >= fees, err::INSUFFICIENT_LIQUIDITY, "fees not yet realized, available: " + available.to_string());

   _pstate.interest_paid += fees;
   _pstate.protocol_fees.amount = 0;
   _transfer_out(_gstate.reserve, to, fees.amount, "protocol fees");
}

void synth_pool::on_transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   CHECKC(_gstate.enabled, err::PAUSED, "not effective yet");
   CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "quantity must be positive");

   auto token_bank = get_first_receiver();
   auto parts      = split(memo, ":");

   if (quantity.symbol == _gstate.reserve.get_symbol()) {
      CHECKC(token_bank == _gstate.reserve.get_contract(), err::CONTRACT_MISMATCH, "reserve contract mismatch");

      if (parts[0] == MEMO_DEPOSIT) {
         CHECKC(parts.size() == 2, err::MEMO_FORMAT_ERROR, "memo format error, expect deposit:<collateral>");
         _on_deposit(from, quantity, parts[1]);

      } else if (parts[0] == MEMO_COLLATERAL) {
         CHECKC(parts.size() <= 2, err::MEMO_FORMAT_ERROR, "memo format error, expect collateral[:<owner>]");
         auto owner = parts.size() == 2 ? name(parts[1]) : from;
         _on_add_collateral(owner, quantity);

      } else if (parts[0] == MEMO_LP_DEPOSIT) {
         CHECKC(parts.size() == 1, err::MEMO_FORMAT_ERROR, "memo format error, expect lpdeposit");
         _on_lp_deposit(from, quantity, true);

      } else if (parts[0] == MEMO_LP_COLLATERAL) {
         CHECKC(parts.size() == 2, err::MEMO_FORMAT_ERROR, "memo format error, expect lpcollateral:<lp>");
         _on_lp_deposit(name(parts[1]), quantity, false);

      } else if (parts[0] == MEMO_LP_LIQUIDATE) {
         CHECKC(parts.size() == 3, err::MEMO_FORMAT_ERROR, "memo format error, expect liqlp:<target>:<amount>");
         auto amount = to_uint64(parts[2], "liquidation amount");
         CHECKC(amount <= (uint64_t)asset::max_amount, err::PARAM_ERROR, "liquidation amount overflow");
         _on_lp_liquidate(from, name(parts[1]), _reserve((int64_t)amount), quantity);

      } else {
         CHECKC(false, err::MEMO_FORMAT_ERROR, "memo format error");
      }
      return;
   }

   if (quantity.symbol == _gstate.synth.get_symbol()) {
      CHECKC(token_bank == _gstate.synth.get_contract(), err::CONTRACT_MISMATCH, "synth contract mismatch");

      if (parts[0] == MEMO_REDEEM) {
         CHECKC(parts.size() == 1, err::MEMO_FORMAT_ERROR, "memo format error, expect redeem");
         _on_redeem(from, quantity);

      } else if (parts[0] == MEMO_LIQUIDATE) {
         CHECKC(parts.size() == 2, err::MEMO_FORMAT_ERROR, "memo format error, expect liquidate:<target>");
         _on_liquidate(from, name(parts[1]), quantity);

      } else {
         CHECKC(false, err::MEMO_FORMAT_ERROR, "memo format error");
      }
      return;
   }

   CHECKC(false, err::SYMBOL_MISMATCH, "symbol not supported: " + quantity.symbol.code().to_string());
}

void synth_pool::tgetrate(const uint64_t& util_bps) {
   auto rate = policy::interest_rate(_gstate.policy, util_bps);
   CHECKC(false, err::SYSTEM_ERROR, "rate: " + to_string(rate));
}

void synth_pool::tgetindex(const uint64_t& rate_bps, const uint32_t& elapsed_sec) {
   auto index = policy::accrue_index(HIGH_PRECISION, rate_bps, elapsed_sec);
   CHECKC(false, err::SYSTEM_ERROR, "index: " + uint128_to_string(index));
}

void synth_pool::tgethealth(const name& owner) {
   position_t::tbl_t positions(get_self(), get_self().value);
   auto itr = positions.find(owner.value);
   CHECKC(itr != positions.end(), err::RECORD_NOT_FOUND, "position not found");

   auto value  = _synth_value(_shares_to_amount(itr->shares.amount, _pstate.split_multiplier), _pstate.last_price);
   auto ratio  = _position_ratio(*itr);
   auto tier   = value <= 0 ? policy::HEALTHY
               : policy::health(ratio, _gstate.policy.user_healthy_ratio, _gstate.policy.user_liquidation_ratio);
   CHECKC(false, err::SYSTEM_ERROR, "health: " + to_string((int)tier) + " ratio: " + to_string(ratio));
}

void synth_pool::tgetlphealth(const name& lp) {
   lp_t::tbl_t lps(get_self(), get_self().value);
   auto itr = lps.find(lp.value);
   CHECKC(itr != lps.end(), err::RECORD_NOT_FOUND, "lp not found");

   auto exposure  = _lp_exposure(*itr);
   auto ratio     = policy::collateral_ratio(itr->collateral.amount, 0, exposure);
   auto tier      = policy::health_of(itr->collateral.amount, 0, exposure,
                                      _gstate.policy.lp_healthy_ratio, _gstate.policy.lp_liquidation_ratio);
   CHECKC(false, err::SYSTEM_ERROR, "health: " + to_string((int)tier) + " ratio: " + to_string(ratio));
}

void synth_pool::tgetavail() {
   CHECKC(false, err::SYSTEM_ERROR, "available: " + _reserve(_available_liquidity()).to_string());
}

void synth_pool::notifycycle(const cycle_log_t& log) {
   require_auth(get_self());
   require_recipient(get_self());
}

void synth_pool::notifyrebal(const rebalance_log_t& log) {
   require_auth(get_self());
   require_recipient(get_self());
}

void synth_pool::notifyliq(const liquidation_log_t& log) {
   require_auth(get_self());
   require_recipient(get_self());
}

// ========= helpers =========

void synth_pool::_check_enabled() const {
   CHECKC(_gstate.enabled, err::PAUSED, "not effective yet");
}

void synth_pool::_check_status(cycle_status status, const string& msg) const {
   CHECKC(_status() == status, err::STATE_MISMATCH, msg);
}

int64_t synth_pool::_shares_to_amount(int64_t shares, uint64_t multiplier) const {
   return mul_div(shares, (int64_t)multiplier, (int64_t)MULTIPLIER_BOOST);
}

int64_t synth_pool::_amount_to_shares(int64_t amount, uint64_t multiplier) const {
   return mul_div(amount, (int64_t)MULTIPLIER_BOOST, (int64_t)multiplier);
}

// 合成资产数量 * 价格 => 储备最小单位
int64_t synth_pool::_synth_value(int64_t synth_amount, const asset& price) const {
   if (synth_amount <= 0 || price.amount <= 0) return 0;
   return mul_div(synth_amount, price.amount, calc_precision(_gstate.synth.get_symbol().precision()));
}

// 预言机报价 => 池内计价单位
asset synth_pool::_pool_price(const asset& oracle_price) const {
   if (_pstate.price_multiplier == MULTIPLIER_BOOST) return oracle_price;
   return asset(mul_div(oracle_price.amount, (int64_t)_pstate.price_multiplier, (int64_t)MULTIPLIER_BOOST),
                oracle_price.symbol);
}

int64_t synth_pool::_outstanding_value() const {
   return _synth_value(_shares_to_amount(_pstate.total_shares.amount, _pstate.split_multiplier), _pstate.last_price);
}

int64_t synth_pool::_utilized() const {
   return _outstanding_value() + _pstate.cycle_deposits.amount;
}

int64_t synth_pool::_available_liquidity() const {
   return policy::available_liquidity(_pstate.total_committed.amount, _pstate.pending_add.amount,
                                      _pstate.pending_reduce.amount, _utilized());
}

void synth_pool::_transfer_out(const extended_symbol& token, const name& to, int64_t amount, const string& memo) {
   if (amount <= 0) return;
   TRANSFER(token.get_contract(), to, asset(amount, token.get_symbol()), memo);
}

const price_t& synth_pool::_get_oracle_price(price_t::idx_t& prices) const {
   auto itr = prices.find(_gstate.oracle_code.value);
   CHECKC(itr != prices.end(), err::RECORD_NOT_FOUND, "oracle price not found: " + _gstate.oracle_code.to_string());
   CHECKC(itr->price.symbol == _gstate.reserve.get_symbol(), err::SYMBOL_MISMATCH, "oracle quote symbol mismatch");
   return *itr;
}

void synth_pool::_notify_cycle(uint64_t cycle, cycle_status status, const asset& price) {
   notifycycle_action act{ _self, { {_self, active_perm} } };
   act.send(cycle_log_t{ cycle, (uint8_t)status, price, time_point_sec(current_time_point()) });
}

} // namespace synthfi
