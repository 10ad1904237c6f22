#include "synthfi_tester.hpp"

class pricescaled_tester : public synthfi_tester {
public:
   pricescaled_tester() : synthfi_tester("pricescaled") {}
};

class pegged_tester : public synthfi_tester {
public:
   pegged_tester() : synthfi_tester("pegged") {}
};

BOOST_AUTO_TEST_SUITE(cycle_tests)

BOOST_FIXTURE_TEST_CASE( offchain_preconditions, synthfi_tester ) try {

   BOOST_REQUIRE_EQUAL( 1u, cycle_index() );
   BOOST_REQUIRE_EQUAL( 0u, pool_status() );
   BOOST_REQUIRE_EQUAL( err_msg(105, "cycle not finished yet"), offchain() );

   BOOST_REQUIRE_EQUAL( success(), set_price( U("100.000000"), false ) );
   produce_block( fc::seconds(CYCLE_SEC + 1) );
   BOOST_REQUIRE_EQUAL( err_msg(106, "market is closed"), offchain() );
   BOOST_REQUIRE_EQUAL( err_msg(101, "pool not in offchain rebalancing"), onchain() );

   BOOST_REQUIRE_EQUAL( success(), set_price( U("100.000000"), true ) );
   BOOST_REQUIRE_EQUAL( success(), offchain() );
   BOOST_REQUIRE_EQUAL( 1u, pool_status() );
   BOOST_REQUIRE_EQUAL( 1u, get_cycle( 1 )["status"].as_uint64() );

   // 链下调仓期间暂停用户操作
   BOOST_REQUIRE_EQUAL( err_msg(101, "pool not active"), deposit( ALICE, U("100.000000"), U("20.000000") ) );
   BOOST_REQUIRE_EQUAL( err_msg(101, "pool not active"), addliq( LP_ALPHA, U("100.000000") ) );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( onchain_requires_fresh_closed_price, synthfi_tester ) try {

   close_cycle( U("100.000000") );

   BOOST_REQUIRE_EQUAL( err_msg(105, "offchain rebalance not finished yet"), onchain() );
   produce_block( fc::seconds(REBALANCE_SEC + 1) );
   BOOST_REQUIRE_EQUAL( err_msg(106, "market is still open"), onchain() );

   BOOST_REQUIRE_EQUAL( success(), set_price( U("100.000000"), false ) );
   produce_block( fc::seconds(STALE_SEC + 1) );
   BOOST_REQUIRE_EQUAL( err_msg(501, "oracle price is stale"), onchain() );

   BOOST_REQUIRE_EQUAL( success(), set_price( U("101.000000"), false ) );
   BOOST_REQUIRE_EQUAL( success(), onchain() );

   // 无 LP 时立即结算
   BOOST_REQUIRE_EQUAL( 0u, pool_status() );
   BOOST_REQUIRE_EQUAL( 2u, cycle_index() );
   auto cycle = get_cycle( 1 );
   BOOST_REQUIRE_EQUAL( 4u, cycle["status"].as_uint64() );
   BOOST_REQUIRE_EQUAL( U("101.000000"), cycle["settlement_price"].as<asset>() );
   BOOST_REQUIRE_EQUAL( 0u, get_cycle( 2 )["status"].as_uint64() );
   BOOST_REQUIRE_EQUAL( U("101.000000"), get_pool_state()["last_price"].as<asset>() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( deviation_resolved_by_admin, synthfi_tester ) try {

   bootstrap_lps();

   close_cycle( U("100.000000") );
   BOOST_REQUIRE_EQUAL( success(), set_price( U("125.000000"), false ) );
   produce_block( fc::seconds(REBALANCE_SEC + 1) );
   BOOST_REQUIRE_EQUAL( err_msg(502, "price deviation too high: 125.000000 USDT vs 100.000000 USDT"), onchain() );

   BOOST_REQUIRE_EQUAL( error("missing authority of synth.admin"),
                        push( POOL, BOB, "resolvedev"_n, mvo()("is_split", false)("num", 0)("den", 0) ) );
   BOOST_REQUIRE_EQUAL( err_msg(503, "no unhandled split flagged by oracle"), resolvedev( true, 2, 1 ) );
   BOOST_REQUIRE_EQUAL( success(), resolvedev( false, 0, 0 ) );
   BOOST_REQUIRE_EQUAL( true, get_cycle( cycle_index() )["deviation_resolved"].as_bool() );
   produce_blocks();
   BOOST_REQUIRE_EQUAL( err_msg(101, "deviation already resolved"), resolvedev( false, 0, 0 ) );

   BOOST_REQUIRE_EQUAL( success(), onchain() );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_ALPHA, U("125.000000") ) );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_BETA, U("125.000000") ) );
   BOOST_REQUIRE_EQUAL( 0u, pool_status() );
   BOOST_REQUIRE_EQUAL( U("125.000000"), get_pool_state()["last_price"].as<asset>() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( stock_split_rescales_balances, synthfi_tester ) try {

   bootstrap_lps();
   bootstrap_alice();

   close_cycle( U("100.000000") );
   BOOST_REQUIRE_EQUAL( success(), flag_split( 2, 1 ) );
   BOOST_REQUIRE_EQUAL( success(), set_price( U("50.000000"), false ) );
   produce_block( fc::seconds(REBALANCE_SEC + 1) );

   BOOST_REQUIRE_EQUAL( err_msg(502, "split flagged by oracle, resolution required"), onchain() );
   BOOST_REQUIRE_EQUAL( err_msg(503, "split ratio not confirmed by oracle: 2:1"), resolvedev( true, 3, 1 ) );
   BOOST_REQUIRE_EQUAL( success(), resolvedev( true, 2, 1 ) );

   auto state = get_pool_state();
   BOOST_REQUIRE_EQUAL( 200000000u, state["split_multiplier"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 1u, state["handled_split_id"].as_uint64() );
   BOOST_REQUIRE_EQUAL( U("50.000000"), state["last_price"].as<asset>() );

   // 持有人余额随拆股翻倍，仓位份额不变
   BOOST_REQUIRE_EQUAL( X("200.000000"), xaapl_balance( ALICE ) );
   BOOST_REQUIRE_EQUAL( 200000000u, get_stats( SYNTH_TOKEN, XAAPL_SYM )["multiplier"].as_uint64() );
   BOOST_REQUIRE_EQUAL( X("100.000000"), get_position( ALICE )["shares"].as<asset>() );

   BOOST_REQUIRE_EQUAL( success(), onchain() );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_ALPHA, U("50.000000") ) );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_BETA, U("50.000000") ) );
   BOOST_REQUIRE_EQUAL( 0u, pool_status() );

   auto cycle = get_cycle( cycle_index() - 1 );
   BOOST_REQUIRE_EQUAL( 2u, cycle["split_num"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 1u, cycle["split_den"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 200000000u, cycle["multiplier"].as_uint64() );

   // 拆股后按新单位赎回
   BOOST_REQUIRE_EQUAL( success(), redeem( ALICE, X("100.000000") ) );
   BOOST_REQUIRE_EQUAL( X("50.000000"), get_request( ALICE )["amount"].as<asset>() );
   auto before = usdt_balance( ALICE );
   settle_cycle( U("50.000000"), { LP_ALPHA, LP_BETA } );
   BOOST_REQUIRE_EQUAL( success(), claimreserve( ALICE ) );

   // 100 * 50 价值 + 1000 抵押
   auto gain = usdt_balance( ALICE ) - before;
   BOOST_REQUIRE( gain > U("5999.900000") );
   BOOST_REQUIRE( gain <= U("6000.000000") );
   BOOST_REQUIRE_EQUAL( X("100.000000"), xaapl_balance( ALICE ) );
   BOOST_REQUIRE_EQUAL( X("50.000000"), get_position( ALICE )["shares"].as<asset>() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( pricescaled_split_rescales_price, pricescaled_tester ) try {

   bootstrap_lps();
   bootstrap_alice();

   close_cycle( U("100.000000") );
   BOOST_REQUIRE_EQUAL( success(), flag_split( 2, 1 ) );
   BOOST_REQUIRE_EQUAL( success(), set_price( U("50.000000"), false ) );
   produce_block( fc::seconds(REBALANCE_SEC + 1) );

   BOOST_REQUIRE_EQUAL( err_msg(502, "split flagged by oracle, resolution required"), onchain() );
   BOOST_REQUIRE_EQUAL( success(), resolvedev( true, 2, 1 ) );

   // 份额倍数不变，报价按拆股比例折回
   auto state = get_pool_state();
   BOOST_REQUIRE_EQUAL( 100000000u, state["split_multiplier"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 200000000u, state["price_multiplier"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 1u, state["handled_split_id"].as_uint64() );
   BOOST_REQUIRE_EQUAL( U("100.000000"), state["last_price"].as<asset>() );

   auto stats = get_stats( SYNTH_TOKEN, XAAPL_SYM );
   BOOST_REQUIRE_EQUAL( 100000000u, stats["multiplier"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 1u, stats["split_count"].as_uint64() );
   BOOST_REQUIRE_EQUAL( X("100.000000"), xaapl_balance( ALICE ) );

   BOOST_REQUIRE_EQUAL( success(), onchain() );
   BOOST_REQUIRE_EQUAL( U("100.000000"), get_cycle( cycle_index() )["settlement_price"].as<asset>() );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_ALPHA, U("50.000000") ) );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_BETA, U("50.000000") ) );
   BOOST_REQUIRE_EQUAL( 0u, pool_status() );

   // 全部余额按原价值赎回
   BOOST_REQUIRE_EQUAL( success(), redeem( ALICE, X("100.000000") ) );
   BOOST_REQUIRE_EQUAL( X("100.000000"), get_request( ALICE )["amount"].as<asset>() );
   auto before = usdt_balance( ALICE );
   settle_cycle( U("50.000000"), { LP_ALPHA, LP_BETA } );
   BOOST_REQUIRE_EQUAL( success(), claimreserve( ALICE ) );

   // 100 * 50 * 2 价值 + 2000 抵押
   auto gain = usdt_balance( ALICE ) - before;
   BOOST_REQUIRE( gain > U("11999.900000") );
   BOOST_REQUIRE( gain <= U("12000.000000") );
   BOOST_REQUIRE( get_position( ALICE ).is_null() );
   BOOST_REQUIRE_EQUAL( X("0.000000"), xaapl_balance( ALICE ) );
   BOOST_REQUIRE_EQUAL( X("0.000000"), get_pool_state()["total_shares"].as<asset>() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( pegged_synth_rejects_split, pegged_tester ) try {

   bootstrap_lps();

   close_cycle( U("100.000000") );
   BOOST_REQUIRE_EQUAL( success(), flag_split( 2, 1 ) );
   BOOST_REQUIRE_EQUAL( success(), set_price( U("50.000000"), false ) );
   produce_block( fc::seconds(REBALANCE_SEC + 1) );

   BOOST_REQUIRE_EQUAL( err_msg(503, "pegged synth can not split"), resolvedev( true, 2, 1 ) );
   BOOST_REQUIRE_EQUAL( 100000000u, get_pool_state()["split_multiplier"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 0u, get_pool_state()["handled_split_id"].as_uint64() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( split_dust_redeemable, synthfi_tester ) try {

   bootstrap_lps();
   BOOST_REQUIRE_EQUAL( success(), deposit( ALICE, U("10000.000100"), U("2100.000000") ) );
   settle_cycle( U("100.000000"), { LP_ALPHA, LP_BETA } );
   BOOST_REQUIRE_EQUAL( success(), claimasset( ALICE ) );
   BOOST_REQUIRE_EQUAL( X("100.000001"), xaapl_balance( ALICE ) );

   // 3:2 拆股后末位份额无法单独表示
   close_cycle( U("100.000000") );
   BOOST_REQUIRE_EQUAL( success(), flag_split( 3, 2 ) );
   BOOST_REQUIRE_EQUAL( success(), set_price( U("66.666667"), false ) );
   produce_block( fc::seconds(REBALANCE_SEC + 1) );
   BOOST_REQUIRE_EQUAL( success(), resolvedev( true, 3, 2 ) );
   BOOST_REQUIRE_EQUAL( 150000000u, get_pool_state()["split_multiplier"].as_uint64() );
   BOOST_REQUIRE_EQUAL( success(), onchain() );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_ALPHA, U("66.666667") ) );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_BETA, U("66.666667") ) );
   BOOST_REQUIRE_EQUAL( 0u, pool_status() );
   BOOST_REQUIRE_EQUAL( X("150.000001"), xaapl_balance( ALICE ) );

   BOOST_REQUIRE_EQUAL( err_msg(202, "amount not representable at current split multiplier"),
                        redeem( ALICE, X("100.000001") ) );

   // 全额赎回取全部份额
   BOOST_REQUIRE_EQUAL( success(), redeem( ALICE, X("150.000001") ) );
   BOOST_REQUIRE_EQUAL( X("100.000001"), get_request( ALICE )["amount"].as<asset>() );

   settle_cycle( U("66.666667"), { LP_ALPHA, LP_BETA } );
   BOOST_REQUIRE_EQUAL( success(), claimreserve( ALICE ) );
   BOOST_REQUIRE( get_position( ALICE ).is_null() );
   BOOST_REQUIRE_EQUAL( X("0.000000"), xaapl_balance( ALICE ) );
   BOOST_REQUIRE_EQUAL( X("0.000000"), get_pool_state()["total_shares"].as<asset>() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( rebalance_within_session_range, synthfi_tester ) try {

   bootstrap_lps();
   BOOST_REQUIRE_EQUAL( success(), deposit( ALICE, U("15000.000000"), U("3000.000000") ) );

   close_cycle( U("100.000000") );
   BOOST_REQUIRE_EQUAL( success(), set_price( U("100.000000"), false, U("130.000000"), U("90.000000") ) );
   produce_block( fc::seconds(REBALANCE_SEC + 1) );
   BOOST_REQUIRE_EQUAL( success(), onchain() );

   auto cycle = get_cycle( cycle_index() );
   BOOST_REQUIRE_EQUAL( U("130.000000"), cycle["session_high"].as<asset>() );
   BOOST_REQUIRE_EQUAL( U("90.000000"), cycle["session_low"].as<asset>() );

   // 超出容忍度但在当日区间内
   BOOST_REQUIRE_EQUAL( err_msg(502, "price deviates from settlement price 100.000000 USDT"),
                        rebalance( LP_ALPHA, U("130.000001") ) );
   auto alpha_usdt = usdt_balance( LP_ALPHA );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_ALPHA, U("125.000000") ) );
   BOOST_REQUIRE_EQUAL( alpha_usdt + U("10000.000000"), usdt_balance( LP_ALPHA ) );

   // 低于区间时仍按容忍度判断
   BOOST_REQUIRE_EQUAL( err_msg(502, "price deviates from settlement price 100.000000 USDT"),
                        rebalance( LP_BETA, U("79.999999") ) );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_BETA, U("80.000000") ) );
   BOOST_REQUIRE_EQUAL( 0u, pool_status() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( rebalance_checks, synthfi_tester ) try {

   bootstrap_lps();
   BOOST_REQUIRE_EQUAL( success(), deposit( ALICE, U("15000.000000"), U("3000.000000") ) );

   close_cycle( U("100.000000") );
   BOOST_REQUIRE_EQUAL( err_msg(101, "pool not in onchain rebalancing"), rebalance( LP_ALPHA, U("100.000000") ) );
   open_settlement( U("100.000000") );
   BOOST_REQUIRE_EQUAL( 2u, pool_status() );

   auto cycle = get_cycle( cycle_index() );
   BOOST_REQUIRE_EQUAL( U("15000.000000"), cycle["net_flow"].as<asset>() );
   BOOST_REQUIRE_EQUAL( 2u, cycle["lp_count"].as_uint64() );

   BOOST_REQUIRE_EQUAL( err_msg(601, "lp not found: carol"), rebalance( CAROL, U("100.000000") ) );
   BOOST_REQUIRE_EQUAL( err_msg(502, "price deviates from settlement price 100.000000 USDT"),
                        rebalance( LP_ALPHA, U("120.000001") ) );
   BOOST_REQUIRE_EQUAL( err_msg(204, "price symbol mismatch"), rebalance( LP_ALPHA, X("100.000000") ) );

   // 净流入按承诺比例付给 LP
   auto alpha_usdt = usdt_balance( LP_ALPHA );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_ALPHA, U("110.000000") ) );
   BOOST_REQUIRE_EQUAL( alpha_usdt + U("10000.000000"), usdt_balance( LP_ALPHA ) );
   BOOST_REQUIRE_EQUAL( 2u, pool_status() );
   BOOST_REQUIRE_EQUAL( err_msg(104, "lp already rebalanced"), rebalance( LP_ALPHA, U("100.000000") ) );

   auto beta_usdt = usdt_balance( LP_BETA );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_BETA, U("100.000000") ) );
   BOOST_REQUIRE_EQUAL( beta_usdt + U("5000.000000"), usdt_balance( LP_BETA ) );

   BOOST_REQUIRE_EQUAL( 0u, pool_status() );
   cycle = get_cycle( cycle_index() - 1 );
   BOOST_REQUIRE_EQUAL( 4u, cycle["status"].as_uint64() );
   BOOST_REQUIRE_EQUAL( U("15000.000000"), cycle["settled_flow"].as<asset>() );
   BOOST_REQUIRE_EQUAL( 2u, cycle["settled_lp_count"].as_uint64() );
   BOOST_REQUIRE_EQUAL( U("0.000000"), get_pool_state()["backing_reserve"].as<asset>() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( missing_lp_settled_by_admin, synthfi_tester ) try {

   bootstrap_lps();
   bootstrap_alice();
   BOOST_REQUIRE_EQUAL( success(), deposit( BOB, U("5000.000000"), U("1000.000000") ) );

   close_cycle( U("100.000000") );
   open_settlement( U("100.000000") );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_ALPHA, U("100.000000") ) );

   BOOST_REQUIRE_EQUAL( err_msg(105, "halt threshold not reached"), forcerebal( LP_BETA ) );
   produce_block( fc::seconds(HALT_SEC + 1) );
   BOOST_REQUIRE_EQUAL( error("missing authority of synth.admin"),
                        push( POOL, BOB, "forcerebal"_n, mvo()("lp", LP_BETA) ) );
   BOOST_REQUIRE_EQUAL( err_msg(104, "lp already rebalanced"), forcerebal( LP_ALPHA ) );
   BOOST_REQUIRE_EQUAL( err_msg(601, "lp not found: carol"), forcerebal( CAROL ) );

   // 正向流入总是可结算
   auto index = cycle_index();
   auto beta_usdt = usdt_balance( LP_BETA );
   BOOST_REQUIRE_EQUAL( success(), forcerebal( LP_BETA ) );
   BOOST_REQUIRE_EQUAL( 0u, pool_status() );
   BOOST_REQUIRE_EQUAL( index + 1, cycle_index() );
   BOOST_REQUIRE_EQUAL( beta_usdt + U("1666.666667"), usdt_balance( LP_BETA ) );
   BOOST_REQUIRE_EQUAL( U("1666.666667"), get_lp( LP_BETA )["last_flow"].as<asset>() );

   auto cycle = get_cycle( index );
   BOOST_REQUIRE_EQUAL( 4u, cycle["status"].as_uint64() );
   BOOST_REQUIRE_EQUAL( U("5000.000000"), cycle["settled_flow"].as<asset>() );
   BOOST_REQUIRE_EQUAL( 2u, cycle["settled_lp_count"].as_uint64() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( missing_lp_halts_pool, synthfi_tester ) try {

   bootstrap_lps();
   bootstrap_alice();

   // lpbeta 只保留 3% 承诺额的抵押
   auto conf = default_policy();
   conf.set("lp_healthy_ratio", 300).set("lp_liquidation_ratio", 200);
   BOOST_REQUIRE_EQUAL( success(), setpolicy( conf ) );
   BOOST_REQUIRE_EQUAL( err_msg(402, "remaining collateral below required: 1500.000000 USDT"),
                        lp_action( LP_BETA, "lpreducecol"_n, U("28500.000001") ) );
   BOOST_REQUIRE_EQUAL( success(), lp_action( LP_BETA, "lpreducecol"_n, U("28500.000000") ) );
   BOOST_REQUIRE_EQUAL( success(), redeem( ALICE, X("50.000000") ) );

   close_cycle( U("100.000000") );
   open_settlement( U("100.000000") );
   BOOST_REQUIRE_EQUAL( success(), rebalance( LP_ALPHA, U("100.000000") ) );
   BOOST_REQUIRE_EQUAL( U("46666.666667"), get_lp( LP_ALPHA )["collateral"].as<asset>() );

   // 1500 抵押不足以承担 1666.666667 的赎回
   produce_block( fc::seconds(HALT_SEC + 1) );
   BOOST_REQUIRE_EQUAL( success(), forcerebal( LP_BETA ) );
   BOOST_REQUIRE_EQUAL( 3u, pool_status() );

   auto state = get_pool_state();
   BOOST_REQUIRE_EQUAL( U("100.000000"), state["halt_price"].as<asset>() );
   BOOST_REQUIRE_EQUAL( X("100.000000"), state["halt_shares"].as<asset>() );
   // lpalpha 的结算被回滚，再按承诺比例划出 6666.666666，lpbeta 只能划出 1500
   BOOST_REQUIRE_EQUAL( U("8166.666666"), state["halt_reserve"].as<asset>() );
   BOOST_REQUIRE_EQUAL( 3u, get_cycle( cycle_index() )["status"].as_uint64() );

   // 熔断后只允许退出
   BOOST_REQUIRE_EQUAL( err_msg(101, "pool not active"), deposit( BOB, U("100.000000"), U("20.000000") ) );
   BOOST_REQUIRE_EQUAL( err_msg(101, "pool not active"), redeem( ALICE, X("10.000000") ) );
   BOOST_REQUIRE_EQUAL( err_msg(101, "pool not in onchain rebalancing"), rebalance( LP_BETA, U("100.000000") ) );
   BOOST_REQUIRE_EQUAL( err_msg(602, "nothing to exit"), exitpool( BOB, X("0.000000") ) );

   // 挂单赎回先退回，再整体退出
   auto before = usdt_balance( ALICE );
   BOOST_REQUIRE_EQUAL( success(), exitpool( ALICE, X("100.000000") ) );
   BOOST_REQUIRE_EQUAL( X("0.000000"), xaapl_balance( ALICE ) );
   BOOST_REQUIRE( get_position( ALICE ).is_null() );
   BOOST_REQUIRE( get_request( ALICE ).is_null() );

   // 熔断储备 + 释放的抵押，扣除利息
   auto gain = usdt_balance( ALICE ) - before;
   BOOST_REQUIRE( gain > U("10166.500000") );
   BOOST_REQUIRE( gain <= U("10166.666666") );

   state = get_pool_state();
   BOOST_REQUIRE_EQUAL( X("0.000000"), state["halt_shares"].as<asset>() );
   BOOST_REQUIRE_EQUAL( U("0.000000"), state["halt_reserve"].as<asset>() );

   // LP 取回剩余抵押，未实现利息作废
   auto alpha_usdt = usdt_balance( LP_ALPHA );
   auto alpha_coll = get_lp( LP_ALPHA )["collateral"].as<asset>();
   BOOST_REQUIRE_EQUAL( U("43333.333334"), alpha_coll );
   BOOST_REQUIRE_EQUAL( success(), lp_action( LP_ALPHA, "lpexit"_n ) );
   BOOST_REQUIRE( usdt_balance( LP_ALPHA ) >= alpha_usdt + alpha_coll );
   BOOST_REQUIRE( get_lp( LP_ALPHA ).is_null() );

   BOOST_REQUIRE_EQUAL( U("0.000000"), get_lp( LP_BETA )["collateral"].as<asset>() );
   BOOST_REQUIRE_EQUAL( success(), lp_action( LP_BETA, "lpexit"_n ) );
   BOOST_REQUIRE( get_lp( LP_BETA ).is_null() );
   BOOST_REQUIRE_EQUAL( 0u, get_pool_state()["active_lp_count"].as_uint64() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( halt_partial_exit, synthfi_tester ) try {

   bootstrap_lps();
   bootstrap_alice();
   auto conf = default_policy();
   conf.set("lp_healthy_ratio", 300).set("lp_liquidation_ratio", 200);
   BOOST_REQUIRE_EQUAL( success(), setpolicy( conf ) );
   BOOST_REQUIRE_EQUAL( success(), lp_action( LP_BETA, "lpreducecol"_n, U("28500.000000") ) );
   BOOST_REQUIRE_EQUAL( success(), redeem( ALICE, X("50.000000") ) );

   // 两个 LP 都未结算
   close_cycle( U("100.000000") );
   open_settlement( U("100.000000") );
   produce_block( fc::seconds(HALT_SEC + 1) );
   BOOST_REQUIRE_EQUAL( success(), forcerebal( LP_BETA ) );
   BOOST_REQUIRE_EQUAL( 3u, pool_status() );
   BOOST_REQUIRE_EQUAL( U("8166.666666"), get_pool_state()["halt_reserve"].as<asset>() );

   // 熔断后不接纳新 LP，已有抵押仍可追加
   BOOST_REQUIRE_EQUAL( err_msg(101, "pool halted"), lp_deposit( CAROL, U("1.000000") ) );
   BOOST_REQUIRE_EQUAL( success(), lp_deposit( LP_ALPHA, U("1.000000") ) );
   BOOST_REQUIRE_EQUAL( success(), transfer( USDT_TOKEN, ALICE, POOL, U("1.000000"), "collateral" ) );
   BOOST_REQUIRE_EQUAL( U("2001.000000"), get_position( ALICE )["collateral"].as<asset>() );

   // 部分退出
   BOOST_REQUIRE_EQUAL( success(), exitpool( ALICE, X("40.000000") ) );
   BOOST_REQUIRE_EQUAL( X("60.000000"), xaapl_balance( ALICE ) );
   BOOST_REQUIRE_EQUAL( X("60.000000"), get_position( ALICE )["shares"].as<asset>() );
   BOOST_REQUIRE_EQUAL( U("1200.600000"), get_position( ALICE )["collateral"].as<asset>() );
   BOOST_REQUIRE_EQUAL( X("60.000000"), get_pool_state()["halt_shares"].as<asset>() );
   BOOST_REQUIRE_EQUAL( U("4900.000000"), get_pool_state()["halt_reserve"].as<asset>() );
   BOOST_REQUIRE_EQUAL( err_msg(401, "exceeds outstanding shares"), exitpool( ALICE, X("60.000001") ) );

} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
