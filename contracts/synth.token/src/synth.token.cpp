#include <synth.token/synth.token.hpp>

namespace synthfi {

void synth_token::create(const name &issuer, const asset &maximum_supply, const name &accounting)
{
    require_auth(get_self());

    auto sym = maximum_supply.symbol;
    check( sym.is_valid(), "invalid symbol name" );
    check( maximum_supply.is_valid(), "invalid supply");
    check( maximum_supply.amount > 0, "max-supply must be positive");
    check( is_account(issuer), "issuer account does not exist" );
    check( accounting == accounting::SCALED || accounting == accounting::PEGGED
           || accounting == accounting::PRICESCALED, "unknown accounting: " + accounting.to_string() );

    stats statstable( get_self(), sym.code().raw() );
    auto existing = statstable.find( sym.code().raw() );
    check( existing == statstable.end(), "token with symbol already exists" );

    statstable.emplace( get_self(), [&]( auto& s ) {
       s.supply.symbol = maximum_supply.symbol;
       s.max_supply    = maximum_supply;
       s.issuer        = issuer;
       s.accounting    = accounting;
       s.multiplier    = MULTIPLIER_BOOST;
    });
}

void synth_token::mint(const name &to, const asset &quantity, const string &memo)
{
    auto sym = quantity.symbol;
    check( sym.is_valid(), "invalid symbol name" );
    check( memo.size() <= 256, "memo has more than 256 bytes" );

    stats statstable( get_self(), sym.code().raw() );
    const auto& st = statstable.get( sym.code().raw(), "token with symbol does not exist, create token before mint" );
    require_auth( st.issuer );
    check( is_account(to), "to account does not exist" );
    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must mint positive quantity" );
    check( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );
    check( quantity.amount <= st.max_supply.amount - st.supply.amount, "quantity exceeds available supply");

    statstable.modify( st, same_payer, [&]( auto& s ) {
       s.supply += quantity;
    });

    add_balance( to, quantity, st.issuer, st );
}

void synth_token::burn(const name &owner, const asset &quantity, const string &memo)
{
    auto sym = quantity.symbol;
    check( sym.is_valid(), "invalid symbol name" );
    check( memo.size() <= 256, "memo has more than 256 bytes" );

    stats statstable( get_self(), sym.code().raw() );
    const auto& st = statstable.get( sym.code().raw(), "token with symbol does not exist" );
    require_auth( st.issuer );
    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must burn positive quantity" );
    check( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );
    check( st.supply >= quantity, "supply over-burnt" );

    statstable.modify( st, same_payer, [&]( auto& s ) {
       s.supply -= quantity;
    });

    sub_balance( owner, quantity, st );
}

void synth_token::transfer(const name &from, const name &to, const asset &quantity, const string &memo)
{
    require_auth( from );

    check( from != to, "cannot transfer to self" );
    check( is_account( to ), "to account does not exist");
    auto sym = quantity.symbol.code();
    stats statstable( get_self(), sym.raw() );
    const auto& st = statstable.get( sym.raw(), "token with symbol does not exist" );

    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must transfer positive quantity" );
    check( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );
    check( memo.size() <= 256, "memo has more than 256 bytes" );

    require_recipient( from );
    require_recipient( to );

    auto payer = has_auth( to ) ? to : from;

    sub_balance( from, quantity, st );
    add_balance( to, quantity, payer, st );
}

void synth_token::open(const name &owner, const symbol &symbol, const name &ram_payer)
{
    require_auth( ram_payer );
    check( is_account( owner ), "owner account does not exist" );

    auto sym_code_raw = symbol.code().raw();
    stats statstable( get_self(), sym_code_raw );
    const auto& st = statstable.get( sym_code_raw, "symbol does not exist" );
    check( st.supply.symbol == symbol, "symbol precision mismatch" );

    accounts acnts( get_self(), owner.value );
    auto it = acnts.find( sym_code_raw );
    if( it == acnts.end() ) {
       acnts.emplace( ram_payer, [&]( auto& a ){
         a.balance    = asset{0, symbol};
         a.multiplier = st.multiplier;
       });
    }
}

void synth_token::close(const name &owner, const symbol &symbol)
{
    require_auth( owner );
    accounts acnts( get_self(), owner.value );
    auto it = acnts.find( symbol.code().raw() );
    check( it != acnts.end(), "Balance row already deleted or never existed. Action won't have any effect." );
    check( it->balance.amount == 0, "Cannot close because the balance is not zero." );
    acnts.erase( it );
}

void synth_token::applysplit(const symbol_code &sym_code, const uint64_t &num, const uint64_t &den)
{
    stats statstable( get_self(), sym_code.raw() );
    const auto& st = statstable.get( sym_code.raw(), "token with symbol does not exist" );
    require_auth( st.issuer );
    check( num > 0 && den > 0, "split ratio must be positive" );
    check( num != den, "split ratio must not be 1:1" );
    check( st.accounting != accounting::PEGGED, "pegged token can not split" );

    statstable.modify( st, same_payer, [&]( auto& s ) {
       s.split_count++;
       if (s.accounting != accounting::SCALED) return;

       int128_t multiplier = (int128_t)s.multiplier * num / den;
       check( multiplier > 0 && multiplier <= std::numeric_limits<uint64_t>::max(), "multiplier out of range" );
       s.multiplier         = (uint64_t)multiplier;
       s.supply.amount      = _scale( s.supply.amount, num, den );
       s.max_supply.amount  = _scale( s.max_supply.amount, num, den );
    });
}

void synth_token::sub_balance(const name &owner, const asset &value, const currency_stats &st)
{
    accounts from_acnts( get_self(), owner.value );
    const auto& from = from_acnts.get( value.symbol.code().raw(), "no balance object found" );
    auto balance = _scale( from.balance.amount, st.multiplier, from.multiplier );
    check( balance >= value.amount, "overdrawn balance" );

    from_acnts.modify( from, same_payer, [&]( auto& a ) {
       a.balance.amount = balance - value.amount;
       a.multiplier     = st.multiplier;
    });
}

void synth_token::add_balance(const name &owner, const asset &value, const name &ram_payer, const currency_stats &st)
{
    accounts to_acnts( get_self(), owner.value );
    auto to = to_acnts.find( value.symbol.code().raw() );
    if( to == to_acnts.end() ) {
       to_acnts.emplace( ram_payer, [&]( auto& a ){
         a.balance    = value;
         a.multiplier = st.multiplier;
       });
    } else {
       to_acnts.modify( to, same_payer, [&]( auto& a ) {
         a.balance.amount = _scale( a.balance.amount, st.multiplier, a.multiplier ) + value.amount;
         a.multiplier     = st.multiplier;
       });
    }
}

} /// namespace synthfi
