#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

#include <limits>
#include <string>

#define MINT(bank, to, quantity, memo) \
    {	synthfi::synth_token::mint_action act{ bank, { {_self, synthfi::token_active_perm} } };\
        act.send( to, quantity, memo );}

#define BURN(bank, owner, quantity, memo) \
    {	synthfi::synth_token::burn_action act{ bank, { {_self, synthfi::token_active_perm} } };\
        act.send( owner, quantity, memo );}

#define TRANSFER(bank, to, quantity, memo) \
    {	synthfi::synth_token::transfer_action act{ bank, { {_self, synthfi::token_active_perm} } };\
        act.send( _self, to, quantity, memo );}

#define APPLY_SPLIT(bank, sym_code, num, den) \
    {	synthfi::synth_token::applysplit_action act{ bank, { {_self, synthfi::token_active_perm} } };\
        act.send( sym_code, num, den );}

namespace synthfi
{

    using std::string;
    using namespace eosio;

    static constexpr uint64_t MULTIPLIER_BOOST          = 100'000'000;   // 1.0
    static constexpr eosio::name token_active_perm      {"active"_n};

    // 记账方式
    namespace accounting {
        static constexpr eosio::name SCALED         = "scaled"_n;        // 拆股时按倍数缩放余额
        static constexpr eosio::name PEGGED         = "pegged"_n;        // 锚定储备，不支持拆股
        static constexpr eosio::name PRICESCALED    = "pricescaled"_n;   // 以价值计量，拆股只记录
    }

    /**
     * `synth.token` is an AMAX token contract whose balances can be scaled by a split multiplier.
     *
     * Each symbol is created with an accounting variant. Under `scaled` accounting an `applysplit`
     * multiplies the stored multiplier by num/den; every `accounts` row keeps the multiplier it was last
     * normalized at, so a row's real balance is `balance * stats.multiplier / row.multiplier` and
     * no account has to be rewritten when a split happens. `pegged` symbols reject splits, and
     * `pricescaled` symbols record them without touching balances.
     *
     * Only the issuer may `mint`, `burn` and `applysplit`. The same contract is deployed both as the
     * synthetic asset and as a plain reserve token.
     */
    class [[eosio::contract( "synth.token" )]] synth_token : public contract
    {
    public:
        using contract::contract;

        ACTION create(const name &issuer, const asset &maximum_supply, const name &accounting);

        /**
         * Mints `quantity` straight into the `to` account. Issuer only.
         */
        ACTION mint(const name &to, const asset &quantity, const string &memo);

        /**
         * Burns `quantity` from `owner`. Issuer only, `owner` does not need to sign.
         */
        ACTION burn(const name &owner, const asset &quantity, const string &memo);

        ACTION transfer(const name &from,
                        const name &to,
                        const asset &quantity,
                        const string &memo);

        ACTION open(const name &owner, const symbol &symbol, const name &ram_payer);

        ACTION close(const name &owner, const symbol &symbol);

        /**
         * Applies a num:den split to `sym_code`, e.g. 2:1 doubles every balance and the supply.
         */
        ACTION applysplit(const symbol_code &sym_code, const uint64_t &num, const uint64_t &den);

        static name get_accounting(const name &token_contract_account, const symbol_code &sym_code)
        {
            stats statstable(token_contract_account, sym_code.raw());
            return statstable.get(sym_code.raw(), "token symbol not found").accounting;
        }

        static uint64_t get_multiplier(const name &token_contract_account, const symbol_code &sym_code)
        {
            stats statstable(token_contract_account, sym_code.raw());
            return statstable.get(sym_code.raw(), "token symbol not found").multiplier;
        }

        using mint_action       = eosio::action_wrapper<"mint"_n,       &synth_token::mint>;
        using burn_action       = eosio::action_wrapper<"burn"_n,       &synth_token::burn>;
        using transfer_action   = eosio::action_wrapper<"transfer"_n,   &synth_token::transfer>;
        using applysplit_action = eosio::action_wrapper<"applysplit"_n, &synth_token::applysplit>;

    private:
        struct [[eosio::table]] account
        {
            asset       balance;
            uint64_t    multiplier = MULTIPLIER_BOOST;      // 最近一次归一化时的倍数

            uint64_t primary_key() const { return balance.symbol.code().raw(); }

            EOSLIB_SERIALIZE( account, (balance)(multiplier) )
        };

        struct [[eosio::table]] currency_stats
        {
            asset       supply;
            asset       max_supply;
            name        issuer;
            name        accounting;
            uint64_t    multiplier = MULTIPLIER_BOOST;
            uint64_t    split_count = 0;

            uint64_t primary_key() const { return supply.symbol.code().raw(); }

            EOSLIB_SERIALIZE( currency_stats, (supply)(max_supply)(issuer)(accounting)(multiplier)(split_count) )
        };

        typedef eosio::multi_index<"accounts"_n, account> accounts;
        typedef eosio::multi_index<"stat"_n, currency_stats> stats;

        static int64_t _scale(int64_t amount, uint64_t to_multiplier, uint64_t from_multiplier) {
            if (to_multiplier == from_multiplier) return amount;
            int128_t v = (int128_t)amount * to_multiplier / from_multiplier;
            check(v <= (int128_t)asset::max_amount, "balance overflow after split");
            return (int64_t)v;
        }

        void sub_balance(const name &owner, const asset &value, const currency_stats &st);
        void add_balance(const name &owner, const asset &value, const name &ram_payer, const currency_stats &st);
    };

}
