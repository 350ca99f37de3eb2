#pragma once

#include "fundmedb.hpp"
#include <crowdfund/errors.hpp>
#include <fund.me/netconfig.hpp>

namespace crowdfund {

using namespace eosio;
using namespace std;
using namespace flon;
using namespace wasm::db;

/**
 * @contract fund.me
 * @brief 众筹合约
 *
 *  - 任何人向本合约转入 FLON 即为出资, USD 价值 (经报价合约换算) 须不低于 5 USD
 *  - owner 可一次性提走全部余额, 同时清空出资记录
 *  - owner 与报价合约在 init 时绑定, 之后不可修改
 */
class [[eosio::contract("fund.me")]] fundme : public contract {
private:
    dbc                 _db;
    global_singleton    _global;
    global_t            _gstate;

public:
    using contract::contract;

    fundme(eosio::name receiver, eosio::name code, datastream<const char*> ds)
        : contract(receiver, code, ds),
          _db(get_self()),
          _global(get_self(), get_self().value)
    {
        _gstate = _global.exists() ? _global.get() : global_t{};
    }

    /**
     * Binds owner and price feed, once only.
     * @param owner     the only account allowed to withdraw
     * @param network   profile in DEFAULT_NETWORK_CONFIGS the price feed is resolved from
     */
    ACTION init( const name& owner, const name& network );

    /**
     * Fund with native currency, any memo.
     */
    [[eosio::on_notify("*::transfer")]]
    void on_transfer( const name& from, const name& to, const asset& quantity, const string& memo );

    ACTION withdraw( const name& caller );

    // same result as withdraw, funders are read into memory once before the reset loop
    ACTION cheapwithdrw( const name& caller );

    [[eosio::action, eosio::read_only]] uint64_t    getversion();
    [[eosio::action, eosio::read_only]] name        getowner();
    [[eosio::action, eosio::read_only]] name        getpricefeed();
    [[eosio::action, eosio::read_only]] network_config_t getnetconf( const name& network );
    [[eosio::action, eosio::read_only]] uint64_t    getminusd();
    [[eosio::action, eosio::read_only]] asset       getfunded( const name& funder );
    [[eosio::action, eosio::read_only]] name        getfunder( const uint64_t& index );
    [[eosio::action, eosio::read_only]] int128_t    getusdvalue( const asset& quantity );

    using init_action           = eosio::action_wrapper<"init"_n,          &fundme::init>;
    using withdraw_action       = eosio::action_wrapper<"withdraw"_n,      &fundme::withdraw>;
    using cheapwithdrw_action   = eosio::action_wrapper<"cheapwithdrw"_n,  &fundme::cheapwithdrw>;

private:
    void _fund( const name& funder, const asset& quantity );
    void _check_owner( const name& caller );
    void _settle( const name& withdraw_type );

    asset _get_balance( const name& token_contract, const name& owner, const symbol& sym );

}; //contract fundme

} // namespace crowdfund
