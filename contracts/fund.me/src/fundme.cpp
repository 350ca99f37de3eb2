#include "fundme.hpp"
#include <price.feed/price_converter.hpp>
#include <flon/flon.token.hpp>

using namespace eosio;
using namespace crowdfund;
using namespace flon;

static constexpr eosio::name active_perm{"active"_n};

// ------------------- Internal functions ------------------------------------------------------
asset fundme::_get_balance(const name& token_contract, const name& owner, const symbol& sym) {
    eosio::multi_index<"accounts"_n, flon::token::account> account_tbl(token_contract, owner.value);
    auto itr = account_tbl.find(sym.code().raw());
    return itr == account_tbl.end() ? asset(0, sym) : itr->balance;
}

void fundme::_check_owner(const name& caller) {
    require_auth(caller);
    CHECKC( _gstate.initialized(), err::NOT_INITIALIZED, "fund.me not initialized" )
    CHECKC( caller == _gstate.owner, err::NOT_OWNER, "only owner can withdraw: " + caller.to_string() )
}

void fundme::_fund(const name& funder, const asset& quantity) {
    const time_point_sec now = time_point_sec(current_time_point());

    // === 换算 USD 价值并校验下限 ===
    const int128_t usd_value = price_converter::get_conversion_rate(quantity, _gstate.price_feed);
    CHECKC( usd_value >= (int128_t)MINIMUM_USD, err::INSUFFICIENT_CONTRIBUTION, "You need to spend more FLON!" )

    // === 累计出资 ===
    auto funded = funded_t( funder );
    if (!_db.get( funded ))
        funded.amount = asset(0, NATIVE_SYM);

    funded.amount           += quantity;
    funded.last_funded_at   = now;
    _db.set( funded, _self );

    // === 追加到 funders 序列 ===
    auto entry              = funder_t( _gstate.funder_count );
    entry.funder            = funder;
    entry.quantity          = quantity;
    entry.funded_at         = now;
    _db.set( entry, _self );

    _gstate.funder_count    += 1;
    _gstate.total_funded    += quantity;
    _global.set( _gstate, get_self() );
}

// Records the withdrawal, clears the counters and sends the whole balance to owner.
// Must run after the funded/funders rows are erased: a rejected transfer aborts the
// transaction and the erased rows come back with it.
void fundme::_settle(const name& withdraw_type) {
    const asset balance = _get_balance(NATIVE_BANK, get_self(), NATIVE_SYM);
    // inbound transfers always pass through _fund, only a transfer signed by this account can drain the balance
    CHECKC( balance >= _gstate.total_funded, err::TRANSFER_FAILED,
            "transfer failed: balance " + balance.to_string() + " below funded " + _gstate.total_funded.to_string() )

    auto log            = withdrawal_log_t( ++_gstate.last_withdrawal_id );
    log.owner           = _gstate.owner;
    log.quantity        = balance;
    log.funder_count    = _gstate.funder_count;
    log.withdraw_type   = withdraw_type;
    log.withdrawn_at    = time_point_sec(current_time_point());
    _db.set( log, _self );

    _gstate.funder_count = 0;
    _gstate.total_funded = asset(0, NATIVE_SYM);
    _global.set( _gstate, get_self() );

    // zero transfers are refused by the bank, an empty withdraw only resets bookkeeping
    if (balance.amount > 0) {
        TRANSFER( NATIVE_BANK, _gstate.owner, balance, "withdraw from " + get_self().to_string() );
    }
}

// ------------------- Actions -----------------------------------------------------------------
void fundme::init(const name& owner, const name& network) {
    require_auth( _self );
    CHECKC( !_gstate.initialized(), err::ALREADY_INITIALIZED, "fund.me already initialized" )
    CHECKC( is_account(owner), err::ACCOUNT_INVALID, "owner account invalid: " + owner.to_string() )

    network_config_t conf;
    CHECKC( resolve_network(network, DEFAULT_NETWORK_CONFIGS, conf), err::NETWORK_UNKNOWN,
            "unknown network: " + network.to_string() )
    CHECKC( is_account(conf.price_feed), err::ACCOUNT_INVALID,
            "price feed account invalid: " + conf.price_feed.to_string() )

    const uint64_t feed_version = price_converter::get_version( conf.price_feed );
    CHECKC( feed_version == conf.feed_version, err::FEED_VERSION_MISMATCH,
            "price feed version mismatch, expected " + to_string(conf.feed_version) + ", got " + to_string(feed_version) )

    _gstate.owner       = owner;
    _gstate.price_feed  = conf.price_feed;
    _gstate.network     = network;
    _global.set( _gstate, get_self() );
}

void fundme::on_transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
    if (from == _self || to != _self) return;

    CHECKC( _gstate.initialized(), err::NOT_INITIALIZED, "fund.me not initialized" )
    CHECKC( quantity.amount > 0, err::NOT_POSITIVE, "quantity must be positive" )

    const name bank = get_first_receiver();
    CHECKC( bank == NATIVE_BANK, err::CONTRACT_MISMATCH,
            "invalid token contract, expected " + NATIVE_BANK.to_string() + ", got " + bank.to_string() )
    CHECKC( quantity.symbol == NATIVE_SYM, err::SYMBOL_MISMATCH,
            "symbol mismatch, expected " + NATIVE_SYM.code().to_string() + ", got " + quantity.symbol.code().to_string() )

    _fund( from, quantity );
}

void fundme::withdraw(const name& caller) {
    _check_owner( caller );

    funder_t::idx_t funders(_self, _self.value);
    funded_t::idx_t fundeds(_self, _self.value);

    for (uint64_t index = 0; index < _gstate.funder_count; index++) {
        auto funder_itr = funders.find( index );
        CHECKC( funder_itr != funders.end(), err::RECORD_NOT_FOUND, "no funder at index: " + to_string(index) )

        auto funded_itr = fundeds.find( funder_itr->funder.value );
        if (funded_itr != fundeds.end())
            fundeds.erase( funded_itr );

        funders.erase( funder_itr );
    }

    _settle( WithdrawType::STANDARD );
}

void fundme::cheapwithdrw(const name& caller) {
    _check_owner( caller );

    funder_t::idx_t funders(_self, _self.value);
    funded_t::idx_t fundeds(_self, _self.value);

    // === 一次性读出 funders 快照 ===
    vector<name> snapshot;
    snapshot.reserve( _gstate.funder_count );
    for (auto itr = funders.begin(); itr != funders.end(); itr++) {
        snapshot.push_back( itr->funder );
    }
    CHECKC( snapshot.size() == _gstate.funder_count, err::RECORD_NOT_FOUND,
            "funders out of sync: " + to_string(snapshot.size()) + " rows, count " + to_string(_gstate.funder_count) )

    for (const auto& funder : snapshot) {
        auto funded_itr = fundeds.find( funder.value );
        if (funded_itr != fundeds.end())
            fundeds.erase( funded_itr );
    }

    for (auto itr = funders.begin(); itr != funders.end(); ) {
        itr = funders.erase( itr );
    }

    _settle( WithdrawType::CHEAPER );
}

uint64_t fundme::getversion() {
    CHECKC( _gstate.initialized(), err::NOT_INITIALIZED, "fund.me not initialized" )
    return price_converter::get_version( _gstate.price_feed );
}

name fundme::getowner() {
    return _gstate.owner;
}

name fundme::getpricefeed() {
    return _gstate.price_feed;
}

network_config_t fundme::getnetconf(const name& network) {
    network_config_t conf;
    CHECKC( resolve_network(network, DEFAULT_NETWORK_CONFIGS, conf), err::NETWORK_UNKNOWN,
            "unknown network: " + network.to_string() )
    return conf;
}

uint64_t fundme::getminusd() {
    return MINIMUM_USD;
}

asset fundme::getfunded(const name& funder) {
    auto funded = funded_t( funder );
    return _db.get( funded ) ? funded.amount : asset(0, NATIVE_SYM);
}

name fundme::getfunder(const uint64_t& index) {
    CHECKC( index < _gstate.funder_count, err::INDEX_OUT_OF_RANGE,
            "funder index out of range: " + to_string(index) + " >= " + to_string(_gstate.funder_count) )

    auto entry = funder_t( index );
    CHECKC( _db.get( entry ), err::RECORD_NOT_FOUND, "no funder at index: " + to_string(index) )
    return entry.funder;
}

int128_t fundme::getusdvalue(const asset& quantity) {
    CHECKC( _gstate.initialized(), err::NOT_INITIALIZED, "fund.me not initialized" )
    CHECKC( quantity.symbol == NATIVE_SYM, err::SYMBOL_MISMATCH,
            "symbol mismatch, expected " + NATIVE_SYM.code().to_string() )
    return price_converter::get_conversion_rate( quantity, _gstate.price_feed );
}
