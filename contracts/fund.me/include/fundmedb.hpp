#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>
#include <flon/wasm_db.hpp>
#include "flon/consts.hpp"

using namespace eosio;
using namespace std;
using std::string;
using namespace wasm::db;
using namespace flon;

namespace crowdfund {

#define TBL struct [[eosio::table, eosio::contract("fund.me")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("fund.me")]]

namespace WithdrawType {
    static constexpr eosio::name STANDARD   = "withdraw"_n;
    static constexpr eosio::name CHEAPER    = "cheapwithdrw"_n;     // 先快照 funders 再遍历
}

NTBL("global") global_t {
    name            owner;                              // 提现权限账户, init 后不可变
    name            price_feed;                         // 绑定的报价合约, init 后不可变
    name            network;
    uint64_t        funder_count        = 0;            // funders 表当前长度
    asset           total_funded        = asset(0, NATIVE_SYM);
    uint64_t        last_withdrawal_id  = 0;

    bool initialized() const { return owner.value != 0; }

    EOSLIB_SERIALIZE( global_t, (owner)(price_feed)(network)(funder_count)(total_funded)(last_withdrawal_id) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

// cumulative contribution per funder since the last withdrawal
// a missing row reads as zero
//
TBL funded_t {                                  //scope: _self
    name                funder;                 //PK
    asset               amount;
    time_point_sec      last_funded_at;

    uint64_t primary_key() const { return funder.value; }

    funded_t() {}
    funded_t( const name& f ): funder(f) {}

    typedef eosio::multi_index<"funded"_n, funded_t> idx_t;

    EOSLIB_SERIALIZE( funded_t, (funder)(amount)(last_funded_at) )
};

// funders in funding order, one row per accepted fund call (duplicates allowed)
//
TBL funder_t {                                  //scope: _self
    uint64_t            id;                     //PK: 0-based position
    name                funder;
    asset               quantity;
    time_point_sec      funded_at;

    uint64_t primary_key() const { return id; }

    funder_t() {}
    funder_t( const uint64_t& i ): id(i) {}

    typedef eosio::multi_index<"funders"_n, funder_t> idx_t;

    EOSLIB_SERIALIZE( funder_t, (id)(funder)(quantity)(funded_at) )
};

TBL withdrawal_log_t {                          //scope: _self
    uint64_t            id;                     //PK
    name                owner;
    asset               quantity;               // 实际转给 owner 的数量
    uint64_t            funder_count;
    name                withdraw_type;          // WithdrawType
    time_point_sec      withdrawn_at;

    uint64_t primary_key() const { return id; }

    withdrawal_log_t() {}
    withdrawal_log_t( const uint64_t& i ): id(i) {}

    typedef eosio::multi_index<"withdrawals"_n, withdrawal_log_t> idx_t;

    EOSLIB_SERIALIZE( withdrawal_log_t, (id)(owner)(quantity)(funder_count)(withdraw_type)(withdrawn_at) )
};

} // namespace crowdfund
