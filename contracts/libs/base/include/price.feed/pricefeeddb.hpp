#pragma once

#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>
#include <flon/consts.hpp>

using namespace eosio;
using namespace std;
using std::string;

namespace crowdfund {

// Price feed tables. Every feed account a fund.me instance binds to
// (mock on the local chain, oracle accounts on live networks) exposes
// this layout.

struct [[eosio::table("feedstate"), eosio::contract("price.feed")]] feed_state_t {
    uint8_t             decimals            = flon::MOCK_FEED_DECIMALS;    // answer 精度
    int64_t             latest_answer       = 0;                           // 最新报价 (USD, decimals 位小数)
    uint64_t            latest_round        = 0;
    time_point_sec      latest_timestamp;
    uint64_t            version             = flon::MOCK_FEED_VERSION;
    string              description;

    EOSLIB_SERIALIZE( feed_state_t, (decimals)(latest_answer)(latest_round)(latest_timestamp)
                                    (version)(description) )
};
typedef eosio::singleton< "feedstate"_n, feed_state_t > feed_state_singleton;

//scope: _self
struct [[eosio::table, eosio::contract("price.feed")]] round_t {
    uint64_t            round_id;                   //PK
    int64_t             answer;
    time_point_sec      started_at;
    time_point_sec      updated_at;
    uint64_t            answered_in_round;

    uint64_t primary_key() const { return round_id; }

    round_t() {}
    round_t( const uint64_t& id ): round_id(id) {}

    typedef eosio::multi_index<"rounds"_n, round_t> idx_t;

    EOSLIB_SERIALIZE( round_t, (round_id)(answer)(started_at)(updated_at)(answered_in_round) )
};

} // namespace crowdfund
