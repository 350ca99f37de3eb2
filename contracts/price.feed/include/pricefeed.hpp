#pragma once
#include <eosio/eosio.hpp>
#include <price.feed/pricefeeddb.hpp>
#include <crowdfund/errors.hpp>

using namespace eosio;
using namespace std;

namespace crowdfund {

/**
 * @contract price.feed
 * @brief FLON/USD 报价合约 (本地链 mock)
 *
 *  - 报价按轮次记录, 每次 updateanswer 开启新一轮
 *  - fund.me 直接读取 feedstate 表换算 USD 价值
 */
class [[eosio::contract("price.feed")]] pricefeed : public eosio::contract {
private:
    feed_state_singleton    _feedstate;
    feed_state_t            _state;

public:
    using contract::contract;

    pricefeed(eosio::name receiver, eosio::name code, datastream<const char*> ds)
        : contract(receiver, code, ds),
          _feedstate(get_self(), get_self().value)
    {
        _state = _feedstate.exists() ? _feedstate.get() : feed_state_t{};
    }

    /**
     * @param decimals          answer 精度 (mock: 8)
     * @param initial_answer    首轮报价 (mock: 2000e8)
     * @param feed_version      报价合约版本, 须与 fund.me 网络配置一致
     */
    ACTION init( const uint8_t& decimals, const int64_t& initial_answer, const uint64_t& feed_version );

    ACTION updateanswer( const int64_t& answer );

    ACTION setround( const uint64_t& round_id, const int64_t& answer,
                     const time_point_sec& timestamp, const time_point_sec& started_at );

    [[eosio::action, eosio::read_only]] round_t     latestround();
    [[eosio::action, eosio::read_only]] round_t     getround( const uint64_t& round_id );
    [[eosio::action, eosio::read_only]] uint8_t     decimals();
    [[eosio::action, eosio::read_only]] uint64_t    version();
    [[eosio::action, eosio::read_only]] string      description();

    using updateanswer_action = eosio::action_wrapper<"updateanswer"_n, &pricefeed::updateanswer>;

private:
    void _save_round( const uint64_t& round_id, const int64_t& answer,
                      const time_point_sec& updated_at, const time_point_sec& started_at );
};

} // namespace crowdfund
