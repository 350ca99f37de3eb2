#pragma once

#include <array>
#include <eosio/name.hpp>
#include <eosio/serialize.hpp>
#include <flon/consts.hpp>

namespace crowdfund {

namespace Networks {
    static constexpr eosio::name LOCAL      = "local"_n;       // 本地临时链, 使用 mock 报价合约
    static constexpr eosio::name TESTNET    = "testnet"_n;
    static constexpr eosio::name MAINNET    = "mainnet"_n;
}

struct network_config_t {
    eosio::name     network;
    eosio::name     price_feed;         // 报价合约账户
    uint64_t        feed_version;       // 报价合约版本, init 时校验

    EOSLIB_SERIALIZE( network_config_t, (network)(price_feed)(feed_version) )
};

static constexpr std::array<network_config_t, 3> DEFAULT_NETWORK_CONFIGS = {{
    { Networks::LOCAL,      flon::LOCAL_PRICE_FEED,     flon::MOCK_FEED_VERSION    },
    { Networks::TESTNET,    flon::TESTNET_PRICE_FEED,   flon::MOCK_FEED_VERSION    },
    { Networks::MAINNET,    flon::MAINNET_PRICE_FEED,   flon::MAINNET_FEED_VERSION }
}};

/**
 * Looks up the profile of `network` in `configs`.
 * @return false if the network is not listed, `conf` is left untouched
 */
template<std::size_t N>
inline bool resolve_network( const eosio::name& network,
                             const std::array<network_config_t, N>& configs,
                             network_config_t& conf ) {
    for (const auto& item : configs) {
        if (item.network == network) {
            conf = item;
            return true;
        }
    }
    return false;
}

} // namespace crowdfund
