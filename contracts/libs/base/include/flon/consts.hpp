#pragma once
#include <eosio/asset.hpp>
#include <eosio/name.hpp>

namespace flon {

static constexpr eosio::name NATIVE_BANK            {"flon.token"_n};    // 原生币发行合约
static constexpr eosio::symbol NATIVE_SYM           = eosio::symbol("FLON", 8);

static constexpr eosio::name FUNDME_POOL            = "fund.me"_n;       //fund.me
static constexpr eosio::name LOCAL_PRICE_FEED       = "price.feed"_n;    //price.feed (mock, local chain only)
static constexpr eosio::name TESTNET_PRICE_FEED     = "feed.testnet"_n;
static constexpr eosio::name MAINNET_PRICE_FEED     = "feed.mainnet"_n;

static constexpr uint8_t  USD_DECIMALS          = 18;
static constexpr uint64_t MINIMUM_USD           = 5'000'000'000'000'000'000ULL;   // 5 USD, 18 decimals

static constexpr uint8_t  MOCK_FEED_DECIMALS    = 8;
static constexpr int64_t  MOCK_INITIAL_ANSWER   = 2000'0000'0000LL;              // 2000 USD, 8 decimals
static constexpr uint64_t MOCK_FEED_VERSION     = 4;
static constexpr uint64_t MAINNET_FEED_VERSION  = 6;

}
