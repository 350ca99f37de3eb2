#pragma once

#include <eosio/asset.hpp>
#include <crowdfund/errors.hpp>
#include "pricefeeddb.hpp"

namespace crowdfund { namespace price_converter {

static constexpr int128_t INT128_MAX_VALUE = (int128_t)(~(uint128_t)0 >> 1);

inline constexpr int128_t power10(int64_t exp) {
    int128_t ret = 1;
    while( exp > 0 ) {
        ret *= 10; --exp;
    }
    return ret;
}

inline feed_state_t get_feed_state(const name& feed) {
    feed_state_singleton feedstate(feed, feed.value);
    CHECKC( feedstate.exists(), err::RECORD_NOT_FOUND, "price feed has no state: " + feed.to_string() )
    return feedstate.get();
}

/**
 * Latest USD price of one native unit, scaled to USD_DECIMALS (18) decimals.
 */
inline int128_t get_price(const name& feed) {
    const auto state = get_feed_state(feed);
    CHECKC( state.latest_answer > 0, err::INVALID_PRICE,
            "invalid answer from price feed " + feed.to_string() + ": " + std::to_string(state.latest_answer) )
    CHECKC( state.decimals <= flon::USD_DECIMALS, err::INVALID_PRICE,
            "price feed decimals exceed " + std::to_string(flon::USD_DECIMALS) )

    return (int128_t)state.latest_answer * power10(flon::USD_DECIMALS - state.decimals);
}

/**
 * USD value (18 decimals) of a native quantity.
 * e.g. price 2000 USD, 0.10000000 FLON -> 200 * 10^18
 */
inline int128_t get_conversion_rate(const asset& quantity, const name& feed) {
    const int128_t price = get_price(feed);
    if (quantity.amount <= 0) return 0;

    CHECKC( (int128_t)quantity.amount <= INT128_MAX_VALUE / price, err::PARAM_ERROR,
            "overflow in usd conversion of " + quantity.to_string() )
    return price * quantity.amount / power10(quantity.symbol.precision());
}

inline uint64_t get_version(const name& feed) {
    return get_feed_state(feed).version;
}

} } // namespace crowdfund::price_converter
