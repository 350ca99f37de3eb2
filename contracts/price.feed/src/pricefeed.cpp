#include "pricefeed.hpp"

using namespace eosio;
using namespace crowdfund;

static const string FEED_DESCRIPTION = "FLON / USD";

void pricefeed::_save_round(const uint64_t& round_id, const int64_t& answer,
                            const time_point_sec& updated_at, const time_point_sec& started_at) {
    round_t::idx_t rounds(get_self(), get_self().value);
    auto itr = rounds.find(round_id);
    auto write = [&](auto& r) {
        r.round_id          = round_id;
        r.answer            = answer;
        r.started_at        = started_at;
        r.updated_at        = updated_at;
        r.answered_in_round = round_id;
    };
    if (itr == rounds.end())
        rounds.emplace(get_self(), write);
    else
        rounds.modify(itr, get_self(), write);

    _state.latest_round     = round_id;
    _state.latest_answer    = answer;
    _state.latest_timestamp = updated_at;
    _feedstate.set(_state, get_self());
}

void pricefeed::init(const uint8_t& decimals, const int64_t& initial_answer, const uint64_t& feed_version) {
    require_auth(get_self());
    CHECKC( !_feedstate.exists(), err::ALREADY_INITIALIZED, "price feed already initialized" )
    CHECKC( decimals <= flon::USD_DECIMALS, err::PARAM_ERROR, "decimals must be <= 18" )
    CHECKC( feed_version > 0, err::PARAM_ERROR, "version must be positive" )

    _state.decimals     = decimals;
    _state.version      = feed_version;
    _state.description  = FEED_DESCRIPTION;

    const auto now = time_point_sec(current_time_point());
    _save_round(1, initial_answer, now, now);
}

void pricefeed::updateanswer(const int64_t& answer) {
    require_auth(get_self());
    CHECKC( _feedstate.exists(), err::NOT_INITIALIZED, "price feed not initialized" )

    const auto now = time_point_sec(current_time_point());
    _save_round(_state.latest_round + 1, answer, now, now);
}

void pricefeed::setround(const uint64_t& round_id, const int64_t& answer,
                         const time_point_sec& timestamp, const time_point_sec& started_at) {
    require_auth(get_self());
    CHECKC( _feedstate.exists(), err::NOT_INITIALIZED, "price feed not initialized" )
    CHECKC( round_id > 0, err::PARAM_ERROR, "round id must be positive" )

    _save_round(round_id, answer, timestamp, started_at);
}

round_t pricefeed::latestround() {
    return getround(_state.latest_round);
}

round_t pricefeed::getround(const uint64_t& round_id) {
    round_t::idx_t rounds(get_self(), get_self().value);
    auto itr = rounds.find(round_id);
    CHECKC( itr != rounds.end(), err::RECORD_NOT_FOUND, "no such round: " + to_string(round_id) )
    return *itr;
}

uint8_t pricefeed::decimals() {
    return _state.decimals;
}

uint64_t pricefeed::version() {
    return _state.version;
}

string pricefeed::description() {
    return _state.description;
}
