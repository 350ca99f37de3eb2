#pragma once
#include <eosio/eosio.hpp>
#include <string>

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, std::string("[[") + std::to_string((int)code) + std::string("]] ") + msg); }

namespace crowdfund {

enum class err: uint8_t {
   INVALID_FORMAT             = 0,
   NOT_POSITIVE               = 4,
   SYMBOL_MISMATCH            = 5,
   RECORD_NOT_FOUND           = 8,
   RECORD_EXISTS              = 9,
   ACCOUNT_INVALID            = 11,
   NO_AUTH                    = 16,
   CONTRACT_MISMATCH          = 32,
   PARAM_ERROR                = 33,
   INSUFFICIENT_CONTRIBUTION  = 40,
   NOT_OWNER                  = 41,
   TRANSFER_FAILED            = 42,
   INDEX_OUT_OF_RANGE         = 43,
   NOT_INITIALIZED            = 44,
   ALREADY_INITIALIZED        = 45,
   NETWORK_UNKNOWN            = 46,
   INVALID_PRICE              = 47,
   FEED_VERSION_MISMATCH      = 48
};

} // namespace crowdfund
