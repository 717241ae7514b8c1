#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <string>
#include <tuple>

#include "consts.hpp"

// transfer out from contract self
#define TRANSFER_OUT(bank, to, quantity, memo) \
    { eosio::action( eosio::permission_level{ get_self(), idovenue::active_perm }, bank, "transfer"_n, \
                     std::make_tuple( get_self(), to, quantity, std::string(memo) ) ).send(); }

namespace idovenue { namespace token {

using namespace eosio;

/**
 * Read-only view of a standard token contract's `stat` table (eosio.token
 * layout), scoped by symbol code.
 */
struct currency_stats {
    asset    supply;
    asset    max_supply;
    name     issuer;

    uint64_t primary_key() const { return supply.symbol.code().raw(); }

    EOSLIB_SERIALIZE( currency_stats, (supply)(max_supply)(issuer) )
};
typedef eosio::multi_index<"stat"_n, currency_stats> stats;

/// supply as registered by the issuing contract; empty symbol when the token does not exist
inline asset get_supply(const extended_symbol& token) {
    const auto sym_code = token.get_symbol().code();
    stats statstable(token.get_contract(), sym_code.raw());
    auto itr = statstable.find(sym_code.raw());
    return itr == statstable.end() ? asset() : itr->supply;
}

} } // namespace idovenue::token
