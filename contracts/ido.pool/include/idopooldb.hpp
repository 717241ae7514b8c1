#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>
#include <idovenue/consts.hpp>

using namespace eosio;
using namespace std;
using std::string;

namespace idovenue {

#define TBL struct [[eosio::table, eosio::contract("ido.pool")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("ido.pool")]]

NTBL("global") global_t {
    name            admin;
    name            treasury;                   // receives raised funds on claim
    uint64_t        last_round_id       = 0;
    uint64_t        last_meta_id        = 0;

    EOSLIB_SERIALIZE( global_t, (admin)(treasury)(last_round_id)(last_meta_id) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//Scope: _self
TBL round_t {
    uint64_t            id;                         //PK: from global.last_round_id

    // === sale token ===
    extended_symbol     ido_token;
    uint8_t             ido_token_decimals  = 0;    //snapshot of the token's precision at creation
    uint64_t            ido_price           = 0;    //payment units per whole sale token
    asset               ido_size;                   //nominal; deposited inventory once finalized
    asset               inventory;                  //sale tokens deposited for this round and not yet paid out
    asset               allocated;                  //sum of all position allocations

    // === payment tokens ===
    extended_symbol     primary_token;
    extended_symbol     secondary_token;            //capped by secondary_cap_bps
    uint16_t            secondary_cap_bps   = 0;
    asset               primary_funded;
    asset               secondary_funded;
    int64_t             minimum_funding_goal = 0;
    int64_t             funded_value        = 0;    //primary + secondary, frozen at finalization

    // === clock ===
    time_point_sec      start_time;
    time_point_sec      end_time;
    time_point_sec      initial_end_time;
    time_point_sec      claimable_time;
    time_point_sec      initial_claimable_time;

    bool                finalized           = false;
    bool                has_whitelist       = false;
    uint64_t            meta_ido_id         = 0;    //0: not grouped
    time_point_sec      created_at;

    round_t() {}
    round_t(const uint64_t& i): id(i) {}

    uint64_t primary_key() const { return id; }

    typedef eosio::multi_index<"rounds"_n, round_t> idx_t;

    EOSLIB_SERIALIZE( round_t, (id)(ido_token)(ido_token_decimals)(ido_price)(ido_size)(inventory)(allocated)
                               (primary_token)(secondary_token)(secondary_cap_bps)
                               (primary_funded)(secondary_funded)(minimum_funding_goal)(funded_value)
                               (start_time)(end_time)(initial_end_time)(claimable_time)(initial_claimable_time)
                               (finalized)(has_whitelist)(meta_ido_id)(created_at) )
};

//Scope: _self
//Note: absence of a row means the round is open to everyone
TBL round_spec_t {
    uint64_t            round_id;                   //PK
    uint32_t            min_rank            = 0;
    uint32_t            max_rank            = 0;
    bool                no_rank             = false;
    int64_t             max_alloc           = 0;
    uint64_t            max_alloc_multiplier = 0;   //8 decimals
    bool                no_multiplier       = false;

    round_spec_t() {}
    round_spec_t(const uint64_t& rid): round_id(rid) {}

    uint64_t primary_key() const { return round_id; }

    typedef eosio::multi_index<"roundspecs"_n, round_spec_t> idx_t;

    EOSLIB_SERIALIZE( round_spec_t, (round_id)(min_rank)(max_rank)(no_rank)
                                    (max_alloc)(max_alloc_multiplier)(no_multiplier) )
};

//Scope: round_id
//Note: record is deleted upon claim
TBL position_t {
    name                participant;                //PK
    int64_t             amount              = 0;    //both payment tokens
    int64_t             secondary_amount    = 0;
    asset               token_allocation;           //sale token entitlement
    time_point_sec      created_at;
    time_point_sec      updated_at;

    position_t() {}
    position_t(const name& p): participant(p) {}

    uint64_t primary_key() const { return participant.value; }

    typedef eosio::multi_index<"positions"_n, position_t> idx_t;

    EOSLIB_SERIALIZE( position_t, (participant)(amount)(secondary_amount)(token_allocation)
                                  (created_at)(updated_at) )
};

//Scope: round_id
TBL whitelist_t {
    name                account;                    //PK

    uint64_t primary_key() const { return account.value; }

    typedef eosio::multi_index<"whitelist"_n, whitelist_t> idx_t;

    EOSLIB_SERIALIZE( whitelist_t, (account) )
};

//Scope: _self
TBL meta_ido_t {
    uint64_t            id;                         //PK: from global.last_meta_id
    vector<uint64_t>    round_ids;                  //unordered, unique
    time_point_sec      created_at;

    meta_ido_t() {}
    meta_ido_t(const uint64_t& i): id(i) {}

    uint64_t primary_key() const { return id; }

    typedef eosio::multi_index<"metaidos"_n, meta_ido_t> idx_t;

    EOSLIB_SERIALIZE( meta_ido_t, (id)(round_ids)(created_at) )
};

//Scope: meta_ido_id
TBL meta_user_t {
    name                user;                       //PK
    bool                registered          = false;
    uint32_t            rank                = 0;
    uint64_t            multiplier          = 0;    //plain tier factor
    time_point_sec      updated_at;

    uint64_t primary_key() const { return user.value; }

    typedef eosio::multi_index<"metausers"_n, meta_user_t> idx_t;

    EOSLIB_SERIALIZE( meta_user_t, (user)(registered)(rank)(multiplier)(updated_at) )
};

} // namespace idovenue
