#pragma once

#include "idopooldb.hpp"
#include <idovenue/token.hpp>
#include <idovenue/utils.hpp>
#include <contract_version.hpp>

using namespace std;

namespace idovenue {

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

#define NOTIFY(action_type, ...) \
   { action_type act{ _self, { {_self, active_perm} } }; act.send( __VA_ARGS__ ); }

enum class err: uint8_t {
   INVALID_FORMAT         = 0,
   NOT_POSITIVE           = 4,
   SYMBOL_MISMATCH        = 5,
   RECORD_NOT_FOUND       = 8,
   RECORD_EXISTS          = 9,
   ACCOUNT_INVALID        = 11,
   NO_AUTH                = 16,
   CONTRACT_MISMATCH      = 32,
   PARAM_ERROR            = 33,
   QUANTITY_INSUFFICIENT  = 34,
   AMOUNT_OVERFLOW        = 35,

   // window
   NOT_STARTED            = 40,
   NOT_CLAIMABLE          = 41,
   IDO_NOT_ENDED          = 42,
   WINDOW_CLOSED          = 43,
   // lifecycle
   ALREADY_FINALIZED      = 50,
   NOT_FINALIZED          = 51,
   WHITELIST_DISABLED     = 52,
   // validation
   INVALID_TOKEN          = 60,
   INVALID_WINDOW         = 61,
   INVALID_DELAY          = 62,
   BPS_OUT_OF_RANGE       = 63,
   // authorization
   NOT_WHITELISTED        = 70,
   // ledger
   NO_POSITION            = 80,
   SECONDARY_CAP_EXCEEDED = 81,
   GOAL_NOT_REACHED       = 82,
   GOAL_REACHED           = 83,
   // lookup
   ROUND_NOT_FOUND        = 90,
   META_NOT_FOUND         = 91,
   ROUND_NOT_IN_META      = 92
};

/// result row of the eligibility query
struct round_eligibility {
    uint64_t    round_id;
    bool        eligible    = false;
    bool        capped      = false;    //false: no allocation ceiling
    int64_t     max_alloc   = 0;

    EOSLIB_SERIALIZE( round_eligibility, (round_id)(eligible)(capped)(max_alloc) )
};

DEFINE_VERSION_CONTRACT_CLASS("ido.pool", ido_pool)

/**
 * @contract idopool
 * @brief Token sale venue: time-boxed funding rounds paid in two tokens,
 *        settled in the sale token once finalized.
 */
class [[eosio::contract("ido.pool")]] idopool: public eosio::contract {
private:
    global_singleton    _global;
    global_t            _gstate;

public:
    using contract::contract;

    idopool(eosio::name receiver, eosio::name code, datastream<const char*> ds):
        contract(receiver, code, ds),
        _global(_self, _self.value)
    {
        _gstate = _global.exists() ? _global.get() : global_t{};
    }

    ACTION init( const name& admin, const name& treasury );
    ACTION setconfig( const name& treasury );

    // === round lifecycle (admin) ===
    ACTION createround( const extended_symbol& ido_token,
                        const extended_symbol& primary_token,
                        const extended_symbol& secondary_token,
                        const uint64_t& ido_price,
                        const asset& ido_size,
                        const int64_t& minimum_funding_goal,
                        const uint16_t& secondary_cap_bps,
                        const time_point_sec& start_time,
                        const time_point_sec& end_time,
                        const time_point_sec& claimable_time,
                        const bool& has_whitelist );

    ACTION finalize( const uint64_t& round_id );
    ACTION delayclaim( const uint64_t& round_id, const time_point_sec& new_time );
    ACTION delayend( const uint64_t& round_id, const time_point_sec& new_time );
    ACTION setwlstatus( const uint64_t& round_id, const bool& enabled );
    ACTION modwhitelist( const uint64_t& round_id, const vector<name>& accounts, const bool& add );
    ACTION setcapbps( const uint64_t& round_id, const uint16_t& bps );
    ACTION withdrawspare( const uint64_t& round_id );

    // === eligibility policy (admin) ===
    ACTION setroundspec( const uint64_t& round_id,
                         const uint32_t& min_rank,
                         const uint32_t& max_rank,
                         const bool& no_rank,
                         const int64_t& max_alloc,
                         const uint64_t& max_alloc_multiplier,
                         const bool& no_multiplier );
    ACTION delroundspec( const uint64_t& round_id );

    // === MetaIDO ===
    [[eosio::action]] uint64_t createmeta();
    ACTION managemeta( const uint64_t& meta_id, const uint64_t& round_id, const bool& add );
    ACTION setmetauser( const uint64_t& meta_id, const vector<name>& users, const uint32_t& rank, const uint64_t& multiplier );
    ACTION metaregister( const name& user, const uint64_t& meta_id );

    // === settlement ===
    ACTION claim( const uint64_t& round_id, const name& participant );

    /**
     * ontransfer, trigger by recipient of transfer()
     *  @param from - participant or inventory provider
     *  @param to   - must be contract self
     *  @param quantity - payment or sale token quantity
     *  @param memo - memo format:
     *      participate:<round_id>  contribute a payment token
     *      deposit:<round_id>      top up the sale token inventory
     */
    [[eosio::on_notify("*::transfer")]]
    void on_transfer( const name& from, const name& to, const asset& quantity, const string& memo );

    /**
     * Advisory eligibility of `user` for each round, derived from the round's
     * spec and the user's rank and multiplier in the round's MetaIDO.
     */
    [[eosio::action, eosio::read_only]]
    vector<round_eligibility> eligibility( const name& user, const vector<uint64_t>& round_ids );

    // === notifications ===
    ACTION roundcreated( const round_t& round ) {
        require_auth( get_self() );
        require_recipient( get_self() );
    }
    ACTION finalized( const uint64_t& round_id, const asset& ido_size, const int64_t& funded_value ) {
        require_auth( get_self() );
        require_recipient( get_self() );
    }
    ACTION participated( const uint64_t& round_id, const name& participant,
                         const extended_asset& quantity, const asset& allocation ) {
        require_auth( get_self() );
        require_recipient( get_self() );
    }
    ACTION claimed( const uint64_t& round_id, const name& participant,
                    const extended_asset& primary, const extended_asset& secondary, const asset& allocation ) {
        require_auth( get_self() );
        require_recipient( get_self() );
    }
    ACTION claimdelayed( const uint64_t& round_id, const time_point_sec& claimable_time ) {
        require_auth( get_self() );
        require_recipient( get_self() );
    }
    ACTION enddelayed( const uint64_t& round_id, const time_point_sec& end_time ) {
        require_auth( get_self() );
        require_recipient( get_self() );
    }
    ACTION wlstatus( const uint64_t& round_id, const bool& enabled ) {
        require_auth( get_self() );
        require_recipient( get_self() );
    }
    ACTION capbpsset( const uint64_t& round_id, const uint16_t& bps ) {
        require_auth( get_self() );
        require_recipient( get_self() );
    }
    ACTION metaupdated( const uint64_t& meta_id, const uint64_t& round_id, const bool& added ) {
        require_auth( get_self() );
        require_recipient( get_self() );
    }

    using roundcreated_action   = eosio::action_wrapper<"roundcreated"_n, &idopool::roundcreated>;
    using finalized_action      = eosio::action_wrapper<"finalized"_n,    &idopool::finalized>;
    using participated_action   = eosio::action_wrapper<"participated"_n, &idopool::participated>;
    using claimed_action        = eosio::action_wrapper<"claimed"_n,      &idopool::claimed>;
    using claimdelayed_action   = eosio::action_wrapper<"claimdelayed"_n, &idopool::claimdelayed>;
    using enddelayed_action     = eosio::action_wrapper<"enddelayed"_n,   &idopool::enddelayed>;
    using wlstatus_action       = eosio::action_wrapper<"wlstatus"_n,     &idopool::wlstatus>;
    using capbpsset_action      = eosio::action_wrapper<"capbpsset"_n,    &idopool::capbpsset>;
    using metaupdated_action    = eosio::action_wrapper<"metaupdated"_n,  &idopool::metaupdated>;

private:
    void _check_admin();
    round_t::idx_t::const_iterator _get_round( round_t::idx_t& rounds, const uint64_t& round_id );

    void _participate( const name& from, const uint64_t& round_id, const extended_symbol& token, const int64_t& amount );
    void _deposit( const name& from, const uint64_t& round_id, const extended_symbol& token, const int64_t& amount );

    round_eligibility _eligibility( const name& user, const round_t& round );
};

} // namespace idovenue
