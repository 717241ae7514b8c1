#include "idopool.hpp"
#include <idovenue/math.hpp>
#include <algorithm>

using namespace eosio;

namespace idovenue {

// ------------------- Internal functions ------------------------------------------------------
void idopool::_check_admin() {
    CHECKC( has_auth(_self) || has_auth(_gstate.admin), err::NO_AUTH, "no auth for operation" )
}

round_t::idx_t::const_iterator idopool::_get_round( round_t::idx_t& rounds, const uint64_t& round_id ) {
    auto itr = rounds.find(round_id);
    CHECKC( itr != rounds.end(), err::ROUND_NOT_FOUND, "no such round id: " + to_string(round_id) )
    return itr;
}

void idopool::_participate( const name& from, const uint64_t& round_id, const extended_symbol& token, const int64_t& amount ) {
    round_t::idx_t rounds(_self, _self.value);
    auto round_itr = _get_round(rounds, round_id);
    const auto now = time_point_sec(current_time_point());

    // === Step 1: 时间窗口与状态 ===
    CHECKC( now >= round_itr->start_time, err::NOT_STARTED, "round not started: " + to_string(round_id) )
    CHECKC( !round_itr->finalized, err::ALREADY_FINALIZED, "round already finalized: " + to_string(round_id) )
    CHECKC( now < round_itr->end_time, err::WINDOW_CLOSED, "round ended: " + to_string(round_id) )

    // === Step 2: 支付币种 ===
    const bool is_secondary = (token == round_itr->secondary_token);
    CHECKC( is_secondary || token == round_itr->primary_token, err::INVALID_TOKEN,
            "token not accepted: " + symbol_to_str(token) )

    // === Step 3: 白名单 ===
    if (round_itr->has_whitelist) {
        whitelist_t::idx_t whitelist(_self, round_id);
        CHECKC( whitelist.find(from.value) != whitelist.end(), err::NOT_WHITELISTED,
                "not whitelisted: " + from.to_string() )
    }

    // === Step 4: 次级币种额度 ===
    if (is_secondary) {
        CHECKC( within_secondary_cap(round_itr->primary_funded.amount, round_itr->secondary_funded.amount,
                                     amount, round_itr->ido_size.amount, round_itr->secondary_cap_bps),
                err::SECONDARY_CAP_EXCEEDED, "secondary token cap exceeded: " + to_string(round_itr->secondary_cap_bps) + " bps" )
    }

    // === Step 5: 计算认购额度 ===
    const auto alloc_amount = calc_allocation(amount, round_itr->ido_token_decimals, round_itr->ido_price);
    CHECKC( fits_int64(alloc_amount) && alloc_amount <= asset::max_amount, err::AMOUNT_OVERFLOW, "allocation overflow" )
    const asset allocation((int64_t)alloc_amount, round_itr->ido_token.get_symbol());
    CHECKC( round_itr->allocated.amount <= asset::max_amount - allocation.amount, err::AMOUNT_OVERFLOW, "round allocation overflow" )

    // === Step 6: 更新持仓 ===
    position_t::idx_t positions(_self, round_id);
    auto pos_itr = positions.find(from.value);
    if (pos_itr == positions.end()) {
        positions.emplace(_self, [&](auto& p) {
            p.participant       = from;
            p.amount            = amount;
            p.secondary_amount  = is_secondary ? amount : 0;
            p.token_allocation  = allocation;
            p.created_at        = now;
            p.updated_at        = now;
        });
    } else {
        CHECKC( pos_itr->amount <= asset::max_amount - amount, err::AMOUNT_OVERFLOW, "position amount overflow" )
        CHECKC( pos_itr->token_allocation.amount <= asset::max_amount - allocation.amount,
                err::AMOUNT_OVERFLOW, "position allocation overflow" )
        positions.modify(pos_itr, same_payer, [&](auto& p) {
            p.amount            += amount;
            if (is_secondary)
                p.secondary_amount += amount;
            p.token_allocation  += allocation;
            p.updated_at        = now;
        });
    }

    // === Step 7: 更新募资统计 ===
    rounds.modify(round_itr, same_payer, [&](auto& r) {
        if (is_secondary)
            r.secondary_funded.amount += amount;
        else
            r.primary_funded.amount += amount;
        r.funded_value = r.primary_funded.amount + r.secondary_funded.amount;
        r.allocated    += allocation;
    });

    NOTIFY( participated_action, round_id, from, extended_asset(amount, token), allocation )
}

void idopool::_deposit( const name& from, const uint64_t& round_id, const extended_symbol& token, const int64_t& amount ) {
    CHECKC( from == _gstate.admin, err::NO_AUTH, "only admin can deposit inventory" )

    round_t::idx_t rounds(_self, _self.value);
    auto round_itr = _get_round(rounds, round_id);
    CHECKC( !round_itr->finalized, err::ALREADY_FINALIZED, "round already finalized: " + to_string(round_id) )
    CHECKC( token == round_itr->ido_token, err::INVALID_TOKEN, "not the sale token: " + symbol_to_str(token) )
    CHECKC( round_itr->inventory.amount <= asset::max_amount - amount, err::AMOUNT_OVERFLOW, "inventory overflow" )

    rounds.modify(round_itr, same_payer, [&](auto& r) {
        r.inventory.amount += amount;
    });
}

round_eligibility idopool::_eligibility( const name& user, const round_t& round ) {
    round_eligibility result{ round.id };

    round_spec_t::idx_t specs(_self, _self.value);
    auto spec_itr = specs.find(round.id);
    if (spec_itr == specs.end()) {
        result.eligible = true;
        return result;
    }

    uint32_t rank       = 0;
    uint64_t multiplier = 0;
    if (round.meta_ido_id != 0) {
        meta_user_t::idx_t users(_self, round.meta_ido_id);
        auto user_itr = users.find(user.value);
        if (user_itr != users.end() && user_itr->registered) {
            rank        = user_itr->rank;
            multiplier  = user_itr->multiplier;
        }
    }

    result.eligible = spec_itr->no_rank || (rank >= spec_itr->min_rank && rank <= spec_itr->max_rank);
    result.capped   = true;
    if (!result.eligible) return result;

    if (spec_itr->no_multiplier) {
        result.max_alloc = spec_itr->max_alloc;
    } else {
        const auto scaled = calc_max_alloc(spec_itr->max_alloc, multiplier, spec_itr->max_alloc_multiplier);
        CHECKC( fits_int64(scaled), err::AMOUNT_OVERFLOW, "max allocation overflow" )
        result.max_alloc = (int64_t)scaled;
    }
    return result;
}

// ------------------- Actions ------------------------------------------------------------------
void idopool::init( const name& admin, const name& treasury ) {
    require_auth( _self );
    CHECKC( is_account(admin), err::ACCOUNT_INVALID, "admin account invalid" )
    CHECKC( is_account(treasury), err::ACCOUNT_INVALID, "treasury account invalid" )

    _gstate.admin       = admin;
    _gstate.treasury    = treasury;
    _global.set( _gstate, get_self() );
}

void idopool::setconfig( const name& treasury ) {
    _check_admin();
    CHECKC( is_account(treasury), err::ACCOUNT_INVALID, "treasury account invalid" )

    _gstate.treasury    = treasury;
    _global.set( _gstate, get_self() );
}

void idopool::createround( const extended_symbol& ido_token,
                           const extended_symbol& primary_token,
                           const extended_symbol& secondary_token,
                           const uint64_t& ido_price,
                           const asset& ido_size,
                           const int64_t& minimum_funding_goal,
                           const uint16_t& secondary_cap_bps,
                           const time_point_sec& start_time,
                           const time_point_sec& end_time,
                           const time_point_sec& claimable_time,
                           const bool& has_whitelist ) {
    _check_admin();

    // ===  时间窗口 ===
    CHECKC( end_time > start_time, err::INVALID_WINDOW, "end time must follow start time" )
    CHECKC( claimable_time > end_time, err::INVALID_WINDOW, "claimable time must follow end time" )

    // ===  基础参数校验 ===
    CHECKC( ido_price > 0, err::NOT_POSITIVE, "ido price must be positive" )
    CHECKC( ido_size.is_valid() && ido_size.amount > 0, err::NOT_POSITIVE, "ido size must be positive" )
    CHECKC( ido_size.symbol == ido_token.get_symbol(), err::SYMBOL_MISMATCH, "ido size symbol mismatch" )
    CHECKC( minimum_funding_goal >= 0, err::PARAM_ERROR, "minimum funding goal must not be negative" )
    CHECKC( secondary_cap_bps <= MAX_BPS, err::BPS_OUT_OF_RANGE, "secondary cap out of range: " + to_string(secondary_cap_bps) )
    CHECKC( primary_token != secondary_token, err::PARAM_ERROR, "payment tokens must differ" )
    CHECKC( ido_token != primary_token && ido_token != secondary_token, err::PARAM_ERROR,
            "sale token cannot be a payment token" )
    CHECKC( primary_token.get_symbol().precision() == secondary_token.get_symbol().precision(),
            err::SYMBOL_MISMATCH, "payment tokens must share one precision" )

    // ===  币种存在性 ===
    for (const auto& payment : { primary_token, secondary_token }) {
        CHECKC( token::get_supply(payment).symbol == payment.get_symbol(), err::SYMBOL_MISMATCH,
                "payment token not found: " + symbol_to_str(payment) )
    }
    const auto supply = token::get_supply(ido_token);
    CHECKC( supply.symbol == ido_token.get_symbol(), err::SYMBOL_MISMATCH,
            "sale token not found: " + symbol_to_str(ido_token) )

    // ===  生成 round_id 并写入 ===
    const auto round_id = ++_gstate.last_round_id;
    round_t round(round_id);
    round.ido_token             = ido_token;
    round.ido_token_decimals    = supply.symbol.precision();
    round.ido_price             = ido_price;
    round.ido_size              = ido_size;
    round.inventory             = asset(0, ido_size.symbol);
    round.allocated             = asset(0, ido_size.symbol);
    round.primary_token         = primary_token;
    round.secondary_token       = secondary_token;
    round.secondary_cap_bps     = secondary_cap_bps;
    round.primary_funded        = asset(0, primary_token.get_symbol());
    round.secondary_funded      = asset(0, secondary_token.get_symbol());
    round.minimum_funding_goal  = minimum_funding_goal;
    round.funded_value          = 0;
    round.start_time            = start_time;
    round.end_time              = end_time;
    round.initial_end_time      = end_time;
    round.claimable_time        = claimable_time;
    round.initial_claimable_time= claimable_time;
    round.finalized             = false;
    round.has_whitelist         = has_whitelist;
    round.created_at            = time_point_sec(current_time_point());

    round_t::idx_t rounds(_self, _self.value);
    rounds.emplace(_self, [&](auto& r) { r = round; });
    _global.set( _gstate, get_self() );

    NOTIFY( roundcreated_action, round )
}

void idopool::finalize( const uint64_t& round_id ) {
    _check_admin();

    round_t::idx_t rounds(_self, _self.value);
    auto round_itr = _get_round(rounds, round_id);
    CHECKC( !round_itr->finalized, err::ALREADY_FINALIZED, "round already finalized: " + to_string(round_id) )

    // inventory deposited for this round, not the nominal size
    const auto ido_size     = round_itr->inventory;
    const auto funded_value = round_itr->primary_funded.amount + round_itr->secondary_funded.amount;
    const auto now          = time_point_sec(current_time_point());

    CHECKC( now >= round_itr->end_time, err::IDO_NOT_ENDED, "round not ended: " + to_string(round_id) )
    CHECKC( funded_value >= round_itr->minimum_funding_goal, err::GOAL_NOT_REACHED,
            "funding goal not reached: " + to_string(funded_value) + " < " + to_string(round_itr->minimum_funding_goal) )
    CHECKC( ido_size.amount >= round_itr->allocated.amount, err::QUANTITY_INSUFFICIENT,
            "inventory " + ido_size.to_string() + " short of allocations " + round_itr->allocated.to_string() )

    rounds.modify(round_itr, same_payer, [&](auto& r) {
        r.ido_size      = ido_size;
        r.funded_value  = funded_value;
        r.finalized     = true;
    });

    NOTIFY( finalized_action, round_id, ido_size, funded_value )
}

void idopool::delayclaim( const uint64_t& round_id, const time_point_sec& new_time ) {
    _check_admin();

    round_t::idx_t rounds(_self, _self.value);
    auto round_itr = _get_round(rounds, round_id);

    CHECKC( new_time >= round_itr->claimable_time, err::INVALID_DELAY, "claimable time can only be delayed" )
    CHECKC( new_time > round_itr->end_time, err::INVALID_DELAY, "claimable time must follow end time" )
    CHECKC( new_time.sec_since_epoch() <= round_itr->initial_claimable_time.sec_since_epoch() + MAX_DELAY_SECONDS,
            err::INVALID_DELAY, "claimable time delayed beyond 14 days" )

    rounds.modify(round_itr, same_payer, [&](auto& r) {
        r.claimable_time = new_time;
    });

    NOTIFY( claimdelayed_action, round_id, new_time )
}

void idopool::delayend( const uint64_t& round_id, const time_point_sec& new_time ) {
    _check_admin();

    round_t::idx_t rounds(_self, _self.value);
    auto round_itr = _get_round(rounds, round_id);
    CHECKC( !round_itr->finalized, err::ALREADY_FINALIZED, "round already finalized: " + to_string(round_id) )
    const auto now = time_point_sec(current_time_point());

    CHECKC( new_time > now, err::INVALID_DELAY, "end time must be in the future" )
    CHECKC( new_time >= round_itr->end_time, err::INVALID_DELAY, "end time can only be delayed" )
    CHECKC( new_time.sec_since_epoch() <= round_itr->initial_end_time.sec_since_epoch() + MAX_DELAY_SECONDS,
            err::INVALID_DELAY, "end time delayed beyond 14 days" )
    CHECKC( new_time < round_itr->claimable_time, err::INVALID_DELAY, "end time must precede claimable time" )

    rounds.modify(round_itr, same_payer, [&](auto& r) {
        r.end_time = new_time;
    });

    NOTIFY( enddelayed_action, round_id, new_time )
}

void idopool::setwlstatus( const uint64_t& round_id, const bool& enabled ) {
    _check_admin();

    round_t::idx_t rounds(_self, _self.value);
    auto round_itr = _get_round(rounds, round_id);

    if (enabled) {
        const auto now = time_point_sec(current_time_point());
        CHECKC( now < round_itr->start_time, err::WINDOW_CLOSED, "whitelist can only be enabled before start" )
    } else {
        CHECKC( !round_itr->finalized, err::ALREADY_FINALIZED, "round already finalized: " + to_string(round_id) )
        CHECKC( round_itr->has_whitelist, err::WHITELIST_DISABLED, "whitelist already disabled" )
    }

    rounds.modify(round_itr, same_payer, [&](auto& r) {
        r.has_whitelist = enabled;
    });

    NOTIFY( wlstatus_action, round_id, enabled )
}

void idopool::modwhitelist( const uint64_t& round_id, const vector<name>& accounts, const bool& add ) {
    _check_admin();

    round_t::idx_t rounds(_self, _self.value);
    auto round_itr = _get_round(rounds, round_id);
    CHECKC( round_itr->has_whitelist, err::WHITELIST_DISABLED, "whitelist not enabled for round: " + to_string(round_id) )
    CHECKC( !accounts.empty(), err::PARAM_ERROR, "empty account list" )
    CHECKC( accounts.size() <= MAX_WHITELIST_BATCH, err::PARAM_ERROR, "too many accounts in one batch" )

    whitelist_t::idx_t whitelist(_self, round_id);
    for (const auto& account : accounts) {
        auto itr = whitelist.find(account.value);
        if (add) {
            if (itr != whitelist.end()) continue;
            CHECKC( is_account(account), err::ACCOUNT_INVALID, "account invalid: " + account.to_string() )
            whitelist.emplace(_self, [&](auto& w) { w.account = account; });
        } else if (itr != whitelist.end()) {
            whitelist.erase(itr);
        }
    }
}

void idopool::setcapbps( const uint64_t& round_id, const uint16_t& bps ) {
    _check_admin();
    CHECKC( bps <= MAX_BPS, err::BPS_OUT_OF_RANGE, "basis points out of range: " + to_string(bps) )

    round_t::idx_t rounds(_self, _self.value);
    auto round_itr = _get_round(rounds, round_id);
    const auto now = time_point_sec(current_time_point());
    CHECKC( now < round_itr->start_time, err::WINDOW_CLOSED, "cap locked once the round starts" )

    rounds.modify(round_itr, same_payer, [&](auto& r) {
        r.secondary_cap_bps = bps;
    });

    NOTIFY( capbpsset_action, round_id, bps )
}

void idopool::withdrawspare( const uint64_t& round_id ) {
    _check_admin();

    round_t::idx_t rounds(_self, _self.value);
    auto round_itr = _get_round(rounds, round_id);
    CHECKC( !round_itr->finalized, err::ALREADY_FINALIZED, "round already finalized: " + to_string(round_id) )
    const auto now = time_point_sec(current_time_point());
    CHECKC( now >= round_itr->end_time, err::IDO_NOT_ENDED, "round not ended: " + to_string(round_id) )

    const auto goal_value = calc_goal_value(round_itr->ido_size.amount, round_itr->ido_price, round_itr->ido_token_decimals);
    CHECKC( goal_value > round_itr->funded_value, err::GOAL_REACHED, "funding goal reached, no spare tokens" )

    // truncated allocations can exceed the sold equivalent by dust, keep whichever is larger
    auto reserved = calc_sold_equivalent(round_itr->funded_value, round_itr->ido_price, round_itr->ido_token_decimals);
    if (reserved < round_itr->allocated.amount)
        reserved = round_itr->allocated.amount;
    CHECKC( round_itr->inventory.amount > reserved, err::QUANTITY_INSUFFICIENT, "no spare tokens for round: " + to_string(round_id) )

    const asset spare((int64_t)(round_itr->inventory.amount - reserved), round_itr->inventory.symbol);
    rounds.modify(round_itr, same_payer, [&](auto& r) {
        r.inventory -= spare;
    });
    TRANSFER_OUT( round_itr->ido_token.get_contract(), _gstate.admin, spare, "ido spare: " + to_string(round_id) )
}

void idopool::setroundspec( const uint64_t& round_id,
                            const uint32_t& min_rank,
                            const uint32_t& max_rank,
                            const bool& no_rank,
                            const int64_t& max_alloc,
                            const uint64_t& max_alloc_multiplier,
                            const bool& no_multiplier ) {
    _check_admin();

    round_t::idx_t rounds(_self, _self.value);
    _get_round(rounds, round_id);

    CHECKC( min_rank <= max_rank, err::PARAM_ERROR, "min rank exceeds max rank" )
    CHECKC( max_alloc >= 0, err::PARAM_ERROR, "max allocation must not be negative" )
    CHECKC( max_alloc_multiplier <= MAX_SPEC_MULTIPLIER, err::PARAM_ERROR, "max allocation multiplier too large" )

    round_spec_t::idx_t specs(_self, _self.value);
    auto itr = specs.find(round_id);
    auto setter = [&](auto& s) {
        s.round_id              = round_id;
        s.min_rank              = min_rank;
        s.max_rank              = max_rank;
        s.no_rank               = no_rank;
        s.max_alloc             = max_alloc;
        s.max_alloc_multiplier  = max_alloc_multiplier;
        s.no_multiplier         = no_multiplier;
    };
    if (itr == specs.end())
        specs.emplace(_self, setter);
    else
        specs.modify(itr, same_payer, setter);
}

void idopool::delroundspec( const uint64_t& round_id ) {
    _check_admin();

    round_spec_t::idx_t specs(_self, _self.value);
    auto itr = specs.find(round_id);
    CHECKC( itr != specs.end(), err::RECORD_NOT_FOUND, "no spec for round: " + to_string(round_id) )
    specs.erase(itr);
}

uint64_t idopool::createmeta() {
    _check_admin();

    const auto meta_id = ++_gstate.last_meta_id;
    meta_ido_t::idx_t metas(_self, _self.value);
    metas.emplace(_self, [&](auto& m) {
        m.id            = meta_id;
        m.created_at    = time_point_sec(current_time_point());
    });
    _global.set( _gstate, get_self() );

    return meta_id;
}

void idopool::managemeta( const uint64_t& meta_id, const uint64_t& round_id, const bool& add ) {
    _check_admin();

    meta_ido_t::idx_t metas(_self, _self.value);
    auto meta_itr = metas.find(meta_id);
    CHECKC( meta_itr != metas.end(), err::META_NOT_FOUND, "no such metaido id: " + to_string(meta_id) )

    round_t::idx_t rounds(_self, _self.value);
    auto round_itr = _get_round(rounds, round_id);

    if (add) {
        CHECKC( round_itr->meta_ido_id == 0, err::RECORD_EXISTS,
                "round already grouped in metaido: " + to_string(round_itr->meta_ido_id) )
        metas.modify(meta_itr, same_payer, [&](auto& m) {
            m.round_ids.push_back(round_id);
        });
        rounds.modify(round_itr, same_payer, [&](auto& r) {
            r.meta_ido_id = meta_id;
        });

    } else {
        const auto& ids = meta_itr->round_ids;
        auto pos = std::find(ids.begin(), ids.end(), round_id);
        CHECKC( pos != ids.end(), err::ROUND_NOT_IN_META,
                "round " + to_string(round_id) + " not in metaido " + to_string(meta_id) )
        const auto index = std::distance(ids.begin(), pos);

        // swap and pop, order carries no meaning
        metas.modify(meta_itr, same_payer, [&](auto& m) {
            m.round_ids[index] = m.round_ids.back();
            m.round_ids.pop_back();
        });
        rounds.modify(round_itr, same_payer, [&](auto& r) {
            r.meta_ido_id = 0;
        });
    }

    NOTIFY( metaupdated_action, meta_id, round_id, add )
}

void idopool::setmetauser( const uint64_t& meta_id, const vector<name>& users, const uint32_t& rank, const uint64_t& multiplier ) {
    _check_admin();

    meta_ido_t::idx_t metas(_self, _self.value);
    CHECKC( metas.find(meta_id) != metas.end(), err::META_NOT_FOUND, "no such metaido id: " + to_string(meta_id) )
    CHECKC( !users.empty(), err::PARAM_ERROR, "empty user list" )
    CHECKC( users.size() <= MAX_WHITELIST_BATCH, err::PARAM_ERROR, "too many users in one batch" )
    CHECKC( multiplier <= MAX_USER_MULTIPLIER, err::PARAM_ERROR, "multiplier too large: " + to_string(multiplier) )

    const auto now = time_point_sec(current_time_point());
    meta_user_t::idx_t meta_users(_self, meta_id);
    for (const auto& user : users) {
        CHECKC( is_account(user), err::ACCOUNT_INVALID, "account invalid: " + user.to_string() )
        auto setter = [&](auto& u) {
            u.user          = user;
            u.registered    = true;
            u.rank          = rank;
            u.multiplier    = multiplier;
            u.updated_at    = now;
        };
        auto itr = meta_users.find(user.value);
        if (itr == meta_users.end())
            meta_users.emplace(_self, setter);
        else
            meta_users.modify(itr, same_payer, setter);
    }
}

void idopool::metaregister( const name& user, const uint64_t& meta_id ) {
    require_auth( user );

    meta_ido_t::idx_t metas(_self, _self.value);
    CHECKC( metas.find(meta_id) != metas.end(), err::META_NOT_FOUND, "no such metaido id: " + to_string(meta_id) )

    meta_user_t::idx_t meta_users(_self, meta_id);
    auto itr = meta_users.find(user.value);
    CHECKC( itr == meta_users.end() || !itr->registered, err::RECORD_EXISTS, "already registered: " + user.to_string() )

    const auto now = time_point_sec(current_time_point());
    if (itr == meta_users.end()) {
        meta_users.emplace(user, [&](auto& u) {
            u.user          = user;
            u.registered    = true;
            u.updated_at    = now;
        });
    } else {
        meta_users.modify(itr, same_payer, [&](auto& u) {
            u.registered    = true;
            u.updated_at    = now;
        });
    }
}

void idopool::claim( const uint64_t& round_id, const name& participant ) {
    CHECKC( has_auth(participant) || has_auth(_gstate.admin), err::NO_AUTH, "no auth to claim for " + participant.to_string() )
    CHECKC( is_account(_gstate.treasury), err::ACCOUNT_INVALID, "treasury not configured" )

    round_t::idx_t rounds(_self, _self.value);
    const auto& round = *_get_round(rounds, round_id);
    const auto now = time_point_sec(current_time_point());
    CHECKC( round.finalized && now >= round.claimable_time, err::NOT_CLAIMABLE, "round not claimable: " + to_string(round_id) )

    position_t::idx_t positions(_self, round_id);
    auto pos_itr = positions.find(participant.value);
    CHECKC( pos_itr != positions.end() && pos_itr->amount > 0, err::NO_POSITION,
            "no position in round " + to_string(round_id) + " for " + participant.to_string() )

    // delete before any transfer goes out
    const position_t position = *pos_itr;
    positions.erase(pos_itr);
    rounds.modify(round, same_payer, [&](auto& r) {
        r.inventory -= position.token_allocation;
    });

    const extended_asset secondary(position.secondary_amount, round.secondary_token);
    const extended_asset primary(position.amount - position.secondary_amount, round.primary_token);
    const string memo = "ido claim: " + to_string(round_id);

    if (secondary.quantity.amount > 0)
        TRANSFER_OUT( secondary.contract, _gstate.treasury, secondary.quantity, memo )
    if (primary.quantity.amount > 0)
        TRANSFER_OUT( primary.contract, _gstate.treasury, primary.quantity, memo )
    if (position.token_allocation.amount > 0)
        TRANSFER_OUT( round.ido_token.get_contract(), participant, position.token_allocation, memo )

    NOTIFY( claimed_action, round_id, participant, primary, secondary, position.token_allocation )
}

void idopool::on_transfer( const name& from, const name& to, const asset& quantity, const string& memo ) {
    if (from == get_self() || to != get_self()) return;

    CHECKC( quantity.amount > 0, err::NOT_POSITIVE, "quantity must be positive" )
    CHECKC( !memo.empty(), err::INVALID_FORMAT, "memo required" )

    auto parts = split(memo, ':');
    CHECKC( parts.size() == 2, err::INVALID_FORMAT, "invalid memo format, expect <action>:<round_id>" )

    const auto round_id = to_uint64(parts[1], "round id");
    const extended_symbol token(quantity.symbol, get_first_receiver());

    if (parts[0] == MEMO_PARTICIPATE) {
        _participate(from, round_id, token, quantity.amount);
        return;
    }
    if (parts[0] == MEMO_DEPOSIT) {
        _deposit(from, round_id, token, quantity.amount);
        return;
    }

    CHECKC( false, err::INVALID_FORMAT, "unsupported memo action: " + string(parts[0]) )
}

vector<round_eligibility> idopool::eligibility( const name& user, const vector<uint64_t>& round_ids ) {
    CHECKC( round_ids.size() <= MAX_ELIGIBILITY_QUERY, err::PARAM_ERROR, "too many rounds in one query" )

    round_t::idx_t rounds(_self, _self.value);
    vector<round_eligibility> results;
    results.reserve(round_ids.size());
    for (const auto& round_id : round_ids) {
        results.push_back( _eligibility(user, *_get_round(rounds, round_id)) );
    }
    return results;
}

} // namespace idovenue
