#pragma once
#include <cstdint>
#include <eosio/name.hpp>

namespace idovenue {

static constexpr eosio::name active_perm            {"active"_n};

static constexpr uint64_t DAY_SECONDS               = 24 * 3600;
static constexpr uint64_t MAX_DELAY_SECONDS         = 14 * DAY_SECONDS;  // end / claimable delay ceiling
static constexpr uint16_t MAX_BPS                   = 10000;
static constexpr uint32_t MAX_WHITELIST_BATCH       = 100;
static constexpr uint32_t MAX_ELIGIBILITY_QUERY     = 50;
static constexpr uint64_t MAX_USER_MULTIPLIER       = 1000;              // plain tier factor
static constexpr uint64_t MAX_SPEC_MULTIPLIER       = 1000 * 1'0000'0000ULL;

// transfer memo actions
static constexpr const char* MEMO_PARTICIPATE       = "participate";
static constexpr const char* MEMO_DEPOSIT           = "deposit";

}
