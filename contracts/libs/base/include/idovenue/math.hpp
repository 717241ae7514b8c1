#pragma once
#include <cstdint>
#include <limits>

/**
 * Fixed-point arithmetic of the IDO ledger.
 *
 * All divisions truncate toward zero. Intermediate products are carried in
 * 128 bits; callers check the result against the int64 asset range before
 * storing it.
 */
namespace idovenue {

static constexpr int64_t  BPS_BOOST         = 10000;
static constexpr int64_t  MULTIPLIER_SCALE  = 1'0000'0000;      // 8 decimals

inline constexpr __int128 power10_128(uint8_t exp) {
    __int128 ret = 1;
    while( exp > 0 ) {
        ret *= 10; --exp;
    }
    return ret;
}

inline constexpr bool fits_int64(__int128 v) {
    return v >= 0 && v <= std::numeric_limits<int64_t>::max();
}

/// sale tokens bought by `amount` payment units: amount * 10^decimals / price
inline constexpr __int128 calc_allocation(int64_t amount, uint8_t decimals, uint64_t price) {
    return (__int128)amount * power10_128(decimals) / (__int128)price;
}

/// ido_size * bps / 10000
inline constexpr __int128 calc_bps_cap(int64_t ido_size, uint16_t bps) {
    return (__int128)ido_size * bps / BPS_BOOST;
}

/// The cap is checked against the projected total of both payment tokens.
inline constexpr bool within_secondary_cap(int64_t primary_funded, int64_t secondary_funded,
                                           int64_t amount, int64_t ido_size, uint16_t bps) {
    __int128 projected = (__int128)primary_funded + secondary_funded + amount;
    return projected <= calc_bps_cap(ido_size, bps);
}

/// payment units needed to sell the whole inventory: ido_size * price / 10^decimals
inline constexpr __int128 calc_goal_value(int64_t ido_size, uint64_t price, uint8_t decimals) {
    return (__int128)ido_size * price / power10_128(decimals);
}

/// sale tokens already sold: funded / price * 10^decimals (divide first)
inline constexpr __int128 calc_sold_equivalent(int64_t funded, uint64_t price, uint8_t decimals) {
    return (__int128)funded / (__int128)price * power10_128(decimals);
}

/// max_alloc * user_multiplier * spec_multiplier / 1e8
inline constexpr __int128 calc_max_alloc(int64_t max_alloc, uint64_t user_multiplier, uint64_t spec_multiplier) {
    return (__int128)max_alloc * user_multiplier * spec_multiplier / MULTIPLIER_SCALE;
}

} // namespace idovenue
