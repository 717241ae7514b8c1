#define BOOST_TEST_MODULE allocation_tests
#include <boost/test/unit_test.hpp>

#include <idovenue/math.hpp>

using namespace idovenue;

BOOST_AUTO_TEST_SUITE(allocation_tests)

BOOST_AUTO_TEST_CASE(allocation_scales_by_sale_decimals)
{
    // 1,000,000 payment units at price 2 with an 18 decimal sale token
    const __int128 expected = 5 * power10_128(23);
    BOOST_CHECK(calc_allocation(1'000'000, 18, 2) == expected);
    BOOST_CHECK(!fits_int64(expected));

    BOOST_CHECK_EQUAL((int64_t)calc_allocation(1'000'000, 8, 2), 50'000'000'000'000LL);
    BOOST_CHECK_EQUAL((int64_t)calc_allocation(100'000'000, 8, 1'000'000), 10'000'000'000LL);
}

BOOST_AUTO_TEST_CASE(allocation_truncates_dust)
{
    BOOST_CHECK_EQUAL((int64_t)calc_allocation(7, 0, 2), 3);
    BOOST_CHECK_EQUAL((int64_t)calc_allocation(1, 0, 3), 0);
    BOOST_CHECK_EQUAL((int64_t)calc_allocation(10, 1, 3), 33);

    // two contributions never receive more than one of the same total
    const auto split = calc_allocation(5, 0, 3) + calc_allocation(5, 0, 3);
    const auto whole = calc_allocation(10, 0, 3);
    BOOST_CHECK(split <= whole);
}

BOOST_AUTO_TEST_CASE(secondary_cap_projects_both_tokens)
{
    BOOST_CHECK_EQUAL((int64_t)calc_bps_cap(10'000, 5'000), 5'000);
    BOOST_CHECK_EQUAL((int64_t)calc_bps_cap(3, 3'333), 0);
    BOOST_CHECK_EQUAL((int64_t)calc_bps_cap(10'000, 0), 0);
    BOOST_CHECK_EQUAL((int64_t)calc_bps_cap(10'000, 10'000), 10'000);

    BOOST_CHECK(within_secondary_cap(4'000, 0, 1'000, 10'000, 5'000));
    BOOST_CHECK(!within_secondary_cap(4'000, 1'000, 1, 10'000, 5'000));
    BOOST_CHECK(!within_secondary_cap(0, 0, 1, 10'000, 0));
}

BOOST_AUTO_TEST_CASE(goal_and_sold_equivalent)
{
    // 1000 sale tokens (8 decimals) at 1.000000 payment unit each
    BOOST_CHECK_EQUAL((int64_t)calc_goal_value(100'000'000'000LL, 1'000'000, 8), 1'000'000'000LL);
    BOOST_CHECK_EQUAL((int64_t)calc_sold_equivalent(100'000'000, 1'000'000, 8), 10'000'000'000LL);

    // the division runs before scaling
    BOOST_CHECK_EQUAL((int64_t)calc_sold_equivalent(5, 2, 2), 200);
    BOOST_CHECK_EQUAL((int64_t)calc_sold_equivalent(1, 2, 8), 0);
}

BOOST_AUTO_TEST_CASE(max_alloc_multiplier_scale)
{
    BOOST_CHECK_EQUAL((int64_t)calc_max_alloc(1'000, 2, 150'000'000), 3'000);
    BOOST_CHECK_EQUAL((int64_t)calc_max_alloc(1'000, 1, MULTIPLIER_SCALE), 1'000);
    BOOST_CHECK_EQUAL((int64_t)calc_max_alloc(1'000, 0, MULTIPLIER_SCALE), 0);
    BOOST_CHECK_EQUAL((int64_t)calc_max_alloc(1, 1, 99'999'999), 0);
}

BOOST_AUTO_TEST_CASE(int64_range_guard)
{
    BOOST_CHECK(fits_int64(0));
    BOOST_CHECK(fits_int64(std::numeric_limits<int64_t>::max()));
    BOOST_CHECK(!fits_int64((__int128)std::numeric_limits<int64_t>::max() + 1));
    BOOST_CHECK(!fits_int64(-1));
    BOOST_CHECK(power10_128(0) == 1);
    BOOST_CHECK(power10_128(18) == (__int128)1'000'000'000'000'000'000LL);
}

BOOST_AUTO_TEST_SUITE_END()
