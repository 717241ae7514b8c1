#include <boost/test/unit_test.hpp>

#include "ido_pool_tester.hpp"

using namespace idovenue_test;

namespace {

struct meta_ido_tester : ido_pool_tester {
   meta_ido_tester() {
      BOOST_REQUIRE_EQUAL( success(), create_round( round_params{} ) );
      produce_blocks();
      BOOST_REQUIRE_EQUAL( success(), create_round( round_params{} ) );
      produce_blocks();
      BOOST_REQUIRE_EQUAL( success(), create_round( round_params{} ) );
      BOOST_REQUIRE_EQUAL( success(), admin_action( "createmeta"_n, mvo() ) );
      produce_blocks();
   }

   action_result managemeta( uint64_t meta_id, uint64_t round_id, bool add ) {
      return admin_action( "managemeta"_n, mvo()("meta_id", meta_id)("round_id", round_id)("add", add) );
   }

   action_result setroundspec( uint64_t round_id, uint32_t min_rank, uint32_t max_rank, bool no_rank,
                               int64_t max_alloc, uint64_t multiplier, bool no_multiplier ) {
      return admin_action( "setroundspec"_n, mvo()
         ("round_id", round_id)("min_rank", min_rank)("max_rank", max_rank)("no_rank", no_rank)
         ("max_alloc", max_alloc)("max_alloc_multiplier", multiplier)("no_multiplier", no_multiplier) );
   }

   vector<fc::variant> eligibility( const name& user, const vector<uint64_t>& round_ids ) {
      auto trace = push_trace( POOL, user, "eligibility"_n, mvo()("user", user)("round_ids", round_ids) );
      BOOST_REQUIRE( trace->receipt );
      const auto& ret = trace->action_traces[0].return_value;
      auto result = pool_abi_ser.binary_to_variant( "round_eligibility[]", ret,
                                                    abi_serializer::create_yield_function(abi_serializer_max_time) );
      return result.get_array();
   }
};

}

BOOST_AUTO_TEST_SUITE(meta_ido_tests)

BOOST_FIXTURE_TEST_CASE( createmeta_returns_id, meta_ido_tester ) try {
   auto trace = push_trace( POOL, ADMIN, "createmeta"_n, mvo() );
   uint64_t meta_id = 0;
   fc::datastream<const char*> ds( trace->action_traces[0].return_value.data(),
                                   trace->action_traces[0].return_value.size() );
   fc::raw::unpack( ds, meta_id );
   BOOST_REQUIRE_EQUAL( meta_id, 2u );
   BOOST_REQUIRE_EQUAL( get_global()["last_meta_id"].as_uint64(), 2u );
   BOOST_REQUIRE( get_meta( 2 )["round_ids"].get_array().empty() );

   BOOST_REQUIRE( has_err( admin_action( "createmeta"_n, mvo(), "bob"_n ), NO_AUTH ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( manage_meta_membership, meta_ido_tester ) try {
   BOOST_REQUIRE( has_err( managemeta( 9, 1, true ), META_NOT_FOUND ) );
   BOOST_REQUIRE( has_err( managemeta( 1, 9, true ), ROUND_NOT_FOUND ) );

   BOOST_REQUIRE_EQUAL( success(), managemeta( 1, 1, true ) );
   BOOST_REQUIRE_EQUAL( success(), managemeta( 1, 2, true ) );
   BOOST_REQUIRE_EQUAL( success(), managemeta( 1, 3, true ) );
   BOOST_REQUIRE_EQUAL( get_meta( 1 )["round_ids"].get_array().size(), 3u );
   BOOST_REQUIRE_EQUAL( get_round( 2 )["meta_ido_id"].as_uint64(), 1u );

   produce_blocks();
   BOOST_REQUIRE( has_err( managemeta( 1, 2, true ), RECORD_EXISTS ) );

   BOOST_REQUIRE_EQUAL( success(), managemeta( 1, 1, false ) );
   BOOST_REQUIRE_EQUAL( get_round( 1 )["meta_ido_id"].as_uint64(), 0u );

   // swap and pop moves the last round into the freed slot
   auto ids = get_meta( 1 )["round_ids"].get_array();
   BOOST_REQUIRE_EQUAL( ids.size(), 2u );
   BOOST_REQUIRE_EQUAL( ids[0].as_uint64(), 3u );
   BOOST_REQUIRE_EQUAL( ids[1].as_uint64(), 2u );

   produce_blocks();
   BOOST_REQUIRE( has_err( managemeta( 1, 1, false ), ROUND_NOT_IN_META ) );
   BOOST_REQUIRE( has_err( admin_action( "managemeta"_n, mvo()("meta_id", 1)("round_id", 2)("add", false), "alice"_n ), NO_AUTH ) );

   // a removed round can join again
   BOOST_REQUIRE_EQUAL( success(), managemeta( 1, 1, true ) );
   BOOST_REQUIRE_EQUAL( get_round( 1 )["meta_ido_id"].as_uint64(), 1u );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( meta_users_register, meta_ido_tester ) try {
   BOOST_REQUIRE( has_err( push( POOL, "bob"_n, "metaregister"_n, mvo()("user", "bob")("meta_id", 9) ), META_NOT_FOUND ) );
   BOOST_REQUIRE_EQUAL( success(), push( POOL, "bob"_n, "metaregister"_n, mvo()("user", "bob")("meta_id", 1) ) );
   produce_blocks();
   BOOST_REQUIRE( has_err( push( POOL, "bob"_n, "metaregister"_n, mvo()("user", "bob")("meta_id", 1) ), RECORD_EXISTS ) );

   BOOST_REQUIRE( has_err( admin_action( "setmetauser"_n,
      mvo()("meta_id", 1)("users", vector<name>{ "alice"_n })("rank", 3)("multiplier", 1001) ), PARAM_ERROR ) );
   BOOST_REQUIRE( has_err( admin_action( "setmetauser"_n,
      mvo()("meta_id", 1)("users", vector<name>{})("rank", 3)("multiplier", 2) ), PARAM_ERROR ) );
   BOOST_REQUIRE( has_err( admin_action( "setmetauser"_n,
      mvo()("meta_id", 1)("users", vector<name>{ "alice"_n })("rank", 3)("multiplier", 2), "alice"_n ), NO_AUTH ) );
   BOOST_REQUIRE_EQUAL( success(), admin_action( "setmetauser"_n,
      mvo()("meta_id", 1)("users", vector<name>{ "alice"_n, "bob"_n })("rank", 3)("multiplier", 2) ) );

   auto row = get_table_row( name(1), "metausers"_n, "meta_user_t", "bob"_n.to_uint64_t() );
   BOOST_REQUIRE_EQUAL( row["rank"].as_uint64(), 3u );
   BOOST_REQUIRE_EQUAL( row["registered"].as_bool(), true );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( eligibility_from_spec_and_rank, meta_ido_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), managemeta( 1, 1, true ) );
   BOOST_REQUIRE_EQUAL( success(), managemeta( 1, 2, true ) );

   // round 1: ranks 2..5, 1000.000000 base allocation scaled by 1.5 and the user multiplier
   BOOST_REQUIRE_EQUAL( success(), setroundspec( 1, 2, 5, false, 1'000'000'000, 150'000'000, false ) );
   // round 3: open to any rank with a flat ceiling
   BOOST_REQUIRE_EQUAL( success(), setroundspec( 3, 0, 0, true, 777, 0, true ) );
   BOOST_REQUIRE( has_err( setroundspec( 2, 5, 2, false, 1, 0, true ), PARAM_ERROR ) );
   BOOST_REQUIRE( has_err( setroundspec( 9, 0, 1, false, 1, 0, true ), ROUND_NOT_FOUND ) );

   BOOST_REQUIRE_EQUAL( success(), admin_action( "setmetauser"_n,
      mvo()("meta_id", 1)("users", vector<name>{ "alice"_n })("rank", 3)("multiplier", 2) ) );
   BOOST_REQUIRE_EQUAL( success(), push( POOL, "bob"_n, "metaregister"_n, mvo()("user", "bob")("meta_id", 1) ) );
   produce_blocks();

   auto alice = eligibility( "alice"_n, { 1, 2, 3 } );
   BOOST_REQUIRE_EQUAL( alice.size(), 3u );
   BOOST_REQUIRE_EQUAL( alice[0]["round_id"].as_uint64(), 1u );
   BOOST_REQUIRE_EQUAL( alice[0]["eligible"].as_bool(), true );
   BOOST_REQUIRE_EQUAL( alice[0]["capped"].as_bool(), true );
   BOOST_REQUIRE_EQUAL( alice[0]["max_alloc"].as_int64(), 3'000'000'000 );
   // no spec: open and uncapped
   BOOST_REQUIRE_EQUAL( alice[1]["eligible"].as_bool(), true );
   BOOST_REQUIRE_EQUAL( alice[1]["capped"].as_bool(), false );
   BOOST_REQUIRE_EQUAL( alice[2]["max_alloc"].as_int64(), 777 );

   // registered without a rank
   auto bob = eligibility( "bob"_n, { 1 } );
   BOOST_REQUIRE_EQUAL( bob[0]["eligible"].as_bool(), false );
   BOOST_REQUIRE_EQUAL( bob[0]["max_alloc"].as_int64(), 0 );

   auto carol = eligibility( "carol"_n, { 1, 3 } );
   BOOST_REQUIRE_EQUAL( carol[0]["eligible"].as_bool(), false );
   BOOST_REQUIRE_EQUAL( carol[1]["eligible"].as_bool(), true );
   BOOST_REQUIRE_EQUAL( carol[1]["max_alloc"].as_int64(), 777 );

   // dropping the spec reopens the round
   BOOST_REQUIRE_EQUAL( success(), admin_action( "delroundspec"_n, mvo()("round_id", 1) ) );
   produce_blocks();
   BOOST_REQUIRE( has_err( admin_action( "delroundspec"_n, mvo()("round_id", 1) ), RECORD_NOT_FOUND ) );
   carol = eligibility( "carol"_n, { 1 } );
   BOOST_REQUIRE_EQUAL( carol[0]["eligible"].as_bool(), true );
   BOOST_REQUIRE_EQUAL( carol[0]["capped"].as_bool(), false );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( eligibility_unknown_round, meta_ido_tester ) try {
   BOOST_REQUIRE_EXCEPTION( eligibility( "alice"_n, { 1, 42 } ), eosio_assert_message_exception,
                            eosio_assert_message_starts_with( "[[90]]" ) );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
