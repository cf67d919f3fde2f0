/**
 *  @file
 *  @copyright defined in handlepay/LICENSE.txt
 */
#include "handlepay_tester.hpp"

#include <eosio/handlepay_plugin/handlepay_plugin.hpp>

BOOST_AUTO_TEST_SUITE(handlepay_plugin_tests)

BOOST_FIXTURE_TEST_CASE( handle_key_matches_contract_scope, handlepay_tester ) try {
   handlepay_apis::read_only api( *control, N(handlepay), N(handlevault) );

   auto key = api.get_handle_key( { "alice" } );
   BOOST_REQUIRE_EQUAL( "alice", key.handle );
   BOOST_REQUIRE( key.hash == fc::sha256::hash( string("alice") ) );
   BOOST_REQUIRE_EQUAL( fc::sha256::hash( string("alice") )._hash[0], key.scope );

   BOOST_REQUIRE_THROW( api.get_handle_key( { "" } ), contract_table_query_exception );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( vault_balances_per_handle, handlepay_tester ) try {
   handlepay_apis::read_only api( *control, N(handlepay), N(handlevault) );

   BOOST_REQUIRE( api.get_vault_balances( { "alice" } ).balances.empty() );

   BOOST_REQUIRE_EQUAL( success(), transfer( N(eosio.token), N(sender), N(handlevault), asset::from_string("3.0000 TLOS"), "alice" ) );
   BOOST_REQUIRE_EQUAL( success(), transfer( N(tkn.token), N(sender), N(handlevault), asset::from_string("12 TKN"), "alice" ) );
   BOOST_REQUIRE_EQUAL( success(), transfer( N(eosio.token), N(sender), N(handlevault), asset::from_string("1.0000 TLOS"), "bob" ) );

   auto res = api.get_vault_balances( { "alice" } );
   BOOST_REQUIRE_EQUAL( "alice", res.handle );
   BOOST_REQUIRE_EQUAL( 2u, res.balances.size() );
   BOOST_REQUIRE_EQUAL( account_name(N(eosio.token)), res.balances[0].contract );
   BOOST_REQUIRE_EQUAL( asset::from_string("3.0000 TLOS"), res.balances[0].balance );
   BOOST_REQUIRE_EQUAL( account_name(N(tkn.token)), res.balances[1].contract );
   BOOST_REQUIRE_EQUAL( asset::from_string("12 TKN"), res.balances[1].balance );

   BOOST_REQUIRE_THROW( api.get_vault_balances( { "" } ), contract_table_query_exception );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( fee_pools_of_components, handlepay_tester ) try {
   handlepay_apis::read_only api( *control, N(handlepay), N(handlevault) );

   BOOST_REQUIRE_EQUAL( success(), register_handle( "carol", N(carol) ) );
   BOOST_REQUIRE_EQUAL( success(), transfer( N(eosio.token), N(sender), N(handlepay), asset::from_string("10.0000 TLOS"), "carol" ) );
   BOOST_REQUIRE_EQUAL( success(), transfer( N(tkn.token), N(sender), N(handlepay), asset::from_string("300 TKN"), "carol" ) );

   auto tlos_pools = api.get_fee_pools( { N(handlepay), N(eosio.token) } );
   BOOST_REQUIRE_EQUAL( 1u, tlos_pools.pools.size() );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.1000 TLOS"), tlos_pools.pools[0] );

   auto tkn_pools = api.get_fee_pools( { N(handlepay), N(tkn.token) } );
   BOOST_REQUIRE_EQUAL( 1u, tkn_pools.pools.size() );
   BOOST_REQUIRE_EQUAL( asset::from_string("3 TKN"), tkn_pools.pools[0] );

   BOOST_REQUIRE( api.get_fee_pools( { N(handlevault), N(eosio.token) } ).pools.empty() );
   BOOST_REQUIRE_THROW( api.get_fee_pools( { N(eosio.token), N(eosio.token) } ), contract_table_query_exception );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
