/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <boost/test/unit_test.hpp>

#include "../common/pool_fixture.hpp"

using namespace lotvault::chain;
using namespace lotvault::protocol;

BOOST_FIXTURE_TEST_SUITE( provisioning_tests, pool_fixture )

BOOST_AUTO_TEST_CASE( provision_moves_capital_to_the_sink )
{ try {
   pool_parameters params = default_parameters();
   params.units_per_lot = 2;
   reset_pool( params );
   set_withdrawal_credentials( sample_withdrawal_credentials() );

   deposit( "alice", units(40) );
   deposit( "bob", units(24) );

   const pool_provision_operation op = make_provision_op( pool_operator, 2 );
   pool->push_operation( op );

   const pool_object state = pool_state();
   BOOST_CHECK_EQUAL( state.lots_provisioned, 2u );
   BOOST_CHECK( state.native_balance == 0 );
   // accounting and custody diverge, the shares stay claimed
   BOOST_CHECK( state.claimed_shares == units(64) );

   BOOST_REQUIRE_EQUAL( sink->units().size(), 2u );
   BOOST_CHECK( sink->total_provisioned() == units(64) );
   for( size_t i = 0; i < 2; ++i )
   {
      const auto& unit = sink->units()[i];
      BOOST_CHECK( unit.pubkey == op.pubkeys[i] );
      BOOST_CHECK( unit.signature == op.signatures[i] );
      BOOST_CHECK( unit.deposit_data_root == op.deposit_data_roots[i] );
      BOOST_CHECK( unit.withdrawal_credentials == sample_withdrawal_credentials() );
      BOOST_CHECK( unit.amount == units(32) );
   }
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( lots_provisioned_only_grows )
{ try {
   set_withdrawal_credentials( sample_withdrawal_credentials() );

   uint64_t previous = 0;
   for( int i = 0; i < 3; ++i )
   {
      receive( "beacon", units(32) );
      provision( 1 );
      const uint64_t lots = pool_state().lots_provisioned;
      BOOST_CHECK_EQUAL( lots, previous + 1 );
      previous = lots;
   }
   BOOST_CHECK( pool_state().claimed_shares == 0 );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( provision_needs_enough_capital )
{ try {
   set_withdrawal_credentials( sample_withdrawal_credentials() );
   deposit( "alice", units(31) );

   LOTVAULT_REQUIRE_THROW( provision( 1 ), insufficient_balance );

   const pool_object state = pool_state();
   BOOST_CHECK_EQUAL( state.lots_provisioned, 0u );
   BOOST_CHECK( state.native_balance == units(31) );
   BOOST_CHECK( sink->units().empty() );

   deposit( "bob", units(1) );
   provision( 1 );
   BOOST_CHECK_EQUAL( pool_state().lots_provisioned, 1u );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( provision_permissions_and_preconditions )
{ try {
   deposit( "alice", units(32) );

   // no withdrawal credentials yet
   LOTVAULT_REQUIRE_THROW( provision( 1 ), invalid_parameter );
   set_withdrawal_credentials( sample_withdrawal_credentials() );

   LOTVAULT_REQUIRE_THROW( pool->push_operation( make_provision_op( "alice", 1 ) ), unauthorized );

   pause();
   LOTVAULT_REQUIRE_THROW( provision( 1 ), pool_paused );
   pause( false );

   pool_provision_operation op = make_provision_op( pool_operator, 1 );
   op.signatures.clear();
   LOTVAULT_REQUIRE_THROW( pool->push_operation( op ), fc::assert_exception );

   LOTVAULT_REQUIRE_THROW( pool->push_operation( make_provision_op( pool_operator, 0 ) ), fc::assert_exception );

   BOOST_CHECK( sink->units().empty() );
   provision( 1 );
   BOOST_CHECK_EQUAL( sink->units().size(), 1u );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_SUITE_END()
