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

#include <lotvault/chain/capacity.hpp>

#include "../common/pool_fixture.hpp"

using namespace lotvault::chain;
using namespace lotvault::protocol;

BOOST_FIXTURE_TEST_SUITE( capacity_tests, pool_fixture )

BOOST_AUTO_TEST_CASE( capacity_follows_parameters )
{ try {
   BOOST_CHECK( pool->get_capacity_limit() == units(32) );
   BOOST_CHECK( pool->get_remaining_capacity() == units(32) );

   set_units_per_lot( 3 );
   BOOST_CHECK( pool->get_capacity_limit() == units(96) );
   BOOST_CHECK( pool->get_remaining_capacity() == units(96) );

   deposit( "alice", units(40) );
   BOOST_CHECK( pool->get_remaining_capacity() == units(56) );

   set_units_per_lot( 1 );
   // claimed shares above the new limit, nothing remains
   BOOST_CHECK( pool->get_remaining_capacity() == 0 );
   verify_pool_invariants();
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( capacity_query_is_idempotent )
{ try {
   deposit( "alice", units(10) );

   const share_type first = pool->get_remaining_capacity();
   const share_type second = pool->get_remaining_capacity();
   BOOST_CHECK( first == second );
   BOOST_CHECK( pool->get_max_deposit_before_fee() == pool->get_max_deposit_before_fee() );
   BOOST_CHECK( pool->get_pool().claimed_shares == units(10) );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( max_deposit_before_fee_grosses_up_the_admin_fee )
{ try {
   pool_parameters params = default_parameters();
   params.units_per_lot = 2;
   reset_pool( params );

   // no admin fee, the remaining capacity itself
   BOOST_CHECK( pool->get_max_deposit_before_fee() == units(64) );

   set_admin_fee( units(1) );
   // the fee is 1/33 of the lot unit cost, so 64 / (1 - 1/33) rounded down
   BOOST_CHECK( pool->get_max_deposit_before_fee() == units(66) - 3 );

   pool_object full;
   full.claimed_shares = units(70);
   BOOST_CHECK( max_deposit_before_fee( full, pool->get_parameters() ) == 0 );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( capacity_helpers )
{ try {
   pool_parameters params = default_parameters();
   params.units_per_lot = 2;
   params.buffer = units(10);

   BOOST_CHECK( capacity_limit( params ) == units(64) );
   BOOST_CHECK( capacity_ceiling( params ) == units(74) );

   pool_object state;
   state.claimed_shares = units(70);
   BOOST_CHECK( remaining_capacity( state, params ) == 0 );
   state.claimed_shares = units(60);
   BOOST_CHECK( remaining_capacity( state, params ) == units(4) );

   params.unit_size = ~share_type(0);
   LOTVAULT_REQUIRE_THROW( capacity_limit( params ), arithmetic_overflow );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_SUITE_END()
