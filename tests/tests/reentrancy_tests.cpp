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

#include <lotvault/chain/reentrancy_guard.hpp>

#include "../common/pool_fixture.hpp"

using namespace lotvault::chain;
using namespace lotvault::chain::test;
using namespace lotvault::protocol;

namespace {

/// Reads the pool from inside the fee calculation
class reading_fee_policy : public fee_policy
{
   public:
      explicit reading_fee_policy( const staking_pool& pool ) : _pool( pool ) {}

      fee_result process_deposit( const share_type& amount, const account_name_type& caller ) override
      {
         seen_claimed_shares = _pool.get_pool().claimed_shares;
         seen_remaining_capacity = _pool.get_remaining_capacity();
         fee_result r;
         r.net_amount = amount;
         return r;
      }
      fee_result process_withdraw( const share_type& amount, const account_name_type& caller ) override
      {
         fee_result r;
         r.net_amount = amount;
         return r;
      }

      share_type seen_claimed_shares = 0;
      share_type seen_remaining_capacity = 0;

   private:
      const staking_pool& _pool;
};

}

BOOST_FIXTURE_TEST_SUITE( reentrancy_tests, pool_fixture )

BOOST_AUTO_TEST_CASE( guard_rejects_nested_entry )
{ try {
   reentrancy_guard guard;
   BOOST_CHECK( !guard.entered() );
   {
      auto scope = guard.enter();
      BOOST_CHECK( guard.entered() );
      LOTVAULT_REQUIRE_THROW( guard.enter(), reentrancy_rejected );
      BOOST_CHECK( guard.entered() );
   }
   BOOST_CHECK( !guard.entered() );

   auto again = guard.enter();
   BOOST_CHECK( guard.entered() );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( fee_policy_calling_back_is_rejected )
{ try {
   deposit( "alice", units(10) );

   auto policy = std::make_shared<reentrant_fee_policy>( *pool, make_withdraw_op( "alice", units(10) ) );
   use_fee_policy( "reentrant", policy );

   const pool_object before = pool_state();
   LOTVAULT_REQUIRE_THROW( deposit( "bob", units(5) ), reentrancy_rejected );
   LOTVAULT_REQUIRE_THROW( withdraw( "alice", units(1) ), reentrancy_rejected );
   BOOST_CHECK_EQUAL( policy->rejected, 2u );

   const pool_object after = pool_state();
   BOOST_CHECK( after.claimed_shares == before.claimed_shares );
   BOOST_CHECK( after.accrued_fee == before.accrued_fee );
   BOOST_CHECK( after.native_balance == before.native_balance );
   BOOST_CHECK( shares_of( "alice" ) == units(10) );
   BOOST_CHECK( shares_of( "bob" ) == 0 );

   // the guard was released on the way out
   disable_fee_policy();
   deposit( "bob", units(5) );
   BOOST_CHECK( pool_state().claimed_shares == units(15) );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( guard_released_after_failures )
{ try {
   LOTVAULT_REQUIRE_THROW( deposit( "alice", units(33) ), capacity_exceeded );
   LOTVAULT_REQUIRE_THROW( withdraw( "alice", units(1) ), insufficient_balance );
   LOTVAULT_REQUIRE_THROW( pool->push_operation( make_deposit_op( "alice", 0 ) ), fc::assert_exception );

   deposit( "alice", units(32) );
   BOOST_CHECK( pool_state().claimed_shares == units(32) );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( queries_do_not_take_the_guard )
{ try {
   deposit( "alice", units(10) );

   auto policy = std::make_shared<reading_fee_policy>( *pool );
   use_fee_policy( "reader", policy );

   deposit( "bob", units(5) );
   // the policy saw the state before the deposit
   BOOST_CHECK( policy->seen_claimed_shares == units(10) );
   BOOST_CHECK( policy->seen_remaining_capacity == units(22) );
   BOOST_CHECK( pool_state().claimed_shares == units(15) );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_SUITE_END()
