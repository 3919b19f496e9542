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

#include <fc/io/json.hpp>

#include "../common/pool_fixture.hpp"

using namespace lotvault::chain;
using namespace lotvault::protocol;

BOOST_FIXTURE_TEST_SUITE( operation_tests, pool_fixture )

BOOST_AUTO_TEST_CASE( account_names )
{
   BOOST_CHECK( is_valid_account_name( "alice" ) );
   BOOST_CHECK( is_valid_account_name( "pool-operator" ) );
   BOOST_CHECK( is_valid_account_name( "lotvault.pool" ) );
   BOOST_CHECK( is_valid_account_name( "abc123" ) );

   BOOST_CHECK( !is_valid_account_name( "" ) );
   BOOST_CHECK( !is_valid_account_name( "ab" ) );
   BOOST_CHECK( !is_valid_account_name( "Alice" ) );
   BOOST_CHECK( !is_valid_account_name( "1alice" ) );
   BOOST_CHECK( !is_valid_account_name( "alice-" ) );
   BOOST_CHECK( !is_valid_account_name( "alice..bob" ) );
   BOOST_CHECK( !is_valid_account_name( "alice.b" ) );
   BOOST_CHECK( !is_valid_account_name( string( LOTVAULT_MAX_ACCOUNT_NAME_LENGTH + 1, 'a' ) ) );

   BOOST_CHECK( is_valid_account_name( string( LOTVAULT_MIN_ACCOUNT_NAME_LENGTH, 'a' ) ) );
   BOOST_CHECK( !is_valid_account_name( string( LOTVAULT_MIN_ACCOUNT_NAME_LENGTH - 1, 'a' ) ) );
   BOOST_CHECK( is_valid_account_name( string( LOTVAULT_MAX_ACCOUNT_NAME_LENGTH, 'a' ) ) );
}

BOOST_AUTO_TEST_CASE( user_operation_validation )
{ try {
   pool_deposit_operation dop = make_deposit_op( "alice", units(1) );
   dop.validate();
   REQUIRE_OP_VALIDATION_FAILURE( dop, amount, 0 );
   REQUIRE_OP_VALIDATION_FAILURE( dop, account, "" );

   pool_stake_deposit_operation sop = make_stake_deposit_op( "alice", units(1) );
   sop.validate();
   REQUIRE_OP_VALIDATION_FAILURE( sop, account, LOTVAULT_POOL_ACCOUNT );

   pool_withdraw_operation wop = make_withdraw_op( "alice", units(1) );
   wop.validate();
   REQUIRE_OP_VALIDATION_FAILURE( wop, share_amount, 0 );

   pool_unstake_withdraw_operation uop = make_unstake_withdraw_op( "alice", units(1) );
   uop.validate();
   REQUIRE_OP_VALIDATION_FAILURE( uop, wrapped_amount, 0 );
   REQUIRE_OP_VALIDATION_FAILURE( uop, account, LOTVAULT_POOL_ACCOUNT );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( operator_operation_validation )
{ try {
   pool_provision_operation pop = make_provision_op( pool_operator, 2 );
   pop.validate();
   REQUIRE_OP_VALIDATION_FAILURE( pop, pubkeys, vector<validator_pubkey_type>() );
   REQUIRE_OP_VALIDATION_FAILURE( pop, deposit_data_roots, vector<deposit_data_root_type>( 1 ) );
   REQUIRE_OP_VALIDATION_FAILURE( pop, pubkeys,
                                  vector<validator_pubkey_type>( 2, validator_pubkey_type( 47 ) ) );
   REQUIRE_OP_VALIDATION_FAILURE( pop, signatures,
                                  vector<validator_signature_type>( 2, validator_signature_type( 95 ) ) );

   pool_withdrawal_credentials_update_operation cop;
   cop.account = pool_operator;
   cop.withdrawal_credentials = sample_withdrawal_credentials();
   cop.validate();
   REQUIRE_OP_VALIDATION_FAILURE( cop, withdrawal_credentials, withdrawal_credentials_type( 33 ) );

   pool_operator_transfer_operation top;
   top.account = pool_operator;
   top.new_operator = "newop";
   top.validate();
   REQUIRE_OP_VALIDATION_FAILURE( top, new_operator, pool_operator );
   REQUIRE_OP_VALIDATION_FAILURE( top, new_operator, LOTVAULT_POOL_ACCOUNT );

   pool_fee_policy_update_operation fop;
   fop.account = pool_operator;
   fop.validate();
   REQUIRE_OP_VALIDATION_FAILURE( fop, fee_policy, string() );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( invalid_operation_changes_nothing )
{ try {
   deposit( "alice", units(5) );

   LOTVAULT_REQUIRE_THROW( pool->push_operation( make_withdraw_op( "alice", 0 ) ), fc::assert_exception );
   LOTVAULT_REQUIRE_THROW( pool->push_operation( make_deposit_op( "Bad Name", units(1) ) ), fc::assert_exception );

   BOOST_CHECK( pool_state().claimed_shares == units(5) );
   BOOST_CHECK( shares_of( "alice" ) == units(5) );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( operations_from_json )
{ try {
   // the format read by the replay program
   const string json = "[[0,{\"account\":\"alice\",\"amount\":\"20000000000000000000\"}],"
                       "[2,{\"account\":\"alice\",\"share_amount\":\"5000000000000000000\"}]]";
   const auto ops = fc::json::from_string( json ).as<vector<operation>>( LOTVAULT_MAX_NESTED_OBJECTS );
   BOOST_REQUIRE_EQUAL( ops.size(), 2u );
   BOOST_REQUIRE( ops[0].is_type<pool_deposit_operation>() );
   BOOST_CHECK( ops[0].get<pool_deposit_operation>().amount == units(20) );

   for( const auto& op : ops )
      pool->push_operation( op );
   BOOST_CHECK( pool_state().claimed_shares == units(15) );

   const operation_result result = pool->push_operation( make_deposit_op( "bob", units(1) ) );
   const fc::variant v( result, LOTVAULT_MAX_NESTED_OBJECTS );
   BOOST_CHECK( v.is_array() );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_SUITE_END()
