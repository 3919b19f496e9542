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

#include "pool_fixture.hpp"

namespace lotvault { namespace chain {

pool_fixture::pool_fixture()
{
   reset_pool( default_parameters() );
}

pool_fixture::~pool_fixture()
{
   // the pool refers to the collaborators, drop it first
   pool.reset();
}

pool_parameters pool_fixture::default_parameters()
{
   pool_parameters params;
   params.unit_size = units(32);
   params.units_per_lot = 1;
   params.admin_fee = 0;
   params.buffer = LOTVAULT_SCALE / 100;
   params.refund_fees_on_withdraw = true;
   return params;
}

void pool_fixture::reset_pool( const pool_parameters& params )
{
   pool.reset();
   token.reset( new local_share_token() );
   vault.reset( new local_wrapped_vault( *token ) );
   sink.reset( new local_provisioning_sink() );
   pool.reset( new staking_pool( pool_operator, params, *token, *vault, *sink ) );
}

pool_deposit_operation pool_fixture::make_deposit_op( const account_name_type& account,
                                                      const share_type& amount )const
{
   pool_deposit_operation op;
   op.account = account;
   op.amount = amount;
   return op;
}

pool_exchange_result pool_fixture::deposit( const account_name_type& account, const share_type& amount )
{
   return pool->push_operation( make_deposit_op( account, amount ) ).get<pool_exchange_result>();
}

pool_stake_deposit_operation pool_fixture::make_stake_deposit_op( const account_name_type& account,
                                                                  const share_type& amount )const
{
   pool_stake_deposit_operation op;
   op.account = account;
   op.amount = amount;
   return op;
}

pool_exchange_result pool_fixture::stake_deposit( const account_name_type& account, const share_type& amount )
{
   return pool->push_operation( make_stake_deposit_op( account, amount ) ).get<pool_exchange_result>();
}

pool_withdraw_operation pool_fixture::make_withdraw_op( const account_name_type& account,
                                                        const share_type& shares )const
{
   pool_withdraw_operation op;
   op.account = account;
   op.share_amount = shares;
   return op;
}

pool_exchange_result pool_fixture::withdraw( const account_name_type& account, const share_type& shares )
{
   return pool->push_operation( make_withdraw_op( account, shares ) ).get<pool_exchange_result>();
}

pool_unstake_withdraw_operation pool_fixture::make_unstake_withdraw_op( const account_name_type& account,
                                                                        const share_type& wrapped )const
{
   pool_unstake_withdraw_operation op;
   op.account = account;
   op.wrapped_amount = wrapped;
   return op;
}

pool_exchange_result pool_fixture::unstake_withdraw( const account_name_type& account, const share_type& wrapped )
{
   return pool->push_operation( make_unstake_withdraw_op( account, wrapped ) ).get<pool_exchange_result>();
}

void pool_fixture::receive( const account_name_type& account, const share_type& amount )
{
   pool_receive_operation op;
   op.account = account;
   op.amount = amount;
   pool->push_operation( op );
}

pool_provision_operation pool_fixture::make_provision_op( const account_name_type& account,
                                                          uint32_t unit_count )const
{
   pool_provision_operation op;
   op.account = account;
   for( uint32_t i = 0; i < unit_count; ++i )
   {
      op.pubkeys.emplace_back( LOTVAULT_VALIDATOR_PUBKEY_SIZE, char( i + 1 ) );
      op.signatures.emplace_back( LOTVAULT_VALIDATOR_SIGNATURE_SIZE, char( i + 1 ) );
      op.deposit_data_roots.push_back( fc::sha256::hash( std::to_string( i ) ) );
   }
   return op;
}

void pool_fixture::provision( uint32_t unit_count )
{
   pool->push_operation( make_provision_op( pool_operator, unit_count ) );
}

void pool_fixture::set_units_per_lot( uint32_t units_per_lot )
{
   pool_parameters_update_operation op;
   op.account = pool_operator;
   op.new_units_per_lot = units_per_lot;
   pool->push_operation( op );
}

void pool_fixture::set_buffer( const share_type& buffer )
{
   pool_parameters_update_operation op;
   op.account = pool_operator;
   op.new_buffer = buffer;
   pool->push_operation( op );
}

void pool_fixture::set_admin_fee( const share_type& admin_fee )
{
   pool_parameters_update_operation op;
   op.account = pool_operator;
   op.new_admin_fee = admin_fee;
   pool->push_operation( op );
}

void pool_fixture::set_refund_fees_on_withdraw( bool refund )
{
   pool_parameters_update_operation op;
   op.account = pool_operator;
   op.new_refund_fees_on_withdraw = refund;
   pool->push_operation( op );
}

void pool_fixture::use_fee_policy( const string& name, shared_ptr<fee_policy> policy )
{
   pool->register_fee_policy( name, std::move(policy) );

   pool_fee_policy_update_operation op;
   op.account = pool_operator;
   op.fee_policy = name;
   pool->push_operation( op );
}

void pool_fixture::disable_fee_policy()
{
   pool_fee_policy_update_operation op;
   op.account = pool_operator;
   pool->push_operation( op );
}

pool_exchange_result pool_fixture::withdraw_fees( const share_type& amount )
{
   pool_fee_withdraw_operation op;
   op.account = pool_operator;
   op.amount = amount;
   return pool->push_operation( op ).get<pool_exchange_result>();
}

void pool_fixture::set_withdrawal_credentials( const withdrawal_credentials_type& credentials )
{
   pool_withdrawal_credentials_update_operation op;
   op.account = pool_operator;
   op.withdrawal_credentials = credentials;
   pool->push_operation( op );
}

void pool_fixture::pause( bool paused )
{
   pool_pause_operation op;
   op.account = pool_operator;
   op.paused = paused;
   pool->push_operation( op );
}

void pool_fixture::migrate_claimed_shares( const share_type& claimed_shares )
{
   pool_claimed_shares_migrate_operation op;
   op.account = pool_operator;
   op.claimed_shares = claimed_shares;
   pool->push_operation( op );
}

void pool_fixture::verify_pool_invariants()const
{
   const pool_object state = pool_state();
   const pool_parameters params = pool->get_parameters();
   BOOST_CHECK( state.claimed_shares <= capacity_ceiling( params ) );
   BOOST_CHECK( state.accrued_fee <= state.native_balance );
   BOOST_CHECK( pool->get_remaining_capacity() <= capacity_limit( params ) );
   BOOST_CHECK( !pool->get_fee_policy().enabled() || pool->get_fee_policy_name().valid() );
}

withdrawal_credentials_type pool_fixture::sample_withdrawal_credentials()
{
   withdrawal_credentials_type credentials( LOTVAULT_WITHDRAWAL_CREDENTIALS_SIZE, 0 );
   credentials[0] = 0x01;
   credentials.back() = 0x2a;
   return credentials;
}

} } // lotvault::chain
