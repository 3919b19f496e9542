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
#include <lotvault/chain/staking_pool.hpp>

#include <lotvault/chain/capacity.hpp>
#include <lotvault/chain/exceptions.hpp>
#include <lotvault/chain/pool_admin_evaluator.hpp>
#include <lotvault/chain/pool_evaluator.hpp>
#include <lotvault/chain/provisioning_evaluator.hpp>

#include <fc/log/logger.hpp>

namespace lotvault { namespace chain {

staking_pool::staking_pool( account_name_type pool_operator,
                            pool_parameters params,
                            share_token& token,
                            wrapped_share_vault& vault,
                            provisioning_sink& sink )
   : _parameters( std::move(pool_operator), std::move(params) ),
     _token( token ),
     _vault( vault ),
     _sink( sink )
{
   initialize_evaluators();
}

staking_pool::~staking_pool()
{
}

void staking_pool::initialize_evaluators()
{
   _operation_evaluators.resize( operation::count() );

   register_evaluator<pool_deposit_evaluator>();
   register_evaluator<pool_stake_deposit_evaluator>();
   register_evaluator<pool_withdraw_evaluator>();
   register_evaluator<pool_unstake_withdraw_evaluator>();
   register_evaluator<pool_receive_evaluator>();
   register_evaluator<pool_provision_evaluator>();
   register_evaluator<pool_parameters_update_evaluator>();
   register_evaluator<pool_fee_policy_update_evaluator>();
   register_evaluator<pool_fee_withdraw_evaluator>();
   register_evaluator<pool_withdrawal_credentials_update_evaluator>();
   register_evaluator<pool_pause_evaluator>();
   register_evaluator<pool_operator_transfer_evaluator>();
   register_evaluator<pool_claimed_shares_migrate_evaluator>();
}

operation_result staking_pool::push_operation( const operation& op )
{ try {
   auto guard = _reentrancy_guard.enter();

   operation_validate( op );

   auto session = start_undo_session();
   auto result = apply_operation( op );
   session.commit();
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_result staking_pool::apply_operation( const operation& op )
{ try {
   int i_which = op.which();
   FC_ASSERT( i_which >= 0 && static_cast<size_t>( i_which ) < _operation_evaluators.size(),
              "Unknown operation tag ${w}", ("w",i_which) );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ i_which ];
   FC_ASSERT( eval, "No registered evaluator for this operation" );
   auto result = eval->evaluate( *this, op, true );
   dlog( "Applied ${op}: ${r}", ("op",op)("r",result) );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

staking_pool::undo_session staking_pool::start_undo_session()
{
   std::lock_guard<std::mutex> lock( _state_mutex );
   return undo_session( *this, _pool, _parameters );
}

void staking_pool::undo_session::undo()
{
   if( !_apply_undo )
      return;
   _pool.modify( [this]( pool_object& obj ) { obj = _saved_pool; } );
   _pool.modify_parameters( [this]( parameter_store& store ) { store = _saved_parameters; } );
   _apply_undo = false;
}

void staking_pool::register_fee_policy( const string& name, shared_ptr<fee_policy> policy )
{
   FC_ASSERT( !name.empty(), "A fee policy needs a name" );
   FC_ASSERT( policy != nullptr, "Fee policy ${n} is null", ("n",name) );
   std::lock_guard<std::mutex> lock( _state_mutex );
   _fee_policies[name] = std::move(policy);
}

bool staking_pool::has_fee_policy( const string& name )const
{
   std::lock_guard<std::mutex> lock( _state_mutex );
   return _fee_policies.find( name ) != _fee_policies.end();
}

fee_policy_handle staking_pool::get_fee_policy()const
{
   std::lock_guard<std::mutex> lock( _state_mutex );
   const auto& name = _parameters.fee_policy();
   if( !name.valid() )
      return fee_policy_handle();
   auto itr = _fee_policies.find( *name );
   FC_ASSERT( itr != _fee_policies.end(), "Active fee policy ${n} is not registered", ("n",*name) );
   return fee_policy_handle( *name, itr->second );
}

pool_object staking_pool::get_pool()const
{
   std::lock_guard<std::mutex> lock( _state_mutex );
   return _pool;
}

pool_parameters staking_pool::get_parameters()const
{
   std::lock_guard<std::mutex> lock( _state_mutex );
   return _parameters.snapshot();
}

account_name_type staking_pool::get_pool_operator()const
{
   std::lock_guard<std::mutex> lock( _state_mutex );
   return _parameters.pool_operator();
}

bool staking_pool::is_paused()const
{
   std::lock_guard<std::mutex> lock( _state_mutex );
   return _parameters.paused();
}

optional<string> staking_pool::get_fee_policy_name()const
{
   std::lock_guard<std::mutex> lock( _state_mutex );
   return _parameters.fee_policy();
}

withdrawal_credentials_type staking_pool::get_withdrawal_credentials()const
{
   std::lock_guard<std::mutex> lock( _state_mutex );
   return _parameters.withdrawal_credentials();
}

share_type staking_pool::get_capacity_limit()const
{
   return capacity_limit( get_parameters() );
}

share_type staking_pool::get_remaining_capacity()const
{
   std::lock_guard<std::mutex> lock( _state_mutex );
   return remaining_capacity( _pool, _parameters.snapshot() );
}

share_type staking_pool::get_max_deposit_before_fee()const
{
   std::lock_guard<std::mutex> lock( _state_mutex );
   return max_deposit_before_fee( _pool, _parameters.snapshot() );
}

} } // lotvault::chain
