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
#include <lotvault/chain/pool_admin_evaluator.hpp>

#include <lotvault/chain/exceptions.hpp>
#include <lotvault/chain/staking_pool.hpp>

#include <fc/log/logger.hpp>

namespace lotvault { namespace chain {

void_result pool_parameters_update_evaluator::do_evaluate(const pool_parameters_update_operation& op)
{ try {
   verify_operator( op.account );

   if( op.new_units_per_lot.valid() )
      LOTVAULT_ASSERT( *op.new_units_per_lot > 0, invalid_parameter,
                       "Units per lot can not be zero, deposits would be blocked",
                       ("n",*op.new_units_per_lot) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_parameters_update_evaluator::do_apply(const pool_parameters_update_operation& op)
{ try {
   staking_pool& d = db();

   d.modify_parameters( [&op]( parameter_store& store ) {
      if( op.new_units_per_lot.valid() )
         store.set_units_per_lot( *op.new_units_per_lot );
      if( op.new_admin_fee.valid() )
         store.set_admin_fee( *op.new_admin_fee );
      if( op.new_buffer.valid() )
         store.set_buffer( *op.new_buffer );
      if( op.new_refund_fees_on_withdraw.valid() )
         store.set_refund_fees_on_withdraw( *op.new_refund_fees_on_withdraw );
   });

   ilog( "Pool parameters changed by ${a} to ${p}", ("a",op.account)("p",d.get_parameters()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_fee_policy_update_evaluator::do_evaluate(const pool_fee_policy_update_operation& op)
{ try {
   verify_operator( op.account );

   if( op.fee_policy.valid() )
      LOTVAULT_ASSERT( db().has_fee_policy( *op.fee_policy ), invalid_parameter,
                       "Fee policy ${n} is not registered with the pool", ("n",*op.fee_policy) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_fee_policy_update_evaluator::do_apply(const pool_fee_policy_update_operation& op)
{ try {
   db().modify_parameters( [&op]( parameter_store& store ) {
      store.set_fee_policy( op.fee_policy );
   });

   if( op.fee_policy.valid() )
      ilog( "Fee policy set to ${n} by ${a}", ("n",*op.fee_policy)("a",op.account) );
   else
      ilog( "Fee processing disabled by ${a}", ("a",op.account) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_fee_withdraw_evaluator::do_evaluate(const pool_fee_withdraw_operation& op)
{ try {
   verify_operator( op.account );

   const pool_object pool = db().get_pool();
   _amount = ( op.amount == 0 ? pool.accrued_fee : op.amount );

   LOTVAULT_ASSERT( _amount <= pool.accrued_fee, insufficient_balance,
                    "Unable to withdraw ${n}, only ${a} of fee has accrued",
                    ("n",_amount)("a",pool.accrued_fee) );
   LOTVAULT_ASSERT( _amount <= pool.native_balance, insufficient_balance,
                    "Unable to withdraw ${n} of fee, the pool holds ${b}",
                    ("n",_amount)("b",pool.native_balance) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

pool_exchange_result pool_fee_withdraw_evaluator::do_apply(const pool_fee_withdraw_operation& op)
{ try {
   db().modify( [this]( pool_object& p ) {
      p.accrued_fee -= _amount;
      p.native_balance -= _amount;
   });

   ilog( "Operator ${a} withdrew ${n} of accrued fee", ("a",op.account)("n",_amount) );

   pool_exchange_result result;
   result.received = _amount;
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_withdrawal_credentials_update_evaluator::do_evaluate(
      const pool_withdrawal_credentials_update_operation& op )
{ try {
   verify_operator( op.account );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_withdrawal_credentials_update_evaluator::do_apply(
      const pool_withdrawal_credentials_update_operation& op )
{ try {
   db().modify_parameters( [&op]( parameter_store& store ) {
      store.set_withdrawal_credentials( op.withdrawal_credentials );
   });

   ilog( "Withdrawal credentials set to ${c} by ${a}", ("c",op.withdrawal_credentials)("a",op.account) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_pause_evaluator::do_evaluate(const pool_pause_operation& op)
{ try {
   verify_operator( op.account );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_pause_evaluator::do_apply(const pool_pause_operation& op)
{ try {
   db().modify_parameters( [&op]( parameter_store& store ) {
      store.set_paused( op.paused );
   });

   ilog( "Pool ${s} by ${a}", ("s",op.paused ? "paused" : "resumed")("a",op.account) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_operator_transfer_evaluator::do_evaluate(const pool_operator_transfer_operation& op)
{ try {
   verify_operator( op.account );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_operator_transfer_evaluator::do_apply(const pool_operator_transfer_operation& op)
{ try {
   db().modify_parameters( [&op]( parameter_store& store ) {
      store.set_pool_operator( op.new_operator );
   });

   ilog( "Pool operator changed from ${a} to ${n}", ("a",op.account)("n",op.new_operator) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // lotvault::chain
