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
#include <lotvault/chain/provisioning_evaluator.hpp>

#include <lotvault/chain/exceptions.hpp>
#include <lotvault/chain/staking_pool.hpp>

#include <lotvault/protocol/fixed_point.hpp>

#include <fc/log/logger.hpp>

namespace lotvault { namespace chain {

void_result pool_provision_evaluator::do_evaluate(const pool_provision_operation& op)
{ try {
   const staking_pool& d = db();

   verify_operator( op.account );
   verify_not_paused();

   _withdrawal_credentials = d.get_withdrawal_credentials();
   LOTVAULT_ASSERT( _withdrawal_credentials.size() == LOTVAULT_WITHDRAWAL_CREDENTIALS_SIZE, invalid_parameter,
                    "Withdrawal credentials must be set before provisioning",
                    ("size",_withdrawal_credentials.size()) );

   _provisioned_amount = checked_mul( params.unit_size, op.unit_count() );

   const share_type balance = d.get_pool().native_balance;
   LOTVAULT_ASSERT( balance >= _provisioned_amount, insufficient_balance,
                    "The pool holds ${b}, unable to provision ${n} units of ${s}",
                    ("b",balance)("n",op.unit_count())("s",params.unit_size) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_provision_evaluator::do_apply(const pool_provision_operation& op)
{ try {
   staking_pool& d = db();

   // claimed shares are left alone, the provisioned capital still backs the outstanding shares
   d.modify( [this,&op]( pool_object& p ) {
      p.lots_provisioned += op.unit_count();
      p.native_balance -= _provisioned_amount;
   });

   provisioning_sink& sink = d.get_provisioning_sink();
   for( size_t i = 0; i < op.pubkeys.size(); ++i )
      sink.provision( op.pubkeys[i], _withdrawal_credentials, op.signatures[i], op.deposit_data_roots[i],
                      params.unit_size );

   ilog( "Provisioned ${n} units of ${s}, ${t} units in total",
         ("n",op.unit_count())("s",params.unit_size)("t",d.get_pool().lots_provisioned) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // lotvault::chain
