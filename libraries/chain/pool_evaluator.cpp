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
#include <lotvault/chain/pool_evaluator.hpp>

#include <lotvault/chain/capacity.hpp>
#include <lotvault/chain/exceptions.hpp>
#include <lotvault/chain/staking_pool.hpp>

#include <lotvault/protocol/fixed_point.hpp>

#include <fc/log/logger.hpp>

namespace lotvault { namespace chain {

namespace detail {

   /// Claimed shares after crediting @p net, throws capacity_exceeded past the capacity ceiling
   share_type claimed_shares_after_deposit( const staking_pool& d, const pool_parameters& params,
                                            const share_type& net )
   {
      const share_type claimed = d.get_pool().claimed_shares;
      const share_type new_claimed = checked_add( claimed, net );
      const share_type ceiling = capacity_ceiling( params );
      LOTVAULT_ASSERT( new_claimed <= ceiling, capacity_exceeded,
                       "Deposit would raise claimed shares to ${n}, above the capacity ceiling ${c}",
                       ("n",new_claimed)("c",ceiling)("claimed",claimed)("net",net) );
      return new_claimed;
   }

   /// Books a deposit of @p gross native capital of which @p fee went to the pool
   void commit_deposit( staking_pool& d, const share_type& new_claimed, const share_type& gross,
                        const fee_result& fee )
   {
      const pool_object pool = d.get_pool();
      const share_type new_accrued_fee = checked_add( pool.accrued_fee, fee.fee );
      const share_type new_native_balance = checked_add( pool.native_balance, gross );

      d.modify( [&]( pool_object& p ) {
         p.claimed_shares = new_claimed;
         p.accrued_fee = new_accrued_fee;
         p.native_balance = new_native_balance;
      });
   }

   /**
    *  Checks a withdrawal of @p fee.net_amount native capital against the pool and returns the
    *  accrued fee after the withdrawal.
    */
   share_type evaluate_withdrawal( const staking_pool& d, const pool_parameters& params,
                                   const fee_result& fee )
   {
      const pool_object pool = d.get_pool();

      share_type new_accrued_fee;
      if( params.refund_fees_on_withdraw )
      {
         LOTVAULT_ASSERT( fee.fee <= pool.accrued_fee, insufficient_balance,
                          "Unable to refund a fee of ${f} from an accrued fee of ${a}",
                          ("f",fee.fee)("a",pool.accrued_fee) );
         new_accrued_fee = pool.accrued_fee - fee.fee;
      }
      else
         new_accrued_fee = checked_add( pool.accrued_fee, fee.fee );

      const share_type required = checked_add( fee.net_amount, new_accrued_fee );
      LOTVAULT_ASSERT( pool.native_balance >= required, insufficient_balance,
                       "The pool holds ${b}, unable to release ${n} while keeping ${a} of accrued fee",
                       ("b",pool.native_balance)("n",fee.net_amount)("a",new_accrued_fee) );

      LOTVAULT_ASSERT( pool.claimed_shares >= fee.net_amount, invariant_violation,
                       "Withdrawal of ${n} exceeds the claimed shares ${c}",
                       ("n",fee.net_amount)("c",pool.claimed_shares) );

      return new_accrued_fee;
   }

   void commit_withdrawal( staking_pool& d, const share_type& net, const share_type& new_accrued_fee )
   {
      d.modify( [&]( pool_object& p ) {
         p.claimed_shares -= net;
         p.accrued_fee = new_accrued_fee;
         p.native_balance -= net;
      });
   }

} // detail

void_result pool_deposit_evaluator::do_evaluate(const pool_deposit_operation& op)
{ try {
   const staking_pool& d = db();

   verify_not_paused();

   _fee = fees.process_deposit( op.amount, op.account );
   _new_claimed_shares = detail::claimed_shares_after_deposit( d, params, _fee.net_amount );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

pool_exchange_result pool_deposit_evaluator::do_apply(const pool_deposit_operation& op)
{ try {
   staking_pool& d = db();

   detail::commit_deposit( d, _new_claimed_shares, op.amount, _fee );
   d.get_share_token().mint( op.account, _fee.net_amount );

   pool_exchange_result result;
   result.paid = op.amount;
   result.received = _fee.net_amount;
   result.fee = _fee.fee;
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_stake_deposit_evaluator::do_evaluate(const pool_stake_deposit_operation& op)
{ try {
   const staking_pool& d = db();

   verify_not_paused();

   _fee = fees.process_deposit( op.amount, op.account );
   _new_claimed_shares = detail::claimed_shares_after_deposit( d, params, _fee.net_amount );

   _wrapped = db().get_wrapped_vault().preview_deposit( _fee.net_amount );
   FC_ASSERT( _wrapped > 0, "Depositing ${n} shares into the wrapped vault would issue nothing",
              ("n",_fee.net_amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

pool_exchange_result pool_stake_deposit_evaluator::do_apply(const pool_stake_deposit_operation& op)
{ try {
   staking_pool& d = db();

   detail::commit_deposit( d, _new_claimed_shares, op.amount, _fee );

   // the shares pass through the pool account on their way into the vault
   d.get_share_token().mint( LOTVAULT_POOL_ACCOUNT, _fee.net_amount );
   const share_type wrapped = d.get_wrapped_vault().deposit( _fee.net_amount, op.account );
   LOTVAULT_ASSERT( wrapped == _wrapped, invariant_violation,
                    "The wrapped vault issued ${w} wrapped shares, expected ${e}", ("w",wrapped)("e",_wrapped) );

   pool_exchange_result result;
   result.paid = op.amount;
   result.received = wrapped;
   result.fee = _fee.fee;
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_withdraw_evaluator::do_evaluate(const pool_withdraw_operation& op)
{ try {
   const staking_pool& d = db();

   verify_not_paused();

   _fee = fees.process_withdraw( op.share_amount, op.account );
   _new_accrued_fee = detail::evaluate_withdrawal( d, params, _fee );

   const share_type held = db().get_share_token().balance_of( op.account );
   LOTVAULT_ASSERT( held >= op.share_amount, insufficient_balance,
                    "Account ${a} holds ${h} shares, unable to withdraw ${n}",
                    ("a",op.account)("h",held)("n",op.share_amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

pool_exchange_result pool_withdraw_evaluator::do_apply(const pool_withdraw_operation& op)
{ try {
   staking_pool& d = db();

   d.get_share_token().burn( op.account, op.share_amount );
   detail::commit_withdrawal( d, _fee.net_amount, _new_accrued_fee );

   pool_exchange_result result;
   result.paid = op.share_amount;
   result.received = _fee.net_amount;
   result.fee = _fee.fee;
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_unstake_withdraw_evaluator::do_evaluate(const pool_unstake_withdraw_operation& op)
{ try {
   const staking_pool& d = db();

   verify_not_paused();

   const share_type wrapped_held = db().get_wrapped_vault().balance_of( op.account );
   LOTVAULT_ASSERT( wrapped_held >= op.wrapped_amount, insufficient_balance,
                    "Account ${a} holds ${h} wrapped shares, unable to redeem ${n}",
                    ("a",op.account)("h",wrapped_held)("n",op.wrapped_amount) );

   _shares = db().get_wrapped_vault().preview_redeem( op.wrapped_amount );
   FC_ASSERT( _shares > 0, "Redeeming ${n} wrapped shares would return nothing", ("n",op.wrapped_amount) );

   _fee = fees.process_withdraw( _shares, op.account );
   _new_accrued_fee = detail::evaluate_withdrawal( d, params, _fee );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

pool_exchange_result pool_unstake_withdraw_evaluator::do_apply(const pool_unstake_withdraw_operation& op)
{ try {
   staking_pool& d = db();

   const share_type redeemed = d.get_wrapped_vault().redeem( op.wrapped_amount, LOTVAULT_POOL_ACCOUNT, op.account );
   LOTVAULT_ASSERT( redeemed == _shares, invariant_violation,
                    "The wrapped vault returned ${r} shares, expected ${s}", ("r",redeemed)("s",_shares) );

   d.get_share_token().burn( LOTVAULT_POOL_ACCOUNT, redeemed );
   detail::commit_withdrawal( d, _fee.net_amount, _new_accrued_fee );

   pool_exchange_result result;
   result.paid = op.wrapped_amount;
   result.received = _fee.net_amount;
   result.fee = _fee.fee;
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_receive_evaluator::do_evaluate(const pool_receive_operation& op)
{ try {
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_receive_evaluator::do_apply(const pool_receive_operation& op)
{ try {
   staking_pool& d = db();

   const share_type new_native_balance = checked_add( d.get_pool().native_balance, op.amount );
   d.modify( [&new_native_balance]( pool_object& p ) {
      p.native_balance = new_native_balance;
   });
   dlog( "Received ${n} from ${a}", ("n",op.amount)("a",op.account) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_claimed_shares_migrate_evaluator::do_evaluate(const pool_claimed_shares_migrate_operation& op)
{ try {
   verify_operator( op.account );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result pool_claimed_shares_migrate_evaluator::do_apply(const pool_claimed_shares_migrate_operation& op)
{ try {
   staking_pool& d = db();

   const share_type old_claimed = d.get_pool().claimed_shares;
   d.modify( [&op]( pool_object& p ) {
      p.claimed_shares = op.claimed_shares;
   });

   wlog( "Claimed shares overwritten by ${a} from ${o} to ${n}, capacity is not enforced",
         ("a",op.account)("o",old_claimed)("n",op.claimed_shares) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // lotvault::chain
