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
#pragma once
#include <lotvault/chain/evaluator.hpp>

#include <lotvault/protocol/pool.hpp>

namespace lotvault { namespace chain {

   class pool_deposit_evaluator : public evaluator<pool_deposit_evaluator>
   {
      public:
         using operation_type = pool_deposit_operation;

         void_result do_evaluate( const pool_deposit_operation& op );
         pool_exchange_result do_apply( const pool_deposit_operation& op );

         fee_result _fee;
         share_type _new_claimed_shares = 0;
   };

   class pool_stake_deposit_evaluator : public evaluator<pool_stake_deposit_evaluator>
   {
      public:
         using operation_type = pool_stake_deposit_operation;

         void_result do_evaluate( const pool_stake_deposit_operation& op );
         pool_exchange_result do_apply( const pool_stake_deposit_operation& op );

         fee_result _fee;
         share_type _new_claimed_shares = 0;
         share_type _wrapped = 0;
   };

   class pool_withdraw_evaluator : public evaluator<pool_withdraw_evaluator>
   {
      public:
         using operation_type = pool_withdraw_operation;

         void_result do_evaluate( const pool_withdraw_operation& op );
         pool_exchange_result do_apply( const pool_withdraw_operation& op );

         fee_result _fee;
         share_type _new_accrued_fee = 0;
   };

   class pool_unstake_withdraw_evaluator : public evaluator<pool_unstake_withdraw_evaluator>
   {
      public:
         using operation_type = pool_unstake_withdraw_operation;

         void_result do_evaluate( const pool_unstake_withdraw_operation& op );
         pool_exchange_result do_apply( const pool_unstake_withdraw_operation& op );

         share_type _shares = 0;
         fee_result _fee;
         share_type _new_accrued_fee = 0;
   };

   class pool_receive_evaluator : public evaluator<pool_receive_evaluator>
   {
      public:
         using operation_type = pool_receive_operation;

         void_result do_evaluate( const pool_receive_operation& op );
         void_result do_apply( const pool_receive_operation& op );
   };

   class pool_claimed_shares_migrate_evaluator : public evaluator<pool_claimed_shares_migrate_evaluator>
   {
      public:
         using operation_type = pool_claimed_shares_migrate_operation;

         void_result do_evaluate( const pool_claimed_shares_migrate_operation& op );
         void_result do_apply( const pool_claimed_shares_migrate_operation& op );
   };

} } // lotvault::chain
