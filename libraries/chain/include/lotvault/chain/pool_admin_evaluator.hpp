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

   class pool_parameters_update_evaluator : public evaluator<pool_parameters_update_evaluator>
   {
      public:
         using operation_type = pool_parameters_update_operation;

         void_result do_evaluate( const pool_parameters_update_operation& op );
         void_result do_apply( const pool_parameters_update_operation& op );
   };

   class pool_fee_policy_update_evaluator : public evaluator<pool_fee_policy_update_evaluator>
   {
      public:
         using operation_type = pool_fee_policy_update_operation;

         void_result do_evaluate( const pool_fee_policy_update_operation& op );
         void_result do_apply( const pool_fee_policy_update_operation& op );
   };

   class pool_fee_withdraw_evaluator : public evaluator<pool_fee_withdraw_evaluator>
   {
      public:
         using operation_type = pool_fee_withdraw_operation;

         void_result do_evaluate( const pool_fee_withdraw_operation& op );
         pool_exchange_result do_apply( const pool_fee_withdraw_operation& op );

         share_type _amount = 0;
   };

   class pool_withdrawal_credentials_update_evaluator
      : public evaluator<pool_withdrawal_credentials_update_evaluator>
   {
      public:
         using operation_type = pool_withdrawal_credentials_update_operation;

         void_result do_evaluate( const pool_withdrawal_credentials_update_operation& op );
         void_result do_apply( const pool_withdrawal_credentials_update_operation& op );
   };

   class pool_pause_evaluator : public evaluator<pool_pause_evaluator>
   {
      public:
         using operation_type = pool_pause_operation;

         void_result do_evaluate( const pool_pause_operation& op );
         void_result do_apply( const pool_pause_operation& op );
   };

   class pool_operator_transfer_evaluator : public evaluator<pool_operator_transfer_evaluator>
   {
      public:
         using operation_type = pool_operator_transfer_operation;

         void_result do_evaluate( const pool_operator_transfer_operation& op );
         void_result do_apply( const pool_operator_transfer_operation& op );
   };

} } // lotvault::chain
