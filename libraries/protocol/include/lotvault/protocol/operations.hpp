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

#include <lotvault/protocol/pool.hpp>

namespace lotvault { namespace protocol {

   struct void_result{};

   /**
    * @brief What an account gave to and got from the pool in one operation
    *
    * Units depend on the operation: a deposit pays native capital and receives shares, a withdrawal
    * pays shares and receives native capital, a stake deposit receives wrapped vault shares.
    */
   struct pool_exchange_result
   {
      share_type paid = 0;
      share_type received = 0;
      share_type fee = 0;
   };

   typedef fc::static_variant<
            void_result,
            pool_exchange_result
         > operation_result;

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            /*  0 */ pool_deposit_operation,
            /*  1 */ pool_stake_deposit_operation,
            /*  2 */ pool_withdraw_operation,
            /*  3 */ pool_unstake_withdraw_operation,
            /*  4 */ pool_receive_operation,
            /*  5 */ pool_provision_operation,
            /*  6 */ pool_parameters_update_operation,
            /*  7 */ pool_fee_policy_update_operation,
            /*  8 */ pool_fee_withdraw_operation,
            /*  9 */ pool_withdrawal_credentials_update_operation,
            /* 10 */ pool_pause_operation,
            /* 11 */ pool_operator_transfer_operation,
            /* 12 */ pool_claimed_shares_migrate_operation
         > operation;

   /// Runs the stateless checks of any operation
   void operation_validate( const operation& op );

} } // lotvault::protocol

FC_REFLECT( lotvault::protocol::void_result, )
FC_REFLECT( lotvault::protocol::pool_exchange_result, (paid)(received)(fee) )

FC_REFLECT_TYPENAME( lotvault::protocol::operation )
FC_REFLECT_TYPENAME( lotvault::protocol::operation_result )
