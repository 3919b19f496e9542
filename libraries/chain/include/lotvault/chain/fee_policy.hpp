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

#include <lotvault/protocol/types.hpp>

namespace lotvault { namespace chain {

   using namespace lotvault::protocol;

   /// Outcome of running a gross amount through a fee policy
   struct fee_result
   {
      share_type net_amount = 0;
      share_type fee = 0;
   };

   /**
    * @brief Pluggable fee calculation for deposits and withdrawals
    *
    * The pool trusts the returned net amount as is. It does not require net_amount + fee to add up
    * to the gross amount.
    */
   class fee_policy
   {
      public:
         virtual ~fee_policy(){}

         virtual fee_result process_deposit( const share_type& amount, const account_name_type& caller ) = 0;
         virtual fee_result process_withdraw( const share_type& amount, const account_name_type& caller ) = 0;
   };

   /**
    * @brief Charges a fixed percentage of the gross amount, rounded down
    */
   class percent_fee_policy : public fee_policy
   {
      public:
         percent_fee_policy( uint16_t deposit_fee_percent, uint16_t withdraw_fee_percent );

         fee_result process_deposit( const share_type& amount, const account_name_type& caller ) override;
         fee_result process_withdraw( const share_type& amount, const account_name_type& caller ) override;

      private:
         fee_result split( const share_type& amount, uint16_t percent )const;

         uint16_t _deposit_fee_percent;
         uint16_t _withdraw_fee_percent;
   };

   /**
    * @brief The fee policy slot of a pool, either disabled or bound to a policy
    *
    * A disabled handle passes amounts through unchanged with a zero fee.
    */
   class fee_policy_handle
   {
      public:
         fee_policy_handle() {}
         fee_policy_handle( string name, shared_ptr<fee_policy> policy );

         bool          enabled()const { return _policy != nullptr; }
         const string& name()const    { return _name; }

         fee_result process_deposit( const share_type& amount, const account_name_type& caller )const;
         fee_result process_withdraw( const share_type& amount, const account_name_type& caller )const;

      private:
         string                 _name;
         shared_ptr<fee_policy> _policy;
   };

} } // lotvault::chain

FC_REFLECT( lotvault::chain::fee_result, (net_amount)(fee) )
