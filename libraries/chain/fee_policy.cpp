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
#include <lotvault/chain/fee_policy.hpp>

#include <lotvault/protocol/fixed_point.hpp>

namespace lotvault { namespace chain {

percent_fee_policy::percent_fee_policy( uint16_t deposit_fee_percent, uint16_t withdraw_fee_percent )
   : _deposit_fee_percent( deposit_fee_percent ), _withdraw_fee_percent( withdraw_fee_percent )
{
   FC_ASSERT( deposit_fee_percent <= LOTVAULT_100_PERCENT, "Deposit fee percent should not exceed 100%" );
   FC_ASSERT( withdraw_fee_percent <= LOTVAULT_100_PERCENT, "Withdraw fee percent should not exceed 100%" );
}

fee_result percent_fee_policy::split( const share_type& amount, uint16_t percent )const
{
   fee_result result;
   result.fee = checked_mul( amount, percent ) / LOTVAULT_100_PERCENT;
   result.net_amount = amount - result.fee;
   return result;
}

fee_result percent_fee_policy::process_deposit( const share_type& amount, const account_name_type& )
{
   return split( amount, _deposit_fee_percent );
}

fee_result percent_fee_policy::process_withdraw( const share_type& amount, const account_name_type& )
{
   return split( amount, _withdraw_fee_percent );
}

fee_policy_handle::fee_policy_handle( string name, shared_ptr<fee_policy> policy )
   : _name( std::move(name) ), _policy( std::move(policy) )
{
   FC_ASSERT( _policy != nullptr, "A named fee policy handle needs a policy" );
}

fee_result fee_policy_handle::process_deposit( const share_type& amount, const account_name_type& caller )const
{
   if( !enabled() )
      return fee_result{ amount, 0 };
   return _policy->process_deposit( amount, caller );
}

fee_result fee_policy_handle::process_withdraw( const share_type& amount, const account_name_type& caller )const
{
   if( !enabled() )
      return fee_result{ amount, 0 };
   return _policy->process_withdraw( amount, caller );
}

} } // lotvault::chain
