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
#include <lotvault/protocol/pool.hpp>

namespace lotvault { namespace protocol {

void pool_deposit_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
   FC_ASSERT( amount > 0, "Deposit amount should be positive" );
}

void pool_stake_deposit_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
   FC_ASSERT( account != LOTVAULT_POOL_ACCOUNT, "The pool can not stake on its own behalf" );
   FC_ASSERT( amount > 0, "Deposit amount should be positive" );
}

void pool_withdraw_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
   FC_ASSERT( share_amount > 0, "Amount of shares should be positive" );
}

void pool_unstake_withdraw_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
   FC_ASSERT( account != LOTVAULT_POOL_ACCOUNT, "The pool can not unstake on its own behalf" );
   FC_ASSERT( wrapped_amount > 0, "Amount of wrapped shares should be positive" );
}

void pool_receive_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
   FC_ASSERT( amount > 0, "Amount should be positive" );
}

void pool_provision_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
   FC_ASSERT( !pubkeys.empty(), "Nothing to provision" );
   FC_ASSERT( pubkeys.size() == signatures.size() && pubkeys.size() == deposit_data_roots.size(),
              "Provisioning credentials should be of equal length, got ${p} keys, ${s} signatures and ${r} roots",
              ("p",pubkeys.size())("s",signatures.size())("r",deposit_data_roots.size()) );
   for( const auto& key : pubkeys )
      FC_ASSERT( key.size() == LOTVAULT_VALIDATOR_PUBKEY_SIZE, "Invalid validator public key size ${n}",
                 ("n",key.size()) );
   for( const auto& sig : signatures )
      FC_ASSERT( sig.size() == LOTVAULT_VALIDATOR_SIGNATURE_SIZE, "Invalid validator signature size ${n}",
                 ("n",sig.size()) );
}

void pool_parameters_update_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
   FC_ASSERT( new_units_per_lot.valid() || new_admin_fee.valid() || new_buffer.valid()
              || new_refund_fees_on_withdraw.valid(),
              "Should change something" );
}

void pool_fee_policy_update_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
   if( fee_policy.valid() )
      FC_ASSERT( !fee_policy->empty(), "Fee policy name should not be empty" );
}

void pool_fee_withdraw_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
}

void pool_withdrawal_credentials_update_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
   FC_ASSERT( withdrawal_credentials.size() == LOTVAULT_WITHDRAWAL_CREDENTIALS_SIZE,
              "Invalid withdrawal credentials size ${n}", ("n",withdrawal_credentials.size()) );
}

void pool_pause_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
}

void pool_operator_transfer_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
   FC_ASSERT( is_valid_account_name( new_operator ), "Invalid account name ${a}", ("a",new_operator) );
   FC_ASSERT( new_operator != account, "New operator should differ from the current one" );
   FC_ASSERT( new_operator != LOTVAULT_POOL_ACCOUNT, "The pool account can not be the operator" );
}

void pool_claimed_shares_migrate_operation::validate()const
{
   FC_ASSERT( is_valid_account_name( account ), "Invalid account name ${a}", ("a",account) );
}

} } // lotvault::protocol
