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
#include <lotvault/chain/local_collaborators.hpp>

#include <lotvault/chain/exceptions.hpp>
#include <lotvault/protocol/fixed_point.hpp>

#include <fc/log/logger.hpp>

namespace lotvault { namespace chain {

void local_share_token::mint( const account_name_type& to, const share_type& amount )
{
   _supply = checked_add( _supply, amount );
   _balances[to] += amount;
}

void local_share_token::burn( const account_name_type& from, const share_type& amount )
{
   const share_type balance = balance_of( from );
   LOTVAULT_ASSERT( balance >= amount, insufficient_balance,
                    "Account ${a} holds ${b} shares, unable to burn ${n}",
                    ("a",from)("b",balance)("n",amount) );
   _balances[from] -= amount;
   _supply -= amount;
   if( _balances[from] == 0 )
      _balances.erase( from );
}

void local_share_token::transfer( const account_name_type& from, const account_name_type& to,
                                  const share_type& amount )
{
   const share_type balance = balance_of( from );
   LOTVAULT_ASSERT( balance >= amount, insufficient_balance,
                    "Account ${a} holds ${b} shares, unable to transfer ${n}",
                    ("a",from)("b",balance)("n",amount) );
   _balances[from] -= amount;
   _balances[to] += amount;
   if( _balances[from] == 0 )
      _balances.erase( from );
}

share_type local_share_token::balance_of( const account_name_type& account )const
{
   auto itr = _balances.find( account );
   return itr == _balances.end() ? share_type(0) : itr->second;
}

local_wrapped_vault::local_wrapped_vault( share_token& token, account_name_type vault_account )
   : _token( token ), _vault_account( std::move(vault_account) )
{
   FC_ASSERT( is_valid_account_name( _vault_account ), "Invalid vault account name ${a}", ("a",_vault_account) );
}

share_type local_wrapped_vault::total_assets()const
{
   return _token.balance_of( _vault_account );
}

share_type local_wrapped_vault::balance_of( const account_name_type& account )const
{
   auto itr = _balances.find( account );
   return itr == _balances.end() ? share_type(0) : itr->second;
}

share_type local_wrapped_vault::deposit( const share_type& amount, const account_name_type& on_behalf_of )
{ try {
   const share_type issued = preview_deposit( amount );
   FC_ASSERT( issued > 0, "Aborting due to zero outcome" );

   _token.transfer( LOTVAULT_POOL_ACCOUNT, _vault_account, amount );
   _balances[on_behalf_of] += issued;
   _supply += issued;
   return issued;
} FC_CAPTURE_AND_RETHROW( (amount)(on_behalf_of) ) }

share_type local_wrapped_vault::preview_deposit( const share_type& amount )const
{
   const share_type assets = total_assets();
   if( _supply == 0 || assets == 0 )
      return amount;
   return checked_mul( amount, _supply ) / assets; // round down
}

share_type local_wrapped_vault::preview_redeem( const share_type& amount )const
{
   if( _supply == 0 )
      return 0;
   return checked_mul( amount, total_assets() ) / _supply; // round down
}

share_type local_wrapped_vault::redeem( const share_type& amount, const account_name_type& receiver,
                                        const account_name_type& owner )
{ try {
   const share_type balance = balance_of( owner );
   LOTVAULT_ASSERT( balance >= amount, insufficient_balance,
                    "Account ${a} holds ${b} wrapped shares, unable to redeem ${n}",
                    ("a",owner)("b",balance)("n",amount) );

   const share_type returned = preview_redeem( amount );
   FC_ASSERT( returned > 0, "Aborting due to zero outcome" );

   _balances[owner] -= amount;
   if( _balances[owner] == 0 )
      _balances.erase( owner );
   _supply -= amount;
   _token.transfer( _vault_account, receiver, returned );
   return returned;
} FC_CAPTURE_AND_RETHROW( (amount)(receiver)(owner) ) }

void local_provisioning_sink::provision( const validator_pubkey_type& pubkey,
                                         const withdrawal_credentials_type& withdrawal_credentials,
                                         const validator_signature_type& signature,
                                         const deposit_data_root_type& deposit_data_root,
                                         const share_type& amount )
{
   provisioned_unit unit;
   unit.pubkey = pubkey;
   unit.withdrawal_credentials = withdrawal_credentials;
   unit.signature = signature;
   unit.deposit_data_root = deposit_data_root;
   unit.amount = amount;
   _units.push_back( std::move(unit) );
   _total = checked_add( _total, amount );
   dlog( "Provisioned unit ${n} with root ${r}", ("n",_units.size())("r",deposit_data_root) );
}

} } // lotvault::chain
