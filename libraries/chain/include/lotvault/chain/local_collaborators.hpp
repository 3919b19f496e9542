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

#include <lotvault/chain/collaborators.hpp>

namespace lotvault { namespace chain {

   /**
    * @brief In-process share token keeping balances in memory
    */
   class local_share_token : public share_token
   {
      public:
         void       mint( const account_name_type& to, const share_type& amount ) override;
         void       burn( const account_name_type& from, const share_type& amount ) override;
         void       transfer( const account_name_type& from, const account_name_type& to,
                              const share_type& amount ) override;
         share_type balance_of( const account_name_type& account )const override;
         share_type total_supply()const override { return _supply; }

      private:
         flat_map<account_name_type, share_type> _balances;
         share_type                              _supply = 0;
   };

   /**
    * @brief In-process wrapped vault
    *
    * Shares held by the vault account back the wrapped supply. Shares sent to the vault account from
    * elsewhere raise the value of every wrapped share.
    */
   class local_wrapped_vault : public wrapped_share_vault
   {
      public:
         local_wrapped_vault( share_token& token, account_name_type vault_account = "lotvault.wrapped" );

         share_type deposit( const share_type& amount, const account_name_type& on_behalf_of ) override;
         share_type redeem( const share_type& amount, const account_name_type& receiver,
                            const account_name_type& owner ) override;
         share_type preview_deposit( const share_type& amount )const override;
         share_type preview_redeem( const share_type& amount )const override;
         share_type balance_of( const account_name_type& account )const override;

         share_type               total_supply()const { return _supply; }
         share_type               total_assets()const;
         const account_name_type& vault_account()const { return _vault_account; }

      private:
         share_token&                            _token;
         account_name_type                       _vault_account;
         flat_map<account_name_type, share_type> _balances;
         share_type                              _supply = 0;
   };

   /**
    * @brief Provisioning sink which records every unit it receives
    */
   class local_provisioning_sink : public provisioning_sink
   {
      public:
         struct provisioned_unit
         {
            validator_pubkey_type       pubkey;
            withdrawal_credentials_type withdrawal_credentials;
            validator_signature_type    signature;
            deposit_data_root_type      deposit_data_root;
            share_type                  amount = 0;
         };

         void provision( const validator_pubkey_type& pubkey,
                         const withdrawal_credentials_type& withdrawal_credentials,
                         const validator_signature_type& signature,
                         const deposit_data_root_type& deposit_data_root,
                         const share_type& amount ) override;

         const vector<provisioned_unit>& units()const { return _units; }
         share_type                      total_provisioned()const { return _total; }

      private:
         vector<provisioned_unit> _units;
         share_type               _total = 0;
   };

} } // lotvault::chain

FC_REFLECT( lotvault::chain::local_provisioning_sink::provisioned_unit,
            (pubkey)(withdrawal_credentials)(signature)(deposit_data_root)(amount) )
