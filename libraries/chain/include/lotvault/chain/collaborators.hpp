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

   /**
    * @brief The fungible share token issued by a pool
    *
    * The pool is the only account allowed to mint and burn. Implementations throw if a burn or
    * transfer exceeds the holder's balance.
    */
   class share_token
   {
      public:
         virtual ~share_token(){}

         virtual void       mint( const account_name_type& to, const share_type& amount ) = 0;
         virtual void       burn( const account_name_type& from, const share_type& amount ) = 0;
         virtual void       transfer( const account_name_type& from, const account_name_type& to,
                                      const share_type& amount ) = 0;
         virtual share_type balance_of( const account_name_type& account )const = 0;
         virtual share_type total_supply()const = 0;
   };

   /**
    * @brief An auto-compounding vault which wraps pool shares
    */
   class wrapped_share_vault
   {
      public:
         virtual ~wrapped_share_vault(){}

         /// Takes @p amount shares from the pool account and issues wrapped shares to @p on_behalf_of
         /// @return wrapped shares issued
         virtual share_type deposit( const share_type& amount, const account_name_type& on_behalf_of ) = 0;

         /// Burns @p amount wrapped shares of @p owner and sends the underlying shares to @p receiver
         /// @return shares returned
         virtual share_type redeem( const share_type& amount, const account_name_type& receiver,
                                    const account_name_type& owner ) = 0;

         /// Wrapped shares deposit() would issue for @p amount shares at the current exchange rate
         virtual share_type preview_deposit( const share_type& amount )const = 0;

         /// Shares redeem() would return for @p amount wrapped shares at the current exchange rate
         virtual share_type preview_redeem( const share_type& amount )const = 0;

         /// Wrapped shares held by @p account
         virtual share_type balance_of( const account_name_type& account )const = 0;
   };

   /**
    * @brief Irreversible destination of provisioned capital, called once per unit
    *
    * A batch is provisioned by consecutive calls. An implementation must reject a batch before its
    * first unit moves, a failure part way through leaves the earlier units provisioned.
    */
   class provisioning_sink
   {
      public:
         virtual ~provisioning_sink(){}

         virtual void provision( const validator_pubkey_type& pubkey,
                                 const withdrawal_credentials_type& withdrawal_credentials,
                                 const validator_signature_type& signature,
                                 const deposit_data_root_type& deposit_data_root,
                                 const share_type& amount ) = 0;
   };

} } // lotvault::chain
