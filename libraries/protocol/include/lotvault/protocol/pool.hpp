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

namespace lotvault { namespace protocol {

   /**
    * @brief Deposit native capital into the pool and receive shares
    * @ingroup operations
    *
    * The net amount, after the active fee policy, is minted to the depositor as shares.
    */
   struct pool_deposit_operation
   {
      account_name_type account;  ///< The account who deposits
      share_type        amount = 0;   ///< Gross native capital attached to the deposit

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Deposit native capital and stake the minted shares in the wrapped vault
    * @ingroup operations
    */
   struct pool_stake_deposit_operation
   {
      account_name_type account;  ///< The account who deposits and receives the wrapped shares
      share_type        amount = 0;   ///< Gross native capital attached to the deposit

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Burn shares and withdraw native capital from the pool
    * @ingroup operations
    */
   struct pool_withdraw_operation
   {
      account_name_type account;       ///< The account who burns its shares
      share_type        share_amount = 0;  ///< The amount of shares to burn

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Redeem wrapped shares from the wrapped vault, then withdraw the underlying shares
    * @ingroup operations
    */
   struct pool_unstake_withdraw_operation
   {
      account_name_type account;         ///< The owner of the wrapped shares, receives the native capital
      share_type        wrapped_amount = 0;  ///< The amount of wrapped vault shares to redeem

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Send native capital to the pool without minting shares
    * @ingroup operations
    *
    * This is how stake returned by exited validators comes back into custody.
    */
   struct pool_receive_operation
   {
      account_name_type account;
      share_type        amount = 0;

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Move pooled capital to the provisioning sink, one unit per credential set
    * @ingroup operations
    *
    * The three sequences are parallel, entry i of each describes unit i.
    */
   struct pool_provision_operation
   {
      account_name_type                   account;             ///< Must be the pool operator
      vector<validator_pubkey_type>       pubkeys;
      vector<validator_signature_type>    signatures;
      vector<deposit_data_root_type>      deposit_data_roots;

      uint32_t          unit_count()const { return static_cast<uint32_t>( pubkeys.size() ); }
      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Update pool parameters
    * @ingroup operations
    *
    * Only the fields which are set are changed.
    */
   struct pool_parameters_update_operation
   {
      account_name_type    account;                          ///< Must be the pool operator
      optional<uint32_t>   new_units_per_lot;
      optional<share_type> new_admin_fee;
      optional<share_type> new_buffer;
      optional<bool>       new_refund_fees_on_withdraw;

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Select the fee policy used by deposits and withdrawals
    * @ingroup operations
    *
    * The name refers to a policy registered with the pool. Leaving it unset disables fee processing.
    */
   struct pool_fee_policy_update_operation
   {
      account_name_type account;      ///< Must be the pool operator
      optional<string>  fee_policy;

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Withdraw accrued fees to the operator
    * @ingroup operations
    */
   struct pool_fee_withdraw_operation
   {
      account_name_type account;   ///< Must be the pool operator
      share_type        amount = 0;    ///< Zero means all of the accrued fee

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Set the withdrawal credentials handed to the provisioning sink
    * @ingroup operations
    */
   struct pool_withdrawal_credentials_update_operation
   {
      account_name_type           account;                 ///< Must be the pool operator
      withdrawal_credentials_type withdrawal_credentials;

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Pause or resume deposits, withdrawals and provisioning
    * @ingroup operations
    */
   struct pool_pause_operation
   {
      account_name_type account;   ///< Must be the pool operator
      bool              paused = true;

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Hand the operator role to another account
    * @ingroup operations
    */
   struct pool_operator_transfer_operation
   {
      account_name_type account;       ///< Must be the pool operator
      account_name_type new_operator;

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

   /**
    * @brief Overwrite the claimed shares total when porting state from a previous pool
    * @ingroup operations
    *
    * This operation bypasses the capacity check. It is not used by any accounting path.
    */
   struct pool_claimed_shares_migrate_operation
   {
      account_name_type account;         ///< Must be the pool operator
      share_type        claimed_shares = 0;  ///< The new claimed shares total

      account_name_type fee_payer()const { return account; }
      void              validate()const;
   };

} } // lotvault::protocol

FC_REFLECT( lotvault::protocol::pool_deposit_operation, (account)(amount) )
FC_REFLECT( lotvault::protocol::pool_stake_deposit_operation, (account)(amount) )
FC_REFLECT( lotvault::protocol::pool_withdraw_operation, (account)(share_amount) )
FC_REFLECT( lotvault::protocol::pool_unstake_withdraw_operation, (account)(wrapped_amount) )
FC_REFLECT( lotvault::protocol::pool_receive_operation, (account)(amount) )
FC_REFLECT( lotvault::protocol::pool_provision_operation,
            (account)(pubkeys)(signatures)(deposit_data_roots) )
FC_REFLECT( lotvault::protocol::pool_parameters_update_operation,
            (account)(new_units_per_lot)(new_admin_fee)(new_buffer)(new_refund_fees_on_withdraw) )
FC_REFLECT( lotvault::protocol::pool_fee_policy_update_operation, (account)(fee_policy) )
FC_REFLECT( lotvault::protocol::pool_fee_withdraw_operation, (account)(amount) )
FC_REFLECT( lotvault::protocol::pool_withdrawal_credentials_update_operation, (account)(withdrawal_credentials) )
FC_REFLECT( lotvault::protocol::pool_pause_operation, (account)(paused) )
FC_REFLECT( lotvault::protocol::pool_operator_transfer_operation, (account)(new_operator) )
FC_REFLECT( lotvault::protocol::pool_claimed_shares_migrate_operation, (account)(claimed_shares) )
