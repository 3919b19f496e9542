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
#include <lotvault/chain/evaluator.hpp>
#include <lotvault/chain/fee_policy.hpp>
#include <lotvault/chain/parameter_store.hpp>
#include <lotvault/chain/pool_object.hpp>
#include <lotvault/chain/reentrancy_guard.hpp>

#include <mutex>

namespace lotvault { namespace chain {

   /**
    *   @class staking_pool
    *   @brief tracks the pooled capital of one staking vault and applies operations to it
    *
    *   The pool owns its pool_object and parameter_store. The share token, the wrapped vault and the
    *   provisioning sink are owned by the caller and must outlive the pool.
    *
    *   Every state changing call goes through push_operation(), which holds the re-entrancy guard for
    *   its whole duration and undoes all changes to the pool_object and parameter_store if the
    *   operation fails. Effects already made on the collaborators are not undone, which is why the
    *   evaluators call them only after every check has passed.
    */
   class staking_pool
   {
      public:
         staking_pool( account_name_type pool_operator,
                       pool_parameters params,
                       share_token& token,
                       wrapped_share_vault& vault,
                       provisioning_sink& sink );
         ~staking_pool();

         /**
          *  Validates and applies @p op, all or nothing.
          *
          *  @throws reentrancy_rejected if called while another operation is being applied
          */
         operation_result push_operation( const operation& op );

         /**
          *  Makes @p policy selectable by name through pool_fee_policy_update_operation. Registering
          *  a name twice replaces the policy, which takes effect immediately if it is the active one.
          */
         void register_fee_policy( const string& name, shared_ptr<fee_policy> policy );
         bool has_fee_policy( const string& name )const;

         /// The policy named by the parameter store, or a disabled handle when none is selected
         fee_policy_handle get_fee_policy()const;

         /**
          * @{
          * @group Queries
          * Safe to call from any thread. Each returns a consistent copy.
          */
         pool_object       get_pool()const;
         pool_parameters   get_parameters()const;
         account_name_type get_pool_operator()const;
         bool              is_paused()const;
         optional<string>  get_fee_policy_name()const;
         withdrawal_credentials_type get_withdrawal_credentials()const;

         share_type get_capacity_limit()const;
         share_type get_remaining_capacity()const;
         share_type get_max_deposit_before_fee()const;
         ///@}

         share_token&         get_share_token()         { return _token; }
         wrapped_share_vault& get_wrapped_vault()       { return _vault; }
         provisioning_sink&   get_provisioning_sink()   { return _sink; }

         /// Applies @p m to the pool object as one atomic change
         template<typename Lambda>
         void modify( Lambda&& m )
         {
            std::lock_guard<std::mutex> lock( _state_mutex );
            m( _pool );
         }

         /// Applies @p m to the parameter store as one atomic change
         template<typename Lambda>
         void modify_parameters( Lambda&& m )
         {
            std::lock_guard<std::mutex> lock( _state_mutex );
            m( _parameters );
         }

         /**
          *  Restores the pool object and the parameter store to their values at the start of the session unless
          *  committed.
          */
         class undo_session
         {
            public:
               undo_session( undo_session&& mv )
               :_pool(mv._pool),_saved_pool(mv._saved_pool),_saved_parameters(mv._saved_parameters),
                _apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~undo_session() { undo(); }

               void commit() { _apply_undo = false; }
               void undo();

            private:
               friend class staking_pool;
               undo_session( staking_pool& pool, pool_object saved_pool, parameter_store saved_parameters )
               :_pool(pool),_saved_pool(std::move(saved_pool)),_saved_parameters(std::move(saved_parameters)){}

               staking_pool&   _pool;
               pool_object     _saved_pool;
               parameter_store _saved_parameters;
               bool            _apply_undo = true;
         };

         undo_session start_undo_session();

      private:
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

         operation_result apply_operation( const operation& op );

         vector< unique_ptr<op_evaluator> > _operation_evaluators;

         mutable std::mutex                          _state_mutex;
         pool_object                                 _pool;
         parameter_store                             _parameters;
         flat_map<string, shared_ptr<fee_policy>>    _fee_policies;

         reentrancy_guard                            _reentrancy_guard;

         share_token&                                _token;
         wrapped_share_vault&                        _vault;
         provisioning_sink&                          _sink;
   };

} } // lotvault::chain
