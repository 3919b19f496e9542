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

#include <lotvault/chain/fee_policy.hpp>
#include <lotvault/protocol/operations.hpp>
#include <lotvault/protocol/pool_parameters.hpp>

namespace lotvault { namespace chain {

   using namespace lotvault::protocol;

   class staking_pool;

   class generic_evaluator
   {
   public:
      virtual ~generic_evaluator(){}

      virtual int get_type()const = 0;

      /**
       * Takes the parameter and fee policy snapshot used by the whole operation, then evaluates and, when @p apply
       * is set, applies the operation.
       */
      virtual operation_result start_evaluate( staking_pool& pool, const operation& op, bool apply );

      /**
       * @note derived classes should ASSUME that the default validation that is
       * indepenent of pool state has been performed by op.validate() and should
       * not perform these extra checks.
       */
      virtual operation_result evaluate( const operation& op ) = 0;
      virtual operation_result apply( const operation& op ) = 0;

      staking_pool& db()const;

   protected:
      /// Throws unauthorized unless @p account is the pool operator
      void verify_operator( const account_name_type& account )const;

      /// Throws pool_paused if the operator has paused the pool
      void verify_not_paused()const;

      pool_parameters   params;  ///< Parameter snapshot for this operation
      fee_policy_handle fees;    ///< Fee policy active when the operation started
      staking_pool*   _pool = nullptr;
   };

   class op_evaluator
   {
   public:
      virtual ~op_evaluator(){}
      virtual operation_result evaluate( staking_pool& pool, const operation& op, bool apply ) = 0;
   };

   template<typename T>
   class op_evaluator_impl : public op_evaluator
   {
   public:
      virtual operation_result evaluate( staking_pool& pool, const operation& op, bool apply = true ) override
      {
         T eval;
         return eval.start_evaluate( pool, op, apply );
      }
   };

   template<typename DerivedEvaluator>
   class evaluator : public generic_evaluator
   {
   public:
      virtual int get_type()const override { return operation::tag<typename DerivedEvaluator::operation_type>::value; }

      virtual operation_result evaluate( const operation& o ) final override
      {
         auto* eval = static_cast<DerivedEvaluator*>(this);
         const auto& op = o.get<typename DerivedEvaluator::operation_type>();

         return eval->do_evaluate( op );
      }

      virtual operation_result apply( const operation& o ) final override
      {
         auto* eval = static_cast<DerivedEvaluator*>(this);
         const auto& op = o.get<typename DerivedEvaluator::operation_type>();

         return eval->do_apply( op );
      }
   };
} }
