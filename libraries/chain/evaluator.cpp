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
#include <lotvault/chain/evaluator.hpp>
#include <lotvault/chain/exceptions.hpp>
#include <lotvault/chain/staking_pool.hpp>

namespace lotvault { namespace chain {
   staking_pool& generic_evaluator::db()const { return *_pool; }

   operation_result generic_evaluator::start_evaluate( staking_pool& pool, const operation& op, bool apply )
   { try {
      _pool = &pool;
      params = pool.get_parameters();
      fees = pool.get_fee_policy();

      auto result = evaluate( op );

      if( apply ) result = this->apply( op );
      return result;
   } FC_CAPTURE_AND_RETHROW() }

   void generic_evaluator::verify_operator( const account_name_type& account )const
   {
      const account_name_type pool_operator = db().get_pool_operator();
      LOTVAULT_ASSERT( account == pool_operator, unauthorized,
                       "Account ${a} is not the operator of the pool", ("a",account)("operator",pool_operator) );
   }

   void generic_evaluator::verify_not_paused()const
   {
      LOTVAULT_ASSERT( !db().is_paused(), pool_paused, "The pool has been paused by its operator",
                       ("operator",db().get_pool_operator()) );
   }
} }
