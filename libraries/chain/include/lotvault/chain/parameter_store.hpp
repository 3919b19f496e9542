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

#include <lotvault/protocol/pool_parameters.hpp>

namespace lotvault { namespace chain {

   using namespace lotvault::protocol;

   /**
    * @brief Operator controlled settings of a staking pool
    *
    * Authorization is checked by the evaluators before any setter is called. The setters only
    * enforce that the resulting parameters are usable.
    */
   class parameter_store
   {
      public:
         parameter_store( account_name_type pool_operator, pool_parameters params = pool_parameters() );

         /// A copy of the current parameters, to be kept for the duration of one operation
         pool_parameters snapshot()const { return _params; }

         const account_name_type&           pool_operator()const { return _operator; }
         bool                               paused()const { return _paused; }
         const optional<string>&            fee_policy()const { return _fee_policy; }
         const withdrawal_credentials_type& withdrawal_credentials()const { return _withdrawal_credentials; }

         void set_units_per_lot( uint32_t units_per_lot );
         void set_admin_fee( const share_type& admin_fee );
         void set_buffer( const share_type& buffer );
         void set_refund_fees_on_withdraw( bool refund );
         void set_fee_policy( const optional<string>& name );
         void set_withdrawal_credentials( const withdrawal_credentials_type& credentials );
         void set_paused( bool paused );
         void set_pool_operator( const account_name_type& new_operator );

      private:
         void update( const pool_parameters& params );

         pool_parameters             _params;
         account_name_type           _operator;
         bool                        _paused = false;
         optional<string>            _fee_policy;
         withdrawal_credentials_type _withdrawal_credentials;
   };

} } // lotvault::chain
