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
#include <lotvault/chain/parameter_store.hpp>

#include <lotvault/chain/exceptions.hpp>

namespace lotvault { namespace chain {

parameter_store::parameter_store( account_name_type pool_operator, pool_parameters params )
   : _operator( std::move(pool_operator) )
{
   FC_ASSERT( is_valid_account_name( _operator ), "Invalid operator account name ${a}", ("a",_operator) );
   update( params );
}

void parameter_store::update( const pool_parameters& params )
{
   try {
      params.validate();
   } catch( const fc::exception& e ) {
      FC_THROW_EXCEPTION( invalid_parameter, "Invalid pool parameters ${p}: ${e}",
                          ("p",params)("e",e.to_string()) );
   }
   _params = params;
}

void parameter_store::set_units_per_lot( uint32_t units_per_lot )
{
   LOTVAULT_ASSERT( units_per_lot > 0, invalid_parameter,
                    "Units per lot can not be zero, deposits would be blocked", ("n",units_per_lot) );
   pool_parameters params = _params;
   params.units_per_lot = units_per_lot;
   update( params );
}

void parameter_store::set_admin_fee( const share_type& admin_fee )
{
   pool_parameters params = _params;
   params.admin_fee = admin_fee;
   update( params );
}

void parameter_store::set_buffer( const share_type& buffer )
{
   pool_parameters params = _params;
   params.buffer = buffer;
   update( params );
}

void parameter_store::set_refund_fees_on_withdraw( bool refund )
{
   _params.refund_fees_on_withdraw = refund;
}

void parameter_store::set_fee_policy( const optional<string>& name )
{
   _fee_policy = name;
}

void parameter_store::set_withdrawal_credentials( const withdrawal_credentials_type& credentials )
{
   LOTVAULT_ASSERT( credentials.size() == LOTVAULT_WITHDRAWAL_CREDENTIALS_SIZE, invalid_parameter,
                    "Invalid withdrawal credentials size ${n}", ("n",credentials.size()) );
   _withdrawal_credentials = credentials;
}

void parameter_store::set_paused( bool paused )
{
   _paused = paused;
}

void parameter_store::set_pool_operator( const account_name_type& new_operator )
{
   LOTVAULT_ASSERT( is_valid_account_name( new_operator ), invalid_parameter,
                    "Invalid operator account name ${a}", ("a",new_operator) );
   _operator = new_operator;
}

} } // lotvault::chain
