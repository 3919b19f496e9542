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
#include <lotvault/chain/capacity.hpp>

#include <lotvault/protocol/fixed_point.hpp>

namespace lotvault { namespace chain {

share_type capacity_limit( const pool_parameters& params )
{
   return checked_mul( params.unit_size, params.units_per_lot );
}

share_type capacity_ceiling( const pool_parameters& params )
{
   return checked_add( capacity_limit( params ), params.buffer );
}

share_type remaining_capacity( const pool_object& pool, const pool_parameters& params )
{
   const share_type limit = capacity_limit( params );
   if( pool.claimed_shares >= limit )
      return 0;
   return limit - pool.claimed_shares;
}

share_type max_deposit_before_fee( const pool_object& pool, const pool_parameters& params )
{ try {
   const share_type remaining = remaining_capacity( pool, params );
   if( params.admin_fee == 0 )
      return remaining;

   const share_type fee_percent = div_scaled( params.admin_fee, params.lot_unit_cost() );
   return div_scaled( remaining, LOTVAULT_SCALE - fee_percent );
} FC_CAPTURE_AND_RETHROW( (pool)(params) ) }

} } // lotvault::chain
