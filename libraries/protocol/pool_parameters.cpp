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
#include <lotvault/protocol/pool_parameters.hpp>
#include <lotvault/protocol/fixed_point.hpp>

namespace lotvault { namespace protocol {

share_type pool_parameters::lot_unit_cost()const
{
   return checked_add( unit_size, admin_fee );
}

void pool_parameters::validate()const
{
   FC_ASSERT( unit_size > 0, "Unit size should be positive" );
   FC_ASSERT( units_per_lot > 0, "Units per lot should be positive" );
   // capacity limit and unit cost must be representable
   checked_mul( unit_size, units_per_lot );
   checked_add( checked_mul( unit_size, units_per_lot ), buffer );
   lot_unit_cost();
}

} } // lotvault::protocol
