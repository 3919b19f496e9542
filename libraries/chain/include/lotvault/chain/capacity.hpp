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

#include <lotvault/chain/pool_object.hpp>
#include <lotvault/protocol/pool_parameters.hpp>

namespace lotvault { namespace chain {

   /// unit_size * units_per_lot
   share_type capacity_limit( const pool_parameters& params );

   /// The hard cap on claimed shares, capacity limit plus buffer
   share_type capacity_ceiling( const pool_parameters& params );

   /// Capacity left below the limit, zero if the claimed shares already reach into the buffer
   share_type remaining_capacity( const pool_object& pool, const pool_parameters& params );

   /**
    * @brief Gross deposit which would exactly fill the remaining capacity after the admin fee
    *
    * Assumes the fee is the flat percentage admin_fee / lot_unit_cost, so it is only an estimate when
    * the active fee policy is not linear. Deposits are checked against their actual net amount.
    */
   share_type max_deposit_before_fee( const pool_object& pool, const pool_parameters& params );

} } // lotvault::chain
