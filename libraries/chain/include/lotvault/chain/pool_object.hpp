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
 *  @brief The accounting state of a staking pool
 *  @ingroup object
 *
 *  There is exactly one of these per staking_pool. It is only changed through staking_pool::modify()
 *  by the evaluators.
 */
class pool_object
{
   public:
      share_type  claimed_shares = 0;    ///< Pooled capital backing the outstanding minted shares
      share_type  accrued_fee = 0;       ///< Fee collected and not yet withdrawn by the operator
      uint64_t    lots_provisioned = 0;  ///< Units moved to the provisioning sink so far
      share_type  native_balance = 0;    ///< Native capital in the custody of the pool
};

} } // lotvault::chain

FC_REFLECT( lotvault::chain::pool_object,
            (claimed_shares)
            (accrued_fee)
            (lots_provisioned)
            (native_balance)
          )
