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
    * @brief Operator controlled parameters of a staking pool
    *
    * Every operation evaluated by the pool reads a copy of these parameters taken when the operation
    * starts, so a change can only affect operations pushed after it.
    */
   struct pool_parameters
   {
      share_type  unit_size               = LOTVAULT_DEFAULT_UNIT_SIZE;   ///< capital provisioned per unit
      uint32_t    units_per_lot           = LOTVAULT_DEFAULT_UNITS_PER_LOT; ///< units one provisioning batch may create
      share_type  admin_fee               = LOTVAULT_DEFAULT_ADMIN_FEE;   ///< flat fee per unit
      share_type  buffer                  = LOTVAULT_DEFAULT_BUFFER;      ///< tolerance above the capacity limit
      bool        refund_fees_on_withdraw = LOTVAULT_DEFAULT_REFUND_FEES_ON_WITHDRAW;

      /// Cost of one unit including the admin fee
      share_type lot_unit_cost()const;

      void validate()const;
   };

} } // lotvault::protocol

FC_REFLECT( lotvault::protocol::pool_parameters,
            (unit_size)
            (units_per_lot)
            (admin_fee)
            (buffer)
            (refund_fees_on_withdraw)
          )
