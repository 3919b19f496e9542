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
    * @defgroup fixed_point Fixed point arithmetic
    *
    * Amounts are unsigned integers scaled by LOTVAULT_SCALE. Every operation truncates toward zero, so
    * the rounding dust always stays with the pool. Intermediate results that do not fit in 128 bits
    * throw arithmetic_overflow, they are never saturated.
    */
   ///@{

   /// @return a * b / LOTVAULT_SCALE
   share_type mul_scaled( const share_type& a, const share_type& b );

   /// @return a * LOTVAULT_SCALE / b, throws divide_by_zero if b is zero
   share_type div_scaled( const share_type& a, const share_type& b );

   /// Checked helpers for unscaled amounts
   share_type checked_add( const share_type& a, const share_type& b );
   share_type checked_sub( const share_type& a, const share_type& b );
   share_type checked_mul( const share_type& a, const share_type& b );

   /// @return the amount as a decimal string with LOTVAULT_SCALE_DIGITS fraction digits, trailing zeros trimmed
   string to_decimal_string( const share_type& amount );

   ///@}

} } // lotvault::protocol
