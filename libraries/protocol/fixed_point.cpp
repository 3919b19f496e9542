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
#include <lotvault/protocol/fixed_point.hpp>
#include <lotvault/protocol/exceptions.hpp>

namespace lotvault { namespace protocol {

static const share_type max_share = ~share_type( 0 );

share_type checked_add( const share_type& a, const share_type& b )
{
   LOTVAULT_ASSERT( a <= max_share - b, arithmetic_overflow,
                    "Overflow adding ${a} and ${b}", ("a",a)("b",b) );
   return a + b;
}

share_type checked_sub( const share_type& a, const share_type& b )
{
   LOTVAULT_ASSERT( a >= b, arithmetic_overflow,
                    "Underflow subtracting ${b} from ${a}", ("a",a)("b",b) );
   return a - b;
}

share_type checked_mul( const share_type& a, const share_type& b )
{
   LOTVAULT_ASSERT( a == 0 || b <= max_share / a, arithmetic_overflow,
                    "Overflow multiplying ${a} by ${b}", ("a",a)("b",b) );
   return a * b;
}

share_type mul_scaled( const share_type& a, const share_type& b )
{
   return checked_mul( a, b ) / LOTVAULT_SCALE;
}

share_type div_scaled( const share_type& a, const share_type& b )
{
   LOTVAULT_ASSERT( b != 0, divide_by_zero, "Dividing ${a} by zero", ("a",a) );
   return checked_mul( a, LOTVAULT_SCALE ) / b;
}

string to_decimal_string( const share_type& amount )
{
   share_type whole = amount / LOTVAULT_SCALE;
   share_type fraction = amount % LOTVAULT_SCALE;

   string result;
   do
   {
      result.insert( result.begin(), char( '0' + static_cast<int>( whole % 10 ) ) );
      whole /= 10;
   } while( whole > 0 );

   if( fraction == 0 )
      return result;

   string digits( LOTVAULT_SCALE_DIGITS, '0' );
   for( int i = LOTVAULT_SCALE_DIGITS - 1; i >= 0; --i )
   {
      digits[i] = char( '0' + static_cast<int>( fraction % 10 ) );
      fraction /= 10;
   }
   digits.erase( digits.find_last_not_of( '0' ) + 1 );
   return result + "." + digits;
}

} } // lotvault::protocol
