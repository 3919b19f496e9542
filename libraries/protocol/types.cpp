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
#include <lotvault/protocol/types.hpp>

namespace lotvault { namespace protocol {

/**
 * Account names are dot separated segments. Each segment
 *
 * - is at least 3 characters long
 * - starts with a lowercase letter
 * - ends with a lowercase letter or a digit
 * - otherwise only contains lowercase letters, digits and dashes
 */
bool is_valid_account_name( const string& name )
{
   const size_t len = name.size();
   if( len < LOTVAULT_MIN_ACCOUNT_NAME_LENGTH || len > LOTVAULT_MAX_ACCOUNT_NAME_LENGTH )
      return false;

   auto is_lower = []( char c ) { return c >= 'a' && c <= 'z'; };
   auto is_digit = []( char c ) { return c >= '0' && c <= '9'; };

   size_t begin = 0;
   while( true )
   {
      size_t end = name.find_first_of( '.', begin );
      if( end == string::npos )
         end = len;
      if( end - begin < LOTVAULT_MIN_ACCOUNT_NAME_LENGTH )
         return false;
      if( !is_lower( name[begin] ) )
         return false;
      if( !is_lower( name[end-1] ) && !is_digit( name[end-1] ) )
         return false;
      for( size_t i = begin + 1; i < end - 1; ++i )
      {
         const char c = name[i];
         if( !is_lower( c ) && !is_digit( c ) && c != '-' )
            return false;
      }
      if( end == len )
         break;
      begin = end + 1;
   }
   return true;
}

} } // lotvault::protocol
