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

#include <lotvault/chain/exceptions.hpp>

#include <atomic>

namespace lotvault { namespace chain {

   /**
    * @brief Rejects a state changing call while another one is running on the same pool
    *
    * Unlike a mutex this never blocks: a nested attempt, for example from a collaborator calling back
    * into the pool, fails immediately with reentrancy_rejected.
    */
   class reentrancy_guard
   {
      public:
         class scope
         {
            public:
               scope( scope&& mv ) : _guard( mv._guard ), _held( mv._held ) { mv._held = false; }
               ~scope() { if( _held ) _guard._entered.store( false ); }

               scope( const scope& ) = delete;
               scope& operator=( const scope& ) = delete;
               scope& operator=( scope&& ) = delete;

            private:
               friend class reentrancy_guard;
               explicit scope( reentrancy_guard& g ) : _guard( g ) {}

               reentrancy_guard& _guard;
               bool              _held = true;
         };

         scope enter()
         {
            bool expected = false;
            if( !_entered.compare_exchange_strong( expected, true ) )
               FC_THROW_EXCEPTION( reentrancy_rejected,
                                   "Another state changing operation is in progress on this pool" );
            return scope( *this );
         }

         bool entered()const { return _entered.load(); }

      private:
         std::atomic<bool> _entered{ false };
   };

} } // lotvault::chain
