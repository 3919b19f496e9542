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

#include <fc/exception/exception.hpp>
#include <lotvault/protocol/exceptions.hpp>

namespace lotvault { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception, chain_exception, 3040000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3050000 )

   FC_DECLARE_DERIVED_EXCEPTION( capacity_exceeded,            operation_evaluate_exception, 3050001 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,         operation_evaluate_exception, 3050002 )
   FC_DECLARE_DERIVED_EXCEPTION( invariant_violation,          operation_evaluate_exception, 3050003 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_parameter,            operation_evaluate_exception, 3050004 )
   FC_DECLARE_DERIVED_EXCEPTION( reentrancy_rejected,          operation_evaluate_exception, 3050005 )
   FC_DECLARE_DERIVED_EXCEPTION( unauthorized,                 operation_evaluate_exception, 3050006 )
   FC_DECLARE_DERIVED_EXCEPTION( pool_paused,                  operation_evaluate_exception, 3050007 )

} } // lotvault::chain
