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

#define LOTVAULT_SYMBOL "LVS"

/** All amounts are fixed point numbers with this denominator */
#define LOTVAULT_SCALE_DIGITS                     18
#define LOTVAULT_SCALE                            fc::uint128_t( 1000000000000000000ull )

#define LOTVAULT_DEFAULT_UNIT_SIZE                ( LOTVAULT_SCALE * 32 ) ///< capital provisioned per unit
#define LOTVAULT_DEFAULT_UNITS_PER_LOT            1
#define LOTVAULT_DEFAULT_ADMIN_FEE                0
#define LOTVAULT_DEFAULT_BUFFER                   ( LOTVAULT_SCALE / 100 )
#define LOTVAULT_DEFAULT_REFUND_FEES_ON_WITHDRAW  true

/** percentage fields are fixed point with a denominator of 10,000 */
#define LOTVAULT_100_PERCENT                      10000
#define LOTVAULT_1_PERCENT                        (LOTVAULT_100_PERCENT/100)

#define LOTVAULT_MIN_ACCOUNT_NAME_LENGTH          3
#define LOTVAULT_MAX_ACCOUNT_NAME_LENGTH          63

/** sizes of the per unit provisioning credentials, in bytes */
#define LOTVAULT_VALIDATOR_PUBKEY_SIZE            48
#define LOTVAULT_VALIDATOR_SIGNATURE_SIZE         96
#define LOTVAULT_WITHDRAWAL_CREDENTIALS_SIZE      32

#define LOTVAULT_MAX_NESTED_OBJECTS               (200)

/** account which holds shares on behalf of the pool itself while they move to or from the wrapped vault */
#define LOTVAULT_POOL_ACCOUNT                     "lotvault.pool"
