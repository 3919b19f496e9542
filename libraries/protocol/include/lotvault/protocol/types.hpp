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

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <fc/container/flat.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/static_variant.hpp>
#include <fc/uint128.hpp>

#include <lotvault/protocol/config.hpp>

namespace lotvault { namespace protocol {

using std::map;
using std::vector;
using std::string;
using std::shared_ptr;
using std::unique_ptr;
using std::pair;

using fc::variant;
using fc::optional;
using fc::flat_map;
using fc::flat_set;
using fc::static_variant;

struct void_t{};

/// A fixed point amount of native capital or shares, scaled by LOTVAULT_SCALE
using share_type = fc::uint128_t;

using account_name_type         = string;
using validator_pubkey_type     = vector<char>;
using validator_signature_type  = vector<char>;
using withdrawal_credentials_type = vector<char>;
using deposit_data_root_type    = fc::sha256;

bool is_valid_account_name( const string& name );

} } // lotvault::protocol

FC_REFLECT( lotvault::protocol::void_t, )
