/*
 * Copyright (c) 2023 Michel Santos and contributors.
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

#include <fc/container/flat.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/time.hpp>
#include <fc/variant.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <nftcore/protocol/config.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace nftcore {
   namespace protocol {
      using std::string;
      using std::vector;
      using fc::optional;
      using boost::container::flat_map;
      using boost::container::flat_set;

      /// Unsigned 256-bit integer used for token identifiers, prices and balances
      typedef boost::multiprecision::uint256_t uint256_t;

      /// Packed (item identifier, issued identifier) pair
      typedef uint256_t token_id_type;

      /// 32-byte opaque value supplied by a deployer to derive a deterministic address
      typedef fc::sha256 salt_type;

      /// Opaque digest of an item's content
      typedef fc::sha256 content_hash_type;

      struct void_result {};
   }
} // nftcore::protocol

namespace fc {
   void to_variant( const nftcore::protocol::uint256_t& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, nftcore::protocol::uint256_t& vo, uint32_t max_depth = 1 );
}

FC_REFLECT_EMPTY( nftcore::protocol::void_result )
