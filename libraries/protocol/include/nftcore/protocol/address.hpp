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

#include <nftcore/protocol/types.hpp>

#include <fc/crypto/ripemd160.hpp>

namespace nftcore {
   namespace protocol {
      /**
       * @brief A 20-byte contract or account identity
       *
       * The all-zero address denotes "nobody" and is rejected wherever a real identity is required.
       * Hex strings accept an optional "0x" prefix and always render with one.
       */
      class address {
      public:
         address() {}
         explicit address( const fc::ripemd160& a ) : addr( a ) {}
         explicit address( const std::string& hex );

         /// The low-order 20 bytes of @p digest
         static address from_digest( const fc::sha256& digest );

         bool is_zero()const { return addr == fc::ripemd160(); }

         std::string to_string()const;
         explicit operator std::string()const { return to_string(); }

         /// Raw bytes, in the order they appear in the hex rendering
         const char* data()const { return reinterpret_cast<const char*>( addr._hash ); }
         static constexpr uint32_t data_size() { return 20; }

         friend bool operator == ( const address& a, const address& b ) { return a.addr == b.addr; }
         friend bool operator != ( const address& a, const address& b ) { return a.addr != b.addr; }
         friend bool operator <  ( const address& a, const address& b ) { return a.addr <  b.addr; }

         fc::ripemd160 addr;
      };

      /// Proof of creation: hash(salt || deployer)
      fc::sha256 derive_creation_proof( const salt_type& salt, const address& deployer );

      /// Deterministic address of code deployed by @p deployer under @p proof
      address compute_create2_address( const address& deployer, const fc::sha256& proof, const fc::sha256& code_hash );

      /// Address of the @p sequence -th contract deployed by @p deployer without a salt
      address compute_create_address( const address& deployer, uint64_t sequence );
   }
} // nftcore::protocol

namespace fc {
   void to_variant( const nftcore::protocol::address& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, nftcore::protocol::address& vo, uint32_t max_depth = 1 );
}
