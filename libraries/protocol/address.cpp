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
#include <nftcore/protocol/address.hpp>

#include <fc/crypto/hex.hpp>
#include <fc/exception/exception.hpp>

#include <cstring>

namespace nftcore {
   namespace protocol {
      address::address( const std::string& hex ) {
         std::string digits = hex;
         if( digits.size() >= 2 && digits[0] == '0' && ( digits[1] == 'x' || digits[1] == 'X' ) )
            digits = digits.substr( 2 );
         FC_ASSERT( digits.size() == 2 * data_size(),
                    "An address should be ${n} hex digits rather than ${actual}",
                    ("n", 2 * data_size())("actual", digits.size()) );
         const size_t written = fc::from_hex( digits, reinterpret_cast<char*>( addr._hash ), data_size() );
         FC_ASSERT( written == data_size(), "Malformed address ${hex}", ("hex", hex) );
      }

      address address::from_digest( const fc::sha256& digest ) {
         address result;
         const char* bytes = reinterpret_cast<const char*>( digest._hash );
         // The digest is 32 bytes, the address keeps the trailing 20
         std::memcpy( reinterpret_cast<char*>( result.addr._hash ), bytes + 12, data_size() );
         return result;
      }

      std::string address::to_string()const {
         return "0x" + fc::to_hex( data(), data_size() );
      }

      fc::sha256 derive_creation_proof( const salt_type& salt, const address& deployer ) {
         fc::sha256::encoder enc;
         enc.write( reinterpret_cast<const char*>( salt._hash ), 32 );
         enc.write( deployer.data(), address::data_size() );
         return enc.result();
      }

      address compute_create2_address( const address& deployer, const fc::sha256& proof, const fc::sha256& code_hash ) {
         fc::sha256::encoder enc;
         const char prefix = NFTCORE_CREATE2_PREFIX_BYTE;
         enc.write( &prefix, 1 );
         enc.write( deployer.data(), address::data_size() );
         enc.write( reinterpret_cast<const char*>( proof._hash ), 32 );
         enc.write( reinterpret_cast<const char*>( code_hash._hash ), 32 );
         return address::from_digest( enc.result() );
      }

      address compute_create_address( const address& deployer, uint64_t sequence ) {
         char counter[8];
         for( int i = 7; i >= 0; --i ) {
            counter[i] = char( sequence & 0xff );
            sequence >>= 8;
         }
         fc::sha256::encoder enc;
         enc.write( deployer.data(), address::data_size() );
         enc.write( counter, sizeof(counter) );
         return address::from_digest( enc.result() );
      }
   }
} // nftcore::protocol

namespace fc {
   void to_variant( const nftcore::protocol::address& var, fc::variant& vo, uint32_t max_depth ) {
      vo = var.to_string();
   }

   void from_variant( const fc::variant& var, nftcore::protocol::address& vo, uint32_t max_depth ) {
      vo = nftcore::protocol::address( var.as_string() );
   }
}
