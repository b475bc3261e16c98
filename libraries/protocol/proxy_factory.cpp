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
#include <nftcore/protocol/proxy_factory.hpp>
#include <nftcore/protocol/exceptions.hpp>

#include <fc/crypto/hex.hpp>

namespace nftcore {
   namespace protocol {
      void proxy_factory_create_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         NFTCORE_ASSERT( !implementation.is_zero(), invalid_implementation_exception,
                         "The implementation may not be the zero address (INVALID_IMPLEMENTATION)",
                         ("implementation", implementation) );
         NFTCORE_ASSERT( !owner.is_zero(), invalid_address_exception,
                         "Ownable: new owner is the zero address", ("owner", owner) );
      }

      void factory_create_collection_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         FC_ASSERT( !factory.is_zero(), "The factory may not be the zero address" );
      }

      vector<char> build_minimal_proxy_code( const address& implementation ) {
         const string prefix = NFTCORE_MINIMAL_PROXY_CODE_PREFIX;
         const string suffix = NFTCORE_MINIMAL_PROXY_CODE_SUFFIX;

         vector<char> code( prefix.size() / 2 + address::data_size() + suffix.size() / 2 );
         size_t pos = fc::from_hex( prefix, code.data(), prefix.size() / 2 );
         std::copy( implementation.data(), implementation.data() + address::data_size(), code.begin() + pos );
         pos += address::data_size();
         pos += fc::from_hex( suffix, code.data() + pos, suffix.size() / 2 );
         FC_ASSERT( pos == code.size() );
         return code;
      }
   }
} // nftcore::protocol
