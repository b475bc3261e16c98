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

#include <nftcore/protocol/collection.hpp>

namespace nftcore {
   namespace protocol {
      /**
       * @brief Deploy a factory of minimal proxies over an existing collection implementation
       *
       * The result is the address of the factory.
       */
      struct proxy_factory_create_operation : public base_operation {
         address caller;

         /// Collection contract every proxy delegates to
         address implementation;

         /// Owner of the factory.  Receives ownership of every collection the factory initializes.
         address owner;

         void validate()const;
      };

      /**
       * @brief Deterministically deploy a collection proxy and optionally initialize it
       *
       * The proxy lives at an address derived from the factory, hash(salt || caller) and the
       * proxy code hash.  The result is the address of the new collection.
       */
      struct factory_create_collection_operation : public base_operation {
         address caller;
         address factory;
         salt_type salt;

         /// Initialization performed by the factory on the new collection
         optional<collection_init_data> init;

         void validate()const;
      };

      /// Build the EIP-1167 minimal proxy code delegating to @p implementation
      vector<char> build_minimal_proxy_code( const address& implementation );
   }
} // nftcore::protocol

FC_REFLECT( nftcore::protocol::proxy_factory_create_operation, (caller)(implementation)(owner) )
FC_REFLECT( nftcore::protocol::factory_create_collection_operation, (caller)(factory)(salt)(init) )
