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
#include <nftcore/chain/types.hpp>
#include <nftcore/db/generic_index.hpp>

namespace nftcore {
   namespace chain {
      using namespace nftcore::db;

      /**
       *  @brief Tracks a factory of minimal collection proxies
       *  @ingroup object
       *
       *  The proxy code is fixed when the factory is created, so its hash is computed once.
       */
      class proxy_factory_object : public object {
      public:
         static constexpr uint8_t type_id = proxy_factory_object_type;

         address factory;

         /// Collection every proxy delegates to
         address implementation;

         /// EIP-1167 minimal proxy code embedding @ref implementation
         vector<char> code;

         /// Hash of @ref code, the last component of every proxy address
         fc::sha256 code_hash;
      };

      struct by_factory;
      typedef multi_index_container<
         proxy_factory_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_factory>, member< proxy_factory_object, address, &proxy_factory_object::factory > >
         >
      > proxy_factory_multi_index_type;
      typedef generic_index<proxy_factory_object, proxy_factory_multi_index_type> proxy_factory_index;
   }
} // nftcore::chain

FC_REFLECT_DERIVED( nftcore::chain::proxy_factory_object, (nftcore::db::object),
                    (factory)(implementation)(code)(code_hash) )
