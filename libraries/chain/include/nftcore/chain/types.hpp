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

#include <nftcore/protocol/address.hpp>
#include <nftcore/protocol/exceptions.hpp>
#include <nftcore/protocol/types.hpp>
#include <nftcore/db/object.hpp>

namespace nftcore {
   namespace chain {
      using namespace nftcore::protocol;

      using nftcore::db::object;
      using nftcore::db::object_id_type;

      /// Index slots of the objects tracked by the database
      enum object_type {
         contract_object_type,
         collection_object_type,
         collection_item_object_type,
         collection_token_object_type,
         collection_operator_object_type,
         proxy_factory_object_type,
         collection_manager_object_type,
         forwarder_object_type,
         fungible_token_object_type,
         OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
      };
   }
} // nftcore::chain
