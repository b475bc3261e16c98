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
#include <nftcore/chain/collection_object.hpp>

namespace nftcore {
   namespace chain {
      collection_status initialize_transition( collection_status current, bool should_complete ) {
         NFTCORE_ASSERT( current == collection_uninitialized, already_initialized_exception,
                         "The collection is already initialized (ALREADY_INITIALIZED)", ("status", current) );
         return should_complete ? collection_completed : collection_open;
      }

      collection_status complete_transition( collection_status current ) {
         NFTCORE_ASSERT( current != collection_uninitialized, not_initialized_exception,
                         "The collection is not initialized", ("status", current) );
         NFTCORE_ASSERT( current != collection_completed, already_completed_exception,
                         "The collection is already completed (COLLECTION_ALREADY_COMPLETED)", ("status", current) );
         return collection_completed;
      }

      collection_item collection_item_object::to_item()const {
         collection_item item;
         item.rarity = rarity;
         item.total_supply = total_supply;
         item.price = price;
         item.beneficiary = beneficiary;
         item.metadata = metadata;
         item.content_hash = content_hash;
         return item;
      }
   }
} // nftcore::chain
