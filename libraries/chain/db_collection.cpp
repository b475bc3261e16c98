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
#include <nftcore/chain/database.hpp>
#include <nftcore/protocol/token_id.hpp>

namespace nftcore {
   namespace chain {
      const collection_object* database::find_collection( const address& collection )const {
         const auto& idx = get_index_type<collection_index>().indices().get<by_collection>();
         auto itr = idx.find( collection );
         return itr == idx.end() ? nullptr : &*itr;
      }

      const collection_object& database::get_collection( const address& collection )const {
         const collection_object* obj = find_collection( collection );
         NFTCORE_ASSERT( obj != nullptr, unknown_contract_exception,
                         "No collection is deployed at ${a}", ("a", collection) );
         return *obj;
      }

      const collection_item_object* database::find_item( const address& collection, uint64_t item_id )const {
         const auto& idx = get_index_type<collection_item_index>().indices().get<by_collection_item>();
         auto itr = idx.find( boost::make_tuple( collection, item_id ) );
         return itr == idx.end() ? nullptr : &*itr;
      }

      const collection_item_object& database::get_item( const address& collection, uint64_t item_id )const {
         const collection_item_object* item = find_item( collection, item_id );
         NFTCORE_ASSERT( item != nullptr, item_does_not_exist_exception,
                         "Item ${id} does not exist (ITEM_DOES_NOT_EXIST)", ("id", item_id)("collection", collection) );
         return *item;
      }

      vector<collection_item> database::get_items( const address& collection )const {
         const auto& idx = get_index_type<collection_item_index>().indices().get<by_collection_item>();
         vector<collection_item> result;
         auto range = idx.equal_range( boost::make_tuple( collection ) );
         for( auto itr = range.first; itr != range.second; ++itr )
            result.push_back( itr->to_item() );
         return result;
      }

      minter_allowance database::get_item_minter_allowance( const address& collection, uint64_t item_id,
                                                            const address& minter )const {
         return get_item( collection, item_id ).allowance_of( minter );
      }

      bool database::is_item_manager( const address& collection, uint64_t item_id, const address& manager )const {
         return get_item( collection, item_id ).is_manager( manager );
      }

      bool database::can_manage_item( const collection_object& collection, const collection_item_object& item,
                                      const address& caller )const {
         return caller == collection.creator || collection.is_manager( caller ) || item.is_manager( caller );
      }

      bool database::is_authorized_to_mint( const collection_object& collection, const collection_item_object& item,
                                            const address& caller )const {
         return caller == collection.creator || collection.is_minter( caller ) || item.allowance_of( caller ).can_mint();
      }

      void database::verify_minting_allowed( const collection_object& collection )const {
         NFTCORE_ASSERT( collection.approved, not_approved_exception,
                         "The collection is not approved (NOT_APPROVED)", ("collection", collection.collection) );
         NFTCORE_ASSERT( collection.is_completed(), not_completed_exception,
                         "The collection is not completed (NOT_COMPLETED)", ("collection", collection.collection) );
         NFTCORE_ASSERT( head_block_time() >= collection.grace_period_end(), in_grace_period_exception,
                         "The collection is in its grace period until ${end} (IN_GRACE_PERIOD)",
                         ("collection", collection.collection)("end", collection.grace_period_end()) );
      }

      bool database::is_minting_allowed( const address& collection )const {
         const collection_object& c = get_collection( collection );
         return c.approved && c.is_completed() && head_block_time() >= c.grace_period_end();
      }

      token_id_type database::issue_token( const collection_object& collection, const collection_item_object& item,
                                           const address& beneficiary, const address& caller ) {
         NFTCORE_ASSERT( is_authorized_to_mint( collection, item, caller ), caller_can_not_mint_exception,
                         "${caller} may not mint item ${id} (CALLER_CAN_NOT_MINT)",
                         ("caller", caller)("id", item.item_id) );
         NFTCORE_ASSERT( !item.is_exhausted(), item_exhausted_exception,
                         "Item ${id} reached its maximum supply of ${max} (ITEM_EXHAUSTED)",
                         ("id", item.item_id)("max", item.max_supply) );

         const uint256_t issued_id = item.total_supply + 1;
         const token_id_type token_id = encode_token_id( item.item_id, issued_id );

         // Creators and collection-wide minters do not draw on per-item allowances
         const bool charge_allowance = caller != collection.creator && !collection.is_minter( caller );
         modify( item, [&]( collection_item_object& obj ) {
            ++obj.total_supply;
            if( charge_allowance )
               obj.minters[caller].consume();
         });

         mint_token( collection, beneficiary, token_id );

         token_issued_operation vop;
         vop.collection = collection.collection;
         vop.beneficiary = beneficiary;
         vop.token_id = token_id;
         vop.item_id = item.item_id;
         vop.issued_id = issued_id;
         vop.caller = caller;
         push_applied_operation( vop );

         return token_id;
      }
   }
} // nftcore::chain
