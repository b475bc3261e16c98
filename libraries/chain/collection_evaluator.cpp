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
#include <nftcore/chain/collection_evaluator.hpp>
#include <nftcore/chain/collection_object.hpp>

#include <map>

namespace nftcore {
   namespace chain {
      namespace {
         const collection_object& get_initialized_collection( const database& d, const address& collection ) {
            const collection_object& c = d.get_collection( collection );
            NFTCORE_ASSERT( c.is_initialized(), not_initialized_exception,
                            "The collection ${c} is not initialized", ("c", collection) );
            return c;
         }

         void verify_owner( const database& d, const collection_object& c, const address& caller ) {
            NFTCORE_ASSERT( caller == d.get_owner( c.collection ), caller_is_not_owner_exception,
                            "Ownable: caller is not the owner", ("caller", caller)("collection", c.collection) );
         }

         void verify_creator( const collection_object& c, const address& caller ) {
            NFTCORE_ASSERT( caller == c.creator, caller_is_not_creator_exception,
                            "Only the creator may call this (CALLER_IS_NOT_CREATOR)",
                            ("caller", caller)("creator", c.creator) );
         }

         void verify_items_capacity( const collection_object& c, size_t count ) {
            NFTCORE_ASSERT( count <= NFTCORE_MAX_ITEM_ID + 1 - c.items_count, invalid_item_id_exception,
                            "Adding ${n} items would exceed the largest item id (INVALID_ITEM_ID)", ("n", count) );
         }

         vector<const collection_item_object*> get_items( const database& d, const collection_object& c,
                                                          const vector<uint64_t>& item_ids ) {
            vector<const collection_item_object*> items;
            items.reserve( item_ids.size() );
            for( uint64_t item_id : item_ids )
               items.push_back( &d.get_item( c.collection, item_id ) );
            return items;
         }

         void add_collection_items( database& d, const collection_object& c, const vector<collection_item>& items ) {
            const uint64_t first_id = c.items_count;
            for( size_t i = 0; i < items.size(); ++i ) {
               const collection_item& item = items[i];
               const uint64_t item_id = first_id + i;
               d.create<collection_item_object>( [&]( collection_item_object& obj ) {
                  obj.collection = c.collection;
                  obj.item_id = item_id;
                  obj.rarity = item.rarity;
                  obj.max_supply = get_rarity_value( item.rarity );
                  obj.price = item.price;
                  obj.beneficiary = item.beneficiary;
                  obj.metadata = item.metadata;
               });
               d.push_applied_operation( item_added_operation( c.collection, item_id, item ) );
            }
            d.modify( c, [&items]( collection_object& obj ) {
               obj.items_count += items.size();
            });
         }

         void push_completed( database& d, const collection_object& c ) {
            collection_completed_operation vop;
            vop.collection = c.collection;
            vop.completed_at = c.completed_at;
            d.push_applied_operation( vop );
         }
      }

      void_result collection_deploy_evaluator::do_evaluate(const collection_deploy_operation &op) {
         return void_result();
      }

      address collection_deploy_evaluator::do_apply(const collection_deploy_operation &op) {
         try {
            database& d = db();
            const address collection = d.next_contract_address( op.caller );

            d.create_contract( collection, collection_contract, op.caller );
            d.create<collection_object>( [&collection]( collection_object& obj ) {
               obj.collection = collection;
            });
            return collection;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_initialize_evaluator::do_evaluate(const collection_initialize_operation &op) {
         try {
            const database& d = db();
            _collection = &d.get_collection( op.collection );

            // Verify that the collection is still uninitialized
            initialize_transition( _collection->status, op.data.should_complete );
            verify_items_capacity( *_collection, op.data.items.size() );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_initialize_evaluator::do_apply(const collection_initialize_operation &op) {
         try {
            database& d = db();
            const fc::time_point_sec now = d.head_block_time();
            const collection_status status = initialize_transition( _collection->status, op.data.should_complete );

            d.modify( *_collection, [&]( collection_object& obj ) {
               obj.name = op.data.name;
               obj.symbol = op.data.symbol;
               obj.creator = op.data.creator;
               obj.base_uri = op.data.base_uri;
               // A proxy factory fixes the proof when it deploys the collection
               if( obj.proof_of_creation == fc::sha256() )
                  obj.proof_of_creation = op.data.proof_of_creation;
               obj.approved = true;
               obj.editable = true;
               obj.status = status;
               if( status == collection_completed )
                  obj.completed_at = now;
            });

            // The initializer owns the collection
            d.transfer_contract_ownership( d.get_contract( op.collection ), op.caller );

            add_collection_items( d, *_collection, op.data.items );
            if( _collection->is_completed() )
               push_completed( d, *_collection );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_add_items_evaluator::do_evaluate(const collection_add_items_operation &op) {
         try {
            const database& d = db();
            _collection = &get_initialized_collection( d, op.collection );

            verify_creator( *_collection, op.caller );
            NFTCORE_ASSERT( !_collection->is_completed(), already_completed_exception,
                            "Items may not be added to a completed collection (COLLECTION_ALREADY_COMPLETED)",
                            ("collection", op.collection) );
            verify_items_capacity( *_collection, op.items.size() );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_add_items_evaluator::do_apply(const collection_add_items_operation &op) {
         try {
            add_collection_items( db(), *_collection, op.items );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_edit_items_sales_data_evaluator::do_evaluate(const collection_edit_items_sales_data_operation &op) {
         try {
            const database& d = db();
            _collection = &get_initialized_collection( d, op.collection );
            _items = get_items( d, *_collection, op.item_ids );

            for( const collection_item_object* item : _items )
               NFTCORE_ASSERT( d.can_manage_item( *_collection, *item, op.caller ), caller_is_not_creator_or_manager_exception,
                               "${caller} may not manage item ${id} (CALLER_IS_NOT_CREATOR_OR_MANAGER)",
                               ("caller", op.caller)("id", item->item_id) );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_edit_items_sales_data_evaluator::do_apply(const collection_edit_items_sales_data_operation &op) {
         try {
            database& d = db();
            for( size_t i = 0; i < _items.size(); ++i ) {
               const uint256_t& price = op.prices[i];
               const address& beneficiary = op.beneficiaries[i];
               d.modify( *_items[i], [&]( collection_item_object& obj ) {
                  obj.price = price;
                  obj.beneficiary = beneficiary;
               });

               item_sales_data_updated_operation vop;
               vop.collection = op.collection;
               vop.item_id = op.item_ids[i];
               vop.price = price;
               vop.beneficiary = beneficiary;
               d.push_applied_operation( vop );
            }
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_edit_items_metadata_evaluator::do_evaluate(const collection_edit_items_metadata_operation &op) {
         try {
            const database& d = db();
            _collection = &get_initialized_collection( d, op.collection );

            NFTCORE_ASSERT( _collection->editable, not_editable_exception,
                            "The collection is not editable (NOT_EDITABLE)", ("collection", op.collection) );

            _items = get_items( d, *_collection, op.item_ids );
            for( const collection_item_object* item : _items )
               NFTCORE_ASSERT( d.can_manage_item( *_collection, *item, op.caller ), caller_is_not_creator_or_manager_exception,
                               "${caller} may not manage item ${id} (CALLER_IS_NOT_CREATOR_OR_MANAGER)",
                               ("caller", op.caller)("id", item->item_id) );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_edit_items_metadata_evaluator::do_apply(const collection_edit_items_metadata_operation &op) {
         try {
            database& d = db();
            for( size_t i = 0; i < _items.size(); ++i ) {
               const string& metadata = op.metadatas[i];
               d.modify( *_items[i], [&metadata]( collection_item_object& obj ) {
                  obj.metadata = metadata;
               });

               item_metadata_updated_operation vop;
               vop.collection = op.collection;
               vop.item_id = op.item_ids[i];
               vop.metadata = metadata;
               d.push_applied_operation( vop );
            }
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_rescue_items_evaluator::do_evaluate(const collection_rescue_items_operation &op) {
         try {
            const database& d = db();
            _collection = &get_initialized_collection( d, op.collection );

            verify_owner( d, *_collection, op.caller );
            _items = get_items( d, *_collection, op.item_ids );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_rescue_items_evaluator::do_apply(const collection_rescue_items_operation &op) {
         try {
            database& d = db();
            for( size_t i = 0; i < _items.size(); ++i ) {
               const content_hash_type& content_hash = op.content_hashes[i];
               const string& metadata = op.metadatas[i];
               d.modify( *_items[i], [&]( collection_item_object& obj ) {
                  obj.content_hash = content_hash;
                  // An empty entry keeps the current metadata
                  if( !metadata.empty() )
                     obj.metadata = metadata;
               });

               item_rescued_operation vop;
               vop.collection = op.collection;
               vop.item_id = op.item_ids[i];
               vop.content_hash = content_hash;
               vop.metadata = _items[i]->metadata;
               d.push_applied_operation( vop );
            }
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_approved_evaluator::do_evaluate(const collection_set_approved_operation &op) {
         try {
            const database& d = db();
            _collection = &d.get_collection( op.collection );

            verify_owner( d, *_collection, op.caller );
            NFTCORE_ASSERT( _collection->approved != op.value, value_is_the_same_exception,
                            "The collection is already ${state} (VALUE_IS_THE_SAME)",
                            ("state", op.value ? "approved" : "rejected") );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_approved_evaluator::do_apply(const collection_set_approved_operation &op) {
         try {
            database& d = db();

            collection_approved_set_operation vop;
            vop.collection = op.collection;
            vop.old_value = _collection->approved;
            vop.new_value = op.value;

            d.modify( *_collection, [&op]( collection_object& obj ) {
               obj.approved = op.value;
            });
            d.push_applied_operation( vop );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_editable_evaluator::do_evaluate(const collection_set_editable_operation &op) {
         try {
            const database& d = db();
            _collection = &d.get_collection( op.collection );

            verify_owner( d, *_collection, op.caller );
            NFTCORE_ASSERT( _collection->editable != op.value, value_is_the_same_exception,
                            "The editable flag is already ${v} (VALUE_IS_THE_SAME)", ("v", op.value) );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_editable_evaluator::do_apply(const collection_set_editable_operation &op) {
         try {
            database& d = db();

            collection_editable_set_operation vop;
            vop.collection = op.collection;
            vop.old_value = _collection->editable;
            vop.new_value = op.value;

            d.modify( *_collection, [&op]( collection_object& obj ) {
               obj.editable = op.value;
            });
            d.push_applied_operation( vop );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_base_uri_evaluator::do_evaluate(const collection_set_base_uri_operation &op) {
         try {
            const database& d = db();
            _collection = &d.get_collection( op.collection );
            verify_owner( d, *_collection, op.caller );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_base_uri_evaluator::do_apply(const collection_set_base_uri_operation &op) {
         try {
            database& d = db();

            collection_base_uri_set_operation vop;
            vop.collection = op.collection;
            vop.old_base_uri = _collection->base_uri;
            vop.new_base_uri = op.base_uri;

            d.modify( *_collection, [&op]( collection_object& obj ) {
               obj.base_uri = op.base_uri;
            });
            d.push_applied_operation( vop );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_complete_evaluator::do_evaluate(const collection_complete_operation &op) {
         try {
            const database& d = db();
            _collection = &d.get_collection( op.collection );

            verify_creator( *_collection, op.caller );
            complete_transition( _collection->status );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_complete_evaluator::do_apply(const collection_complete_operation &op) {
         try {
            database& d = db();
            const fc::time_point_sec now = d.head_block_time();
            const collection_status status = complete_transition( _collection->status );

            d.modify( *_collection, [&]( collection_object& obj ) {
               obj.status = status;
               obj.completed_at = now;
            });
            push_completed( d, *_collection );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_transfer_creatorship_evaluator::do_evaluate(const collection_transfer_creatorship_operation &op) {
         try {
            const database& d = db();
            _collection = &d.get_collection( op.collection );

            // Verify that the caller is either the owner or the creator
            NFTCORE_ASSERT( op.caller == d.get_owner( op.collection ) || op.caller == _collection->creator,
                            caller_is_not_owner_or_creator_exception,
                            "Only the owner or the creator may transfer the creatorship (CALLER_IS_NOT_OWNER_OR_CREATOR)",
                            ("caller", op.caller) );
            NFTCORE_ASSERT( !op.new_creator.is_zero(), invalid_creator_address_exception,
                            "The new creator may not be the zero address (INVALID_CREATOR_ADDRESS)",
                            ("new_creator", op.new_creator) );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_transfer_creatorship_evaluator::do_apply(const collection_transfer_creatorship_operation &op) {
         try {
            database& d = db();

            creatorship_transferred_operation vop;
            vop.collection = op.collection;
            vop.previous_creator = _collection->creator;
            vop.new_creator = op.new_creator;

            d.modify( *_collection, [&op]( collection_object& obj ) {
               obj.creator = op.new_creator;
            });
            d.push_applied_operation( vop );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_minters_evaluator::do_evaluate(const collection_set_minters_operation &op) {
         try {
            const database& d = db();
            _collection = &get_initialized_collection( d, op.collection );
            verify_creator( *_collection, op.caller );

            // Entries apply in order, so a repeated entry is compared with the earlier one
            flat_set<address> minters = _collection->minters;
            for( size_t i = 0; i < op.minters.size(); ++i ) {
               const bool current = minters.find( op.minters[i] ) != minters.end();
               NFTCORE_ASSERT( current != op.values[i], value_is_the_same_exception,
                               "Minter ${m} is already set to ${v} (VALUE_IS_THE_SAME)",
                               ("m", op.minters[i])("v", bool(op.values[i])) );
               if( op.values[i] )
                  minters.insert( op.minters[i] );
               else
                  minters.erase( op.minters[i] );
            }

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_minters_evaluator::do_apply(const collection_set_minters_operation &op) {
         try {
            database& d = db();
            for( size_t i = 0; i < op.minters.size(); ++i ) {
               const address& minter = op.minters[i];
               const bool value = op.values[i];
               d.modify( *_collection, [&]( collection_object& obj ) {
                  if( value )
                     obj.minters.insert( minter );
                  else
                     obj.minters.erase( minter );
               });

               minter_set_operation vop;
               vop.collection = op.collection;
               vop.minter = minter;
               vop.value = value;
               d.push_applied_operation( vop );
            }
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_managers_evaluator::do_evaluate(const collection_set_managers_operation &op) {
         try {
            const database& d = db();
            _collection = &get_initialized_collection( d, op.collection );
            verify_creator( *_collection, op.caller );

            flat_set<address> managers = _collection->managers;
            for( size_t i = 0; i < op.managers.size(); ++i ) {
               const bool current = managers.find( op.managers[i] ) != managers.end();
               NFTCORE_ASSERT( current != op.values[i], value_is_the_same_exception,
                               "Manager ${m} is already set to ${v} (VALUE_IS_THE_SAME)",
                               ("m", op.managers[i])("v", bool(op.values[i])) );
               if( op.values[i] )
                  managers.insert( op.managers[i] );
               else
                  managers.erase( op.managers[i] );
            }

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_managers_evaluator::do_apply(const collection_set_managers_operation &op) {
         try {
            database& d = db();
            for( size_t i = 0; i < op.managers.size(); ++i ) {
               const address& manager = op.managers[i];
               const bool value = op.values[i];
               d.modify( *_collection, [&]( collection_object& obj ) {
                  if( value )
                     obj.managers.insert( manager );
                  else
                     obj.managers.erase( manager );
               });

               manager_set_operation vop;
               vop.collection = op.collection;
               vop.manager = manager;
               vop.value = value;
               d.push_applied_operation( vop );
            }
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_items_minters_evaluator::do_evaluate(const collection_set_items_minters_operation &op) {
         try {
            const database& d = db();
            _collection = &get_initialized_collection( d, op.collection );
            verify_creator( *_collection, op.caller );
            _items = get_items( d, *_collection, op.item_ids );

            std::map<std::pair<uint64_t, address>, minter_allowance> pending;
            for( size_t i = 0; i < _items.size(); ++i ) {
               const auto key = std::make_pair( op.item_ids[i], op.minters[i] );
               auto itr = pending.find( key );
               const minter_allowance current = itr != pending.end() ? itr->second
                                                                     : _items[i]->allowance_of( op.minters[i] );
               NFTCORE_ASSERT( current != op.values[i], value_is_the_same_exception,
                               "Minter ${m} of item ${id} already has this allowance (VALUE_IS_THE_SAME)",
                               ("m", op.minters[i])("id", op.item_ids[i]) );
               pending[key] = op.values[i];
            }

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_items_minters_evaluator::do_apply(const collection_set_items_minters_operation &op) {
         try {
            database& d = db();
            for( size_t i = 0; i < _items.size(); ++i ) {
               const address& minter = op.minters[i];
               const minter_allowance& allowance = op.values[i];
               d.modify( *_items[i], [&]( collection_item_object& obj ) {
                  if( allowance.can_mint() )
                     obj.minters[minter] = allowance;
                  else
                     obj.minters.erase( minter );
               });

               item_minter_set_operation vop;
               vop.collection = op.collection;
               vop.item_id = op.item_ids[i];
               vop.minter = minter;
               vop.allowance = allowance;
               d.push_applied_operation( vop );
            }
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_items_managers_evaluator::do_evaluate(const collection_set_items_managers_operation &op) {
         try {
            const database& d = db();
            _collection = &get_initialized_collection( d, op.collection );
            verify_creator( *_collection, op.caller );
            _items = get_items( d, *_collection, op.item_ids );

            std::map<std::pair<uint64_t, address>, bool> pending;
            for( size_t i = 0; i < _items.size(); ++i ) {
               const auto key = std::make_pair( op.item_ids[i], op.managers[i] );
               auto itr = pending.find( key );
               const bool current = itr != pending.end() ? itr->second : _items[i]->is_manager( op.managers[i] );
               NFTCORE_ASSERT( current != op.values[i], value_is_the_same_exception,
                               "Manager ${m} of item ${id} is already set to ${v} (VALUE_IS_THE_SAME)",
                               ("m", op.managers[i])("id", op.item_ids[i])("v", current) );
               pending[key] = op.values[i];
            }

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_set_items_managers_evaluator::do_apply(const collection_set_items_managers_operation &op) {
         try {
            database& d = db();
            for( size_t i = 0; i < _items.size(); ++i ) {
               const address& manager = op.managers[i];
               const bool value = op.values[i];
               d.modify( *_items[i], [&]( collection_item_object& obj ) {
                  if( value )
                     obj.managers.insert( manager );
                  else
                     obj.managers.erase( manager );
               });

               item_manager_set_operation vop;
               vop.collection = op.collection;
               vop.item_id = op.item_ids[i];
               vop.manager = manager;
               vop.value = value;
               d.push_applied_operation( vop );
            }
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_issue_token_evaluator::do_evaluate(const collection_issue_token_operation &op) {
         try {
            const database& d = db();
            _collection = &d.get_collection( op.collection );
            d.verify_minting_allowed( *_collection );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      token_id_type collection_issue_token_evaluator::do_apply(const collection_issue_token_operation &op) {
         try {
            database& d = db();
            const collection_item_object& item = d.get_item( op.collection, op.item_id );
            return d.issue_token( *_collection, item, op.beneficiary, op.caller );
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_issue_tokens_evaluator::do_evaluate(const collection_issue_tokens_operation &op) {
         try {
            const database& d = db();
            _collection = &d.get_collection( op.collection );
            d.verify_minting_allowed( *_collection );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      vector<token_id_type> collection_issue_tokens_evaluator::do_apply(const collection_issue_tokens_operation &op) {
         try {
            database& d = db();
            vector<token_id_type> token_ids;
            token_ids.reserve( op.item_ids.size() );

            // A failing entry aborts the whole batch through the enclosing undo session
            for( size_t i = 0; i < op.item_ids.size(); ++i ) {
               const collection_item_object& item = d.get_item( op.collection, op.item_ids[i] );
               token_ids.push_back( d.issue_token( *_collection, item, op.beneficiaries[i], op.caller ) );
            }
            return token_ids;
         } FC_CAPTURE_AND_RETHROW((op))
      }
   }
} // nftcore::chain
