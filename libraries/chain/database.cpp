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
#include <nftcore/chain/collection_manager_evaluator.hpp>
#include <nftcore/chain/contract_evaluator.hpp>
#include <nftcore/chain/proxy_factory_evaluator.hpp>
#include <nftcore/chain/token_evaluator.hpp>

#include <fc/log/logger.hpp>

namespace nftcore {
   namespace chain {
      database::database( uint64_t chain_id )
         : _chain_id( chain_id ) {
         initialize_indexes();
         initialize_evaluators();
      }

      database::~database() {}

      void database::initialize_indexes() {
         _index.clear();
         add_index<contract_index>();
         add_index<collection_index>();
         add_index<collection_item_index>();
         add_index<collection_token_index>();
         add_index<collection_operator_index>();
         add_index<proxy_factory_index>();
         add_index<collection_manager_index>();
         add_index<forwarder_index>();
         add_index<fungible_token_index>();
      }

      void database::initialize_evaluators() {
         _operation_evaluators.resize( operation::count() );
         register_evaluator<collection_deploy_evaluator>();
         register_evaluator<collection_initialize_evaluator>();
         register_evaluator<collection_add_items_evaluator>();
         register_evaluator<collection_edit_items_sales_data_evaluator>();
         register_evaluator<collection_edit_items_metadata_evaluator>();
         register_evaluator<collection_rescue_items_evaluator>();
         register_evaluator<collection_set_approved_evaluator>();
         register_evaluator<collection_set_editable_evaluator>();
         register_evaluator<collection_set_base_uri_evaluator>();
         register_evaluator<collection_complete_evaluator>();
         register_evaluator<collection_transfer_creatorship_evaluator>();
         register_evaluator<collection_set_minters_evaluator>();
         register_evaluator<collection_set_managers_evaluator>();
         register_evaluator<collection_set_items_minters_evaluator>();
         register_evaluator<collection_set_items_managers_evaluator>();
         register_evaluator<collection_issue_token_evaluator>();
         register_evaluator<collection_issue_tokens_evaluator>();
         register_evaluator<token_transfer_evaluator>();
         register_evaluator<token_batch_transfer_evaluator>();
         register_evaluator<token_approve_evaluator>();
         register_evaluator<token_set_approval_for_all_evaluator>();
         register_evaluator<contract_transfer_ownership_evaluator>();
         register_evaluator<proxy_factory_create_evaluator>();
         register_evaluator<factory_create_collection_evaluator>();
         register_evaluator<fungible_token_create_evaluator>();
         register_evaluator<fungible_token_transfer_evaluator>();
         register_evaluator<fungible_token_approve_evaluator>();
         register_evaluator<forwarder_create_evaluator>();
         register_evaluator<forwarder_forward_call_evaluator>();
         register_evaluator<collection_manager_create_evaluator>();
         register_evaluator<collection_manager_update_evaluator>();
         register_evaluator<manager_create_collection_evaluator>();
         register_evaluator<manager_manage_collection_evaluator>();
      }

      database::undo_session::undo_session( database& db )
         : _db( db ) {
         FC_ASSERT( !_db._pushing, "An operation is already being pushed" );
         for( auto& i : _db._index )
            if( i ) i->start_undo_session();
         _db._applied_ops.clear();
         _db._pushing = true;
      }

      database::undo_session::~undo_session() {
         if( !_committed ) {
            try {
               for( auto& i : _db._index )
                  if( i ) i->undo();
            } catch( const fc::exception& e ) {
               elog( "Failed to undo operation: ${e}", ("e", e.to_detail_string()) );
            }
            _db._applied_ops.clear();
         }
         _db._pushing = false;
      }

      void database::undo_session::commit() {
         for( auto& i : _db._index )
            if( i ) i->commit();
         _committed = true;
         _db._pushing = false;
      }

      operation_result database::push_operation( const operation& op ) {
         operation_result result;
         try {
            undo_session session( *this );
            result = apply_operation( op );
            session.commit();
         } FC_CAPTURE_AND_RETHROW( (op) )

         // The operation is committed from here on, observers may push further operations
         const vector<operation> applied_ops = _applied_ops;
         for( const operation& applied : applied_ops ) {
            try {
               applied_operation( applied );
            } FC_CAPTURE_AND_LOG( (applied) )
         }
         return result;
      }

      operation_result database::apply_operation( const operation& op ) {
         FC_ASSERT( _pushing, "Operations may only be applied while an operation is being pushed" );
         operation_validate( op );

         const auto which = op.which();
         FC_ASSERT( which >= 0 && static_cast<size_t>( which ) < _operation_evaluators.size()
                    && _operation_evaluators[which],
                    "No registered evaluator for operation ${op}", ("op", op) );

         _applied_ops.push_back( op );
         return _operation_evaluators[which]->evaluate( *this, op );
      }

      void database::push_applied_operation( const operation& op ) {
         FC_ASSERT( _pushing, "Virtual operations may only be recorded while an operation is being pushed" );
         _applied_ops.push_back( op );
      }

      const contract_object* database::find_contract( const address& contract )const {
         const auto& idx = get_index_type<contract_index>().indices().get<by_address>();
         auto itr = idx.find( contract );
         return itr == idx.end() ? nullptr : &*itr;
      }

      const contract_object& database::get_contract( const address& contract )const {
         const contract_object* obj = find_contract( contract );
         NFTCORE_ASSERT( obj != nullptr, unknown_contract_exception,
                         "No contract is deployed at ${a}", ("a", contract) );
         return *obj;
      }

      address database::get_owner( const address& contract )const {
         return get_contract( contract ).owner;
      }

      address database::next_contract_address( const address& deployer )const {
         return compute_create_address( deployer, get_index_type<contract_index>().size() );
      }

      const contract_object& database::create_contract( const address& contract, contract_kind kind,
                                                        const address& deployer ) {
         NFTCORE_ASSERT( find_contract( contract ) == nullptr, creation_failed_exception,
                         "A contract is already deployed at ${a} (CREATION_FAILED)", ("a", contract) );
         const fc::time_point_sec now = head_block_time();
         return create<contract_object>( [&]( contract_object& obj ) {
            obj.contract = contract;
            obj.kind = kind;
            obj.deployer = deployer;
            obj.created = now;
         });
      }

      void database::transfer_contract_ownership( const contract_object& contract, const address& new_owner ) {
         ownership_transferred_operation vop;
         vop.contract = contract.contract;
         vop.previous_owner = contract.owner;
         vop.new_owner = new_owner;

         modify( contract, [&new_owner]( contract_object& obj ) {
            obj.owner = new_owner;
         });
         push_applied_operation( vop );
      }
   }
} // nftcore::chain
