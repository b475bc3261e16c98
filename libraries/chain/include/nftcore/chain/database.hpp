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
#include <nftcore/chain/collection_manager_object.hpp>
#include <nftcore/chain/collection_object.hpp>
#include <nftcore/chain/contract_object.hpp>
#include <nftcore/chain/evaluator.hpp>
#include <nftcore/chain/proxy_factory_object.hpp>

#include <boost/signals2/signal.hpp>

#include <memory>

namespace nftcore {
   namespace chain {
      /**
       *  @class database
       *  @brief tracks the state of every contract and applies operations atomically
       *
       *  An operation pushed with push_operation() either applies completely, including every
       *  nested call it makes, or leaves no trace.  The virtual operations it produced are
       *  broadcast through @ref applied_operation only after it commits.
       */
      class database {
      public:
         explicit database( uint64_t chain_id = NFTCORE_DEFAULT_CHAIN_ID );
         ~database();

         database( const database& ) = delete;
         database& operator=( const database& ) = delete;

         /// @{ @group Operation processing
         /**
          * @brief Validate and apply an operation as one atomic unit
          * @return the result of the operation
          */
         operation_result push_operation( const operation& op );

         /**
          * @brief Apply a nested operation inside the operation currently being pushed
          *
          * Exceptions propagate to the caller, which decides whether they abort the outer operation.
          */
         operation_result apply_operation( const operation& op );

         /// Record a virtual operation produced by the operation being applied
         void push_applied_operation( const operation& op );

         /// Operations applied by the last successful push_operation(), in application order
         const vector<operation>& get_applied_operations()const { return _applied_ops; }

         /**
          *  This signal is emitted for the pushed operation and every nested and virtual operation
          *  it produced, once the pushed operation committed.  Exceptions thrown by a slot are logged
          *  and do not fail the pushed operation.
          */
         boost::signals2::signal<void(const operation&)> applied_operation;
         /// @}

         /// @{ @group Environment
         fc::time_point_sec head_block_time()const { return _head_block_time; }
         void set_head_block_time( fc::time_point_sec t ) { _head_block_time = t; }
         uint64_t get_chain_id()const { return _chain_id; }
         /// @}

         /// @{ @group Object access
         template<typename IndexType>
         const IndexType& get_index_type()const {
            typedef typename IndexType::object_type object_type;
            FC_ASSERT( object_type::type_id < _index.size() && _index[object_type::type_id],
                       "Index for object type ${t} is not registered", ("t", object_type::type_id) );
            return dynamic_cast<const IndexType&>( *_index[object_type::type_id] );
         }

         template<typename ObjectType>
         const ObjectType& create( const std::function<void(ObjectType&)>& constructor ) {
            return get_mutable_index<ObjectType>().create( constructor );
         }

         template<typename ObjectType, typename Modifier>
         void modify( const ObjectType& obj, const Modifier& m ) {
            get_mutable_index<ObjectType>().modify( obj, m );
         }

         template<typename ObjectType>
         void remove( const ObjectType& obj ) {
            get_mutable_index<ObjectType>().remove( obj );
         }
         /// @}

         /// @{ @group Contract registry
         const contract_object& get_contract( const address& contract )const;
         const contract_object* find_contract( const address& contract )const;
         address get_owner( const address& contract )const;

         /// Address of the next contract @p deployer would deploy without a salt
         address next_contract_address( const address& deployer )const;

         const contract_object& create_contract( const address& contract, contract_kind kind, const address& deployer );

         /// Change the owner of a contract and record the ownership transfer
         void transfer_contract_ownership( const contract_object& contract, const address& new_owner );
         /// @}

         /// @{ @group Collections
         const collection_object& get_collection( const address& collection )const;
         const collection_object* find_collection( const address& collection )const;

         const collection_item_object& get_item( const address& collection, uint64_t item_id )const;
         const collection_item_object* find_item( const address& collection, uint64_t item_id )const;
         vector<collection_item> get_items( const address& collection )const;

         minter_allowance get_item_minter_allowance( const address& collection, uint64_t item_id,
                                                     const address& minter )const;
         bool is_item_manager( const address& collection, uint64_t item_id, const address& manager )const;

         /// Creator, collection-wide manager or per-item manager of @p item
         bool can_manage_item( const collection_object& collection, const collection_item_object& item,
                               const address& caller )const;

         /// Creator, collection-wide minter or per-item minter with allowance left
         bool is_authorized_to_mint( const collection_object& collection, const collection_item_object& item,
                                     const address& caller )const;

         /**
          * @brief Check that the collection is approved, completed and past its grace period
          * @throws not_approved_exception, not_completed_exception or in_grace_period_exception
          */
         void verify_minting_allowed( const collection_object& collection )const;
         bool is_minting_allowed( const address& collection )const;

         /// Issue the next token of @p item to @p beneficiary
         token_id_type issue_token( const collection_object& collection, const collection_item_object& item,
                                    const address& beneficiary, const address& caller );
         /// @}

         /// @{ @group Token ledger
         const collection_token_object& get_token( const address& collection, const token_id_type& token_id )const;
         const collection_token_object* find_token( const address& collection, const token_id_type& token_id )const;

         address owner_of( const address& collection, const token_id_type& token_id )const;
         uint64_t balance_of( const address& collection, const address& owner )const;
         address get_approved( const address& collection, const token_id_type& token_id )const;
         bool is_approved_for_all( const address& collection, const address& owner, const address& operator_ )const;
         bool is_approved_or_owner( const collection_token_object& token, const address& spender )const;

         uint64_t total_supply( const address& collection )const;
         token_id_type token_by_index( const address& collection, uint64_t index )const;
         token_id_type token_of_owner_by_index( const address& collection, const address& owner, uint64_t index )const;

         /// base_uri + chain id + "/" + collection + "/" + item id + "/" + issued id
         string token_uri( const address& collection, const token_id_type& token_id )const;

         void mint_token( const collection_object& collection, const address& to, const token_id_type& token_id );
         void transfer_token( const collection_token_object& token, const address& to );
         void set_token_approval( const collection_token_object& token, const address& approved );
         void set_approval_for_all( const address& collection, const address& owner, const address& operator_,
                                    bool approved );
         /// @}

         /// @{ @group Proxy factories
         const proxy_factory_object& get_proxy_factory( const address& factory )const;
         const proxy_factory_object* find_proxy_factory( const address& factory )const;

         /// Address a proxy deployed by @p deployer through @p factory under @p salt would get
         address compute_collection_address( const address& factory, const salt_type& salt,
                                             const address& deployer )const;

         /// Whether @p candidate is a collection deployed through @p factory
         bool is_valid_collection( const address& factory, const address& candidate )const;
         /// @}

         /// @{ @group Collection managers, forwarders and fungible tokens
         const collection_manager_object& get_collection_manager( const address& manager )const;
         const forwarder_object& get_forwarder( const address& forwarder )const;
         const fungible_token_object& get_fungible_token( const address& token )const;

         uint256_t get_fungible_balance( const address& token, const address& holder )const;
         uint256_t get_fungible_allowance( const address& token, const address& holder, const address& spender )const;

         void fungible_transfer( const fungible_token_object& token, const address& from, const address& to,
                                 const uint256_t& amount );
         /// Move @p amount on behalf of @p from, consuming the allowance granted to @p spender
         void fungible_transfer_from( const fungible_token_object& token, const address& spender,
                                      const address& from, const address& to, const uint256_t& amount );
         /// @}

      private:
         void initialize_indexes();
         void initialize_evaluators();

         template<typename IndexType>
         IndexType& add_index() {
            typedef typename IndexType::object_type object_type;
            if( _index.size() <= object_type::type_id )
               _index.resize( object_type::type_id + 1 );
            FC_ASSERT( !_index[object_type::type_id], "Index for object type ${t} is already registered",
                       ("t", object_type::type_id) );
            _index[object_type::type_id].reset( new IndexType() );
            return static_cast<IndexType&>( *_index[object_type::type_id] );
         }

         template<typename ObjectType>
         nftcore::db::typed_index<ObjectType>& get_mutable_index() {
            FC_ASSERT( ObjectType::type_id < _index.size() && _index[ObjectType::type_id],
                       "Index for object type ${t} is not registered", ("t", ObjectType::type_id) );
            return static_cast<nftcore::db::typed_index<ObjectType>&>( *_index[ObjectType::type_id] );
         }

         template<typename EvaluatorType>
         void register_evaluator() {
            _operation_evaluators[operation::tag<typename EvaluatorType::operation_type>::value]
               .reset( new op_evaluator_impl<EvaluatorType>() );
         }

         /**
          * Reverts every index to its state at construction unless committed
          */
         class undo_session {
         public:
            explicit undo_session( database& db );
            ~undo_session();
            void commit();

         private:
            database& _db;
            bool _committed = false;
         };

         uint64_t _chain_id;
         fc::time_point_sec _head_block_time;

         vector<std::unique_ptr<nftcore::db::index>> _index;
         vector<std::unique_ptr<op_evaluator>> _operation_evaluators;

         bool _pushing = false;
         vector<operation> _applied_ops;
      };
   }
} // nftcore::chain
