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
#include <nftcore/protocol/collection.hpp>

#include <boost/multi_index/composite_key.hpp>

/**
 * @defgroup collection Collection objects
 */

namespace nftcore {
   namespace chain {
      class database;

      using namespace nftcore::db;

      /// Lifecycle of a collection.  Transitions only move forward.
      enum collection_status {
         collection_uninitialized = 0,
         collection_open = 1,
         collection_completed = 2
      };

      /**
       * @brief Status reached by initializing a collection currently in @p current
       * @throws already_initialized_exception unless @p current is collection_uninitialized
       */
      collection_status initialize_transition( collection_status current, bool should_complete );

      /**
       * @brief Status reached by completing a collection currently in @p current
       * @throws not_initialized_exception or already_completed_exception
       */
      collection_status complete_transition( collection_status current );

      /**
       *  @brief Tracks the settings and lifecycle of a collection
       *  @ingroup object
       *  @ingroup collection
       */
      class collection_object : public object {
      public:
         static constexpr uint8_t type_id = collection_object_type;

         /// Address of the collection contract
         address collection;

         string name;
         string symbol;

         /// Prefix of every token URI
         string base_uri;

         /// Zero until the collection is initialized
         address creator;

         collection_status status = collection_uninitialized;

         /// Set by the owner.  Only approved collections may issue tokens.
         bool approved = false;

         /// Whether item metadata may still be edited
         bool editable = false;

         /// Moment of completion, meaningful only once completed
         fc::time_point_sec completed_at;

         /// hash(salt || deployer) for proxies deployed through a factory
         fc::sha256 proof_of_creation;

         /// Number of items; item identifiers are dense in [0, items_count)
         uint64_t items_count = 0;

         /// Number of tokens issued over all items
         uint64_t tokens_count = 0;

         /// Collection-wide minters and managers
         flat_set<address> minters;
         flat_set<address> managers;

         bool is_initialized()const { return status != collection_uninitialized; }
         bool is_completed()const { return status == collection_completed; }
         bool is_minter( const address& a )const { return minters.find( a ) != minters.end(); }
         bool is_manager( const address& a )const { return managers.find( a ) != managers.end(); }

         /// End of the grace period; tokens may be issued at or after this moment
         fc::time_point_sec grace_period_end()const { return completed_at + NFTCORE_COLLECTION_GRACE_PERIOD; }
      };

      struct by_collection;
      typedef multi_index_container<
         collection_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_collection>, member< collection_object, address, &collection_object::collection > >
         >
      > collection_multi_index_type;
      typedef generic_index<collection_object, collection_multi_index_type> collection_index;

      /**
       *  @brief Tracks one item of a collection
       *  @ingroup object
       *  @ingroup collection
       */
      class collection_item_object : public object {
      public:
         static constexpr uint8_t type_id = collection_item_object_type;

         address collection;
         uint64_t item_id = 0;

         uint8_t rarity = 0;

         /// Maximum supply, fixed by the rarity when the item is added
         uint64_t max_supply = 0;

         /// Tokens issued so far; the last issued token has issued id == total_supply
         uint64_t total_supply = 0;

         uint256_t price;
         address beneficiary;
         string metadata;
         content_hash_type content_hash;

         /// Per-item minters.  Entries with a spent finite allowance are kept.
         flat_map<address, minter_allowance> minters;

         /// Per-item managers
         flat_set<address> managers;

         bool is_exhausted()const { return total_supply >= max_supply; }
         bool is_manager( const address& a )const { return managers.find( a ) != managers.end(); }

         /// Allowance of @p minter, finite zero when none was granted
         minter_allowance allowance_of( const address& minter )const {
            auto itr = minters.find( minter );
            return itr == minters.end() ? minter_allowance() : itr->second;
         }

         /// The item as it was submitted, with its current supply and content
         collection_item to_item()const;
      };

      struct by_collection_item;
      typedef multi_index_container<
         collection_item_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_collection_item>,
               composite_key< collection_item_object,
                  member< collection_item_object, address, &collection_item_object::collection >,
                  member< collection_item_object, uint64_t, &collection_item_object::item_id >
               >
            >
         >
      > collection_item_multi_index_type;
      typedef generic_index<collection_item_object, collection_item_multi_index_type> collection_item_index;

      /**
       *  @brief Tracks ownership of one issued token
       *  @ingroup object
       *  @ingroup collection
       */
      class collection_token_object : public object {
      public:
         static constexpr uint8_t type_id = collection_token_object_type;

         address collection;
         token_id_type token_id;
         uint64_t item_id = 0;
         uint256_t issued_id;

         address owner;

         /// Single-token approval, cleared on every transfer
         address approved;
      };

      struct by_collection_token;
      struct by_collection_owner;
      struct by_collection_sequence;
      typedef multi_index_container<
         collection_token_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_collection_token>,
               composite_key< collection_token_object,
                  member< collection_token_object, address, &collection_token_object::collection >,
                  member< collection_token_object, token_id_type, &collection_token_object::token_id >
               >
            >,
            ordered_unique< tag<by_collection_owner>,
               composite_key< collection_token_object,
                  member< collection_token_object, address, &collection_token_object::collection >,
                  member< collection_token_object, address, &collection_token_object::owner >,
                  member< collection_token_object, token_id_type, &collection_token_object::token_id >
               >
            >,
            ordered_unique< tag<by_collection_sequence>,
               composite_key< collection_token_object,
                  member< collection_token_object, address, &collection_token_object::collection >,
                  member< object, object_id_type, &object::id >
               >
            >
         >
      > collection_token_multi_index_type;
      typedef generic_index<collection_token_object, collection_token_multi_index_type> collection_token_index;

      /**
       *  @brief An operator approved by a holder for all of the holder's tokens in a collection
       *  @ingroup object
       *
       *  Only approvals that are in effect are stored.
       */
      class collection_operator_object : public object {
      public:
         static constexpr uint8_t type_id = collection_operator_object_type;

         address collection;
         address owner;
         address operator_;
      };

      struct by_collection_owner_operator;
      typedef multi_index_container<
         collection_operator_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_collection_owner_operator>,
               composite_key< collection_operator_object,
                  member< collection_operator_object, address, &collection_operator_object::collection >,
                  member< collection_operator_object, address, &collection_operator_object::owner >,
                  member< collection_operator_object, address, &collection_operator_object::operator_ >
               >
            >
         >
      > collection_operator_multi_index_type;
      typedef generic_index<collection_operator_object, collection_operator_multi_index_type> collection_operator_index;
   }
} // nftcore::chain

FC_REFLECT_ENUM( nftcore::chain::collection_status,
                 (collection_uninitialized)(collection_open)(collection_completed) )

FC_REFLECT_DERIVED( nftcore::chain::collection_object, (nftcore::db::object),
                    (collection)
                    (name)
                    (symbol)
                    (base_uri)
                    (creator)
                    (status)
                    (approved)
                    (editable)
                    (completed_at)
                    (proof_of_creation)
                    (items_count)
                    (tokens_count)
                    (minters)
                    (managers)
                  )

FC_REFLECT_DERIVED( nftcore::chain::collection_item_object, (nftcore::db::object),
                    (collection)
                    (item_id)
                    (rarity)
                    (max_supply)
                    (total_supply)
                    (price)
                    (beneficiary)
                    (metadata)
                    (content_hash)
                    (minters)
                    (managers)
                  )

FC_REFLECT_DERIVED( nftcore::chain::collection_token_object, (nftcore::db::object),
                    (collection)(token_id)(item_id)(issued_id)(owner)(approved) )

FC_REFLECT_DERIVED( nftcore::chain::collection_operator_object, (nftcore::db::object),
                    (collection)(owner)(operator_) )
