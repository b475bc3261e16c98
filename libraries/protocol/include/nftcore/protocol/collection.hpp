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

#include <nftcore/protocol/base.hpp>
#include <nftcore/protocol/rarity.hpp>

namespace nftcore {
   namespace protocol {
      /**
       * @brief One mintable design inside a collection
       */
      struct collection_item {
         /// Rarity tier, determines the maximum supply
         uint8_t rarity = 0;

         /// Tokens issued so far.  Must be zero when the item is submitted.
         uint64_t total_supply = 0;

         /// Sale price, denominated in the smallest unit of the accepted token
         uint256_t price;

         /// Receiver of sales proceeds.  Zero if and only if @ref price is zero.
         address beneficiary;

         /// Item description, never empty
         string metadata;

         /// Digest of the item content.  Empty on submission, set only through a rescue.
         content_hash_type content_hash;

         /***
          * @brief Check the shape rules of an item submitted for addition
          */
         void validate()const;
      };

      enum minter_allowance_kind {
         finite_allowance = 0,
         unlimited_allowance = 1
      };

      /**
       * @brief Number of tokens a per-item minter may still issue
       *
       * An unlimited allowance is its own kind rather than a sentinel amount, so that a finite
       * allowance of any size still decrements.
       */
      class minter_allowance {
      public:
         minter_allowance() {}
         explicit minter_allowance( const uint256_t& amount ) : remaining( amount ) {}

         static minter_allowance unlimited() {
            minter_allowance a;
            a.kind = unlimited_allowance;
            return a;
         }

         bool is_unlimited()const { return kind == unlimited_allowance; }
         bool can_mint()const { return is_unlimited() || remaining > 0; }

         /// Charge one issuance against the allowance
         void consume();

         friend bool operator == ( const minter_allowance& a, const minter_allowance& b ) {
            return a.kind == b.kind && ( a.is_unlimited() || a.remaining == b.remaining );
         }
         friend bool operator != ( const minter_allowance& a, const minter_allowance& b ) { return !( a == b ); }

         minter_allowance_kind kind = finite_allowance;
         uint256_t remaining;
      };

      /**
       * @brief Parameters of a collection's one-time initialization
       */
      struct collection_init_data {
         string name;
         string symbol;
         address creator;

         /// Complete the collection as part of the initialization
         bool should_complete = false;

         string base_uri;
         fc::sha256 proof_of_creation;
         vector<collection_item> items;

         void validate()const;
      };

      /**
       * @brief Deploy a new, uninitialized collection
       *
       * The result is the address of the deployed collection.
       */
      struct collection_deploy_operation : public base_operation {
         address caller;

         void validate()const;
      };

      /**
       * @brief Initialize a deployed collection
       *
       * The caller becomes the owner of the collection.  Newly initialized collections are
       * approved and editable.
       */
      struct collection_initialize_operation : public base_operation {
         address caller;
         address collection;
         collection_init_data data;

         void validate()const;
      };

      /// Append items to an open collection.  Only the creator may add items.
      struct collection_add_items_operation : public base_operation {
         address caller;
         address collection;
         vector<collection_item> items;

         void validate()const;
      };

      /// Update the price and beneficiary of existing items
      struct collection_edit_items_sales_data_operation : public base_operation {
         address caller;
         address collection;
         vector<uint64_t> item_ids;
         vector<uint256_t> prices;
         vector<address> beneficiaries;

         void validate()const;
      };

      /// Replace the metadata of existing items of an editable collection
      struct collection_edit_items_metadata_operation : public base_operation {
         address caller;
         address collection;
         vector<uint64_t> item_ids;
         vector<string> metadatas;

         void validate()const;
      };

      /**
       * @brief Owner-only repair of item content
       *
       * An empty metadata entry leaves the item's metadata untouched.
       */
      struct collection_rescue_items_operation : public base_operation {
         address caller;
         address collection;
         vector<uint64_t> item_ids;
         vector<content_hash_type> content_hashes;
         vector<string> metadatas;

         void validate()const;
      };

      struct collection_set_approved_operation : public base_operation {
         address caller;
         address collection;
         bool value = false;

         void validate()const;
      };

      struct collection_set_editable_operation : public base_operation {
         address caller;
         address collection;
         bool value = false;

         void validate()const;
      };

      struct collection_set_base_uri_operation : public base_operation {
         address caller;
         address collection;
         string base_uri;

         void validate()const;
      };

      /// Mark a collection completed.  The grace period starts at the moment of completion.
      struct collection_complete_operation : public base_operation {
         address caller;
         address collection;

         void validate()const;
      };

      struct collection_transfer_creatorship_operation : public base_operation {
         address caller;
         address collection;
         address new_creator;

         void validate()const;
      };

      /// Grant or revoke collection-wide minting rights
      struct collection_set_minters_operation : public base_operation {
         address caller;
         address collection;
         vector<address> minters;
         vector<bool> values;

         void validate()const;
      };

      /// Grant or revoke collection-wide item management rights
      struct collection_set_managers_operation : public base_operation {
         address caller;
         address collection;
         vector<address> managers;
         vector<bool> values;

         void validate()const;
      };

      /// Assign per-item minting allowances.  A finite allowance of zero revokes the minter.
      struct collection_set_items_minters_operation : public base_operation {
         address caller;
         address collection;
         vector<uint64_t> item_ids;
         vector<address> minters;
         vector<minter_allowance> values;

         void validate()const;
      };

      struct collection_set_items_managers_operation : public base_operation {
         address caller;
         address collection;
         vector<uint64_t> item_ids;
         vector<address> managers;
         vector<bool> values;

         void validate()const;
      };

      /**
       * @brief Issue one token of an item
       *
       * The result is the identifier of the issued token.
       */
      struct collection_issue_token_operation : public base_operation {
         address caller;
         address collection;
         address beneficiary;
         uint64_t item_id = 0;

         void validate()const;
      };

      /**
       * @brief Issue a batch of tokens, all or nothing
       *
       * The result holds the identifiers of the issued tokens, in input order.
       */
      struct collection_issue_tokens_operation : public base_operation {
         address caller;
         address collection;
         vector<address> beneficiaries;
         vector<uint64_t> item_ids;

         void validate()const;
      };

      /// Hand the ownership of any owned contract to another address
      struct contract_transfer_ownership_operation : public base_operation {
         address caller;
         address contract;
         address new_owner;

         void validate()const;
      };
   }
} // nftcore::protocol

FC_REFLECT( nftcore::protocol::collection_item,
            (rarity)(total_supply)(price)(beneficiary)(metadata)(content_hash) )
FC_REFLECT_ENUM( nftcore::protocol::minter_allowance_kind, (finite_allowance)(unlimited_allowance) )
FC_REFLECT( nftcore::protocol::minter_allowance, (kind)(remaining) )
FC_REFLECT( nftcore::protocol::collection_init_data,
            (name)(symbol)(creator)(should_complete)(base_uri)(proof_of_creation)(items) )

FC_REFLECT( nftcore::protocol::collection_deploy_operation, (caller) )
FC_REFLECT( nftcore::protocol::collection_initialize_operation, (caller)(collection)(data) )
FC_REFLECT( nftcore::protocol::collection_add_items_operation, (caller)(collection)(items) )
FC_REFLECT( nftcore::protocol::collection_edit_items_sales_data_operation,
            (caller)(collection)(item_ids)(prices)(beneficiaries) )
FC_REFLECT( nftcore::protocol::collection_edit_items_metadata_operation,
            (caller)(collection)(item_ids)(metadatas) )
FC_REFLECT( nftcore::protocol::collection_rescue_items_operation,
            (caller)(collection)(item_ids)(content_hashes)(metadatas) )
FC_REFLECT( nftcore::protocol::collection_set_approved_operation, (caller)(collection)(value) )
FC_REFLECT( nftcore::protocol::collection_set_editable_operation, (caller)(collection)(value) )
FC_REFLECT( nftcore::protocol::collection_set_base_uri_operation, (caller)(collection)(base_uri) )
FC_REFLECT( nftcore::protocol::collection_complete_operation, (caller)(collection) )
FC_REFLECT( nftcore::protocol::collection_transfer_creatorship_operation, (caller)(collection)(new_creator) )
FC_REFLECT( nftcore::protocol::collection_set_minters_operation, (caller)(collection)(minters)(values) )
FC_REFLECT( nftcore::protocol::collection_set_managers_operation, (caller)(collection)(managers)(values) )
FC_REFLECT( nftcore::protocol::collection_set_items_minters_operation,
            (caller)(collection)(item_ids)(minters)(values) )
FC_REFLECT( nftcore::protocol::collection_set_items_managers_operation,
            (caller)(collection)(item_ids)(managers)(values) )
FC_REFLECT( nftcore::protocol::collection_issue_token_operation, (caller)(collection)(beneficiary)(item_id) )
FC_REFLECT( nftcore::protocol::collection_issue_tokens_operation, (caller)(collection)(beneficiaries)(item_ids) )
FC_REFLECT( nftcore::protocol::contract_transfer_ownership_operation, (caller)(contract)(new_owner) )
