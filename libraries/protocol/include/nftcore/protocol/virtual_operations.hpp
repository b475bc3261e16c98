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
      struct item_added_operation : public base_virtual_operation {
         item_added_operation() {}
         item_added_operation( const address& collection, uint64_t item_id, const collection_item& item )
            : collection( collection ), item_id( item_id ), item( item ) {}

         address collection;
         uint64_t item_id = 0;
         collection_item item;
      };

      struct item_sales_data_updated_operation : public base_virtual_operation {
         address collection;
         uint64_t item_id = 0;
         uint256_t price;
         address beneficiary;
      };

      struct item_metadata_updated_operation : public base_virtual_operation {
         address collection;
         uint64_t item_id = 0;
         string metadata;
      };

      struct item_rescued_operation : public base_virtual_operation {
         address collection;
         uint64_t item_id = 0;
         content_hash_type content_hash;
         string metadata;
      };

      struct collection_approved_set_operation : public base_virtual_operation {
         address collection;
         bool old_value = false;
         bool new_value = false;
      };

      struct collection_editable_set_operation : public base_virtual_operation {
         address collection;
         bool old_value = false;
         bool new_value = false;
      };

      struct collection_base_uri_set_operation : public base_virtual_operation {
         address collection;
         string old_base_uri;
         string new_base_uri;
      };

      struct collection_completed_operation : public base_virtual_operation {
         address collection;
         fc::time_point_sec completed_at;
      };

      struct creatorship_transferred_operation : public base_virtual_operation {
         address collection;
         address previous_creator;
         address new_creator;
      };

      struct minter_set_operation : public base_virtual_operation {
         address collection;
         address minter;
         bool value = false;
      };

      struct manager_set_operation : public base_virtual_operation {
         address collection;
         address manager;
         bool value = false;
      };

      struct item_minter_set_operation : public base_virtual_operation {
         address collection;
         uint64_t item_id = 0;
         address minter;
         minter_allowance allowance;
      };

      struct item_manager_set_operation : public base_virtual_operation {
         address collection;
         uint64_t item_id = 0;
         address manager;
         bool value = false;
      };

      /**
       * @brief A token was issued from an item
       *
       * @ref caller is the address that requested the issuance.
       */
      struct token_issued_operation : public base_virtual_operation {
         address collection;
         address beneficiary;
         token_id_type token_id;
         uint64_t item_id = 0;
         uint256_t issued_id;
         address caller;
      };

      /// Ledger movement, including the mint from the zero address
      struct token_transferred_operation : public base_virtual_operation {
         address collection;
         address from;
         address to;
         token_id_type token_id;
      };

      struct token_approved_operation : public base_virtual_operation {
         address collection;
         address owner;
         address approved;
         token_id_type token_id;
      };

      struct approval_for_all_operation : public base_virtual_operation {
         address collection;
         address owner;
         address operator_;
         bool approved = false;
      };

      struct proxy_created_operation : public base_virtual_operation {
         address factory;
         address proxy;
         salt_type salt;
      };

      struct ownership_transferred_operation : public base_virtual_operation {
         address contract;
         address previous_owner;
         address new_owner;
      };

      struct fungible_transferred_operation : public base_virtual_operation {
         address token;
         address from;
         address to;
         uint256_t amount;
      };
   }
} // nftcore::protocol

FC_REFLECT( nftcore::protocol::item_added_operation, (collection)(item_id)(item) )
FC_REFLECT( nftcore::protocol::item_sales_data_updated_operation, (collection)(item_id)(price)(beneficiary) )
FC_REFLECT( nftcore::protocol::item_metadata_updated_operation, (collection)(item_id)(metadata) )
FC_REFLECT( nftcore::protocol::item_rescued_operation, (collection)(item_id)(content_hash)(metadata) )
FC_REFLECT( nftcore::protocol::collection_approved_set_operation, (collection)(old_value)(new_value) )
FC_REFLECT( nftcore::protocol::collection_editable_set_operation, (collection)(old_value)(new_value) )
FC_REFLECT( nftcore::protocol::collection_base_uri_set_operation, (collection)(old_base_uri)(new_base_uri) )
FC_REFLECT( nftcore::protocol::collection_completed_operation, (collection)(completed_at) )
FC_REFLECT( nftcore::protocol::creatorship_transferred_operation, (collection)(previous_creator)(new_creator) )
FC_REFLECT( nftcore::protocol::minter_set_operation, (collection)(minter)(value) )
FC_REFLECT( nftcore::protocol::manager_set_operation, (collection)(manager)(value) )
FC_REFLECT( nftcore::protocol::item_minter_set_operation, (collection)(item_id)(minter)(allowance) )
FC_REFLECT( nftcore::protocol::item_manager_set_operation, (collection)(item_id)(manager)(value) )
FC_REFLECT( nftcore::protocol::token_issued_operation,
            (collection)(beneficiary)(token_id)(item_id)(issued_id)(caller) )
FC_REFLECT( nftcore::protocol::token_transferred_operation, (collection)(from)(to)(token_id) )
FC_REFLECT( nftcore::protocol::token_approved_operation, (collection)(owner)(approved)(token_id) )
FC_REFLECT( nftcore::protocol::approval_for_all_operation, (collection)(owner)(operator_)(approved) )
FC_REFLECT( nftcore::protocol::proxy_created_operation, (factory)(proxy)(salt) )
FC_REFLECT( nftcore::protocol::ownership_transferred_operation, (contract)(previous_owner)(new_owner) )
FC_REFLECT( nftcore::protocol::fungible_transferred_operation, (token)(from)(to)(amount) )
