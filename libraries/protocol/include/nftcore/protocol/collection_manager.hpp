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
#include <nftcore/protocol/proxy_factory.hpp>
#include <nftcore/protocol/token.hpp>

#include <fc/static_variant.hpp>

namespace nftcore {
   namespace protocol {
      /**
       * @brief Calls a forwarder may relay on behalf of its callers
       *
       * A relayed call executes with the forwarder as its caller.
       */
      typedef fc::static_variant<
         collection_add_items_operation,
         collection_edit_items_sales_data_operation,
         collection_edit_items_metadata_operation,
         collection_rescue_items_operation,
         collection_set_approved_operation,
         collection_set_editable_operation,
         collection_set_base_uri_operation,
         collection_complete_operation,
         collection_transfer_creatorship_operation,
         collection_set_minters_operation,
         collection_set_managers_operation,
         collection_set_items_minters_operation,
         collection_set_items_managers_operation,
         collection_issue_token_operation,
         collection_issue_tokens_operation,
         token_transfer_operation,
         token_batch_transfer_operation,
         token_approve_operation,
         token_set_approval_for_all_operation,
         contract_transfer_ownership_operation,
         factory_create_collection_operation
      > forwardable_operation;

      /// Contract a forwardable call is addressed to
      address forwardable_target( const forwardable_operation& call );

      /**
       * @brief Deploy a minimal fungible token used to pay collection fees
       *
       * The whole initial supply is credited to the caller.  The result is the token address.
       */
      struct fungible_token_create_operation : public base_operation {
         address caller;
         string symbol;
         uint256_t initial_supply;

         void validate()const;
      };

      struct fungible_token_transfer_operation : public base_operation {
         address caller;
         address token;
         address to;
         uint256_t amount;

         void validate()const;
      };

      /// Allow @ref spender to move up to @ref amount of the caller's balance
      struct fungible_token_approve_operation : public base_operation {
         address caller;
         address token;
         address spender;
         uint256_t amount;

         void validate()const;
      };

      /**
       * @brief Deploy a forwarder
       *
       * Only the owner and @ref forward_caller may relay calls through the forwarder.
       */
      struct forwarder_create_operation : public base_operation {
         address caller;
         address owner;
         address forward_caller;

         void validate()const;
      };

      /// Relay @ref call through a forwarder.  The result is the result of the relayed call.
      struct forwarder_forward_call_operation : public base_operation {
         address caller;
         address forwarder;
         forwardable_operation call;

         void validate()const;
      };

      /**
       * @brief Deploy a collection manager
       *
       * A collection manager sells collection creation for a fee and forwards committee decisions
       * to collections owned by its forwarder.
       */
      struct collection_manager_create_operation : public base_operation {
         address caller;
         address owner;
         address accepted_token;
         address committee;
         address fees_collector;
         uint256_t price_per_item;

         void validate()const;
      };

      /// Owner-only update of a collection manager's settings
      struct collection_manager_update_operation : public base_operation {
         address caller;
         address manager;
         optional<address> new_accepted_token;
         optional<address> new_committee;
         optional<address> new_fees_collector;
         optional<uint256_t> new_price_per_item;

         void validate()const;
      };

      /**
       * @brief Buy a completed, pending-approval collection through a manager
       *
       * The caller pays price_per_item for every item.  The collection is created through the
       * forwarder and a factory, completed on creation and left unapproved until the committee
       * approves it.  The result is the collection address.
       */
      struct manager_create_collection_operation : public base_operation {
         address caller;
         address manager;
         address forwarder;
         address factory;
         salt_type salt;
         string name;
         string symbol;
         string base_uri;
         address creator;
         vector<collection_item> items;

         void validate()const;
      };

      /// Committee-only relay of a call to a collection through the manager's forwarder
      struct manager_manage_collection_operation : public base_operation {
         address caller;
         address manager;
         address forwarder;
         forwardable_operation call;

         void validate()const;
      };
   }
} // nftcore::protocol

FC_REFLECT_TYPENAME( nftcore::protocol::forwardable_operation )

FC_REFLECT( nftcore::protocol::fungible_token_create_operation, (caller)(symbol)(initial_supply) )
FC_REFLECT( nftcore::protocol::fungible_token_transfer_operation, (caller)(token)(to)(amount) )
FC_REFLECT( nftcore::protocol::fungible_token_approve_operation, (caller)(token)(spender)(amount) )
FC_REFLECT( nftcore::protocol::forwarder_create_operation, (caller)(owner)(forward_caller) )
FC_REFLECT( nftcore::protocol::forwarder_forward_call_operation, (caller)(forwarder)(call) )
FC_REFLECT( nftcore::protocol::collection_manager_create_operation,
            (caller)(owner)(accepted_token)(committee)(fees_collector)(price_per_item) )
FC_REFLECT( nftcore::protocol::collection_manager_update_operation,
            (caller)(manager)(new_accepted_token)(new_committee)(new_fees_collector)(new_price_per_item) )
FC_REFLECT( nftcore::protocol::manager_create_collection_operation,
            (caller)(manager)(forwarder)(factory)(salt)(name)(symbol)(base_uri)(creator)(items) )
FC_REFLECT( nftcore::protocol::manager_manage_collection_operation, (caller)(manager)(forwarder)(call) )
