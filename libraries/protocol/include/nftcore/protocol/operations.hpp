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
#include <nftcore/protocol/collection_manager.hpp>
#include <nftcore/protocol/proxy_factory.hpp>
#include <nftcore/protocol/token.hpp>
#include <nftcore/protocol/virtual_operations.hpp>

#include <fc/static_variant.hpp>

namespace nftcore {
   namespace protocol {
      /**
       * @ingroup operations
       *
       * Every operation the database knows.  Virtual operations follow the regular ones and are
       * only ever produced by the database itself.
       */
      typedef fc::static_variant<
         /*  0 */ collection_deploy_operation,
         /*  1 */ collection_initialize_operation,
         /*  2 */ collection_add_items_operation,
         /*  3 */ collection_edit_items_sales_data_operation,
         /*  4 */ collection_edit_items_metadata_operation,
         /*  5 */ collection_rescue_items_operation,
         /*  6 */ collection_set_approved_operation,
         /*  7 */ collection_set_editable_operation,
         /*  8 */ collection_set_base_uri_operation,
         /*  9 */ collection_complete_operation,
         /* 10 */ collection_transfer_creatorship_operation,
         /* 11 */ collection_set_minters_operation,
         /* 12 */ collection_set_managers_operation,
         /* 13 */ collection_set_items_minters_operation,
         /* 14 */ collection_set_items_managers_operation,
         /* 15 */ collection_issue_token_operation,
         /* 16 */ collection_issue_tokens_operation,
         /* 17 */ token_transfer_operation,
         /* 18 */ token_batch_transfer_operation,
         /* 19 */ token_approve_operation,
         /* 20 */ token_set_approval_for_all_operation,
         /* 21 */ contract_transfer_ownership_operation,
         /* 22 */ proxy_factory_create_operation,
         /* 23 */ factory_create_collection_operation,
         /* 24 */ fungible_token_create_operation,
         /* 25 */ fungible_token_transfer_operation,
         /* 26 */ fungible_token_approve_operation,
         /* 27 */ forwarder_create_operation,
         /* 28 */ forwarder_forward_call_operation,
         /* 29 */ collection_manager_create_operation,
         /* 30 */ collection_manager_update_operation,
         /* 31 */ manager_create_collection_operation,
         /* 32 */ manager_manage_collection_operation,
         /* 33 */ item_added_operation,                // VIRTUAL
         /* 34 */ item_sales_data_updated_operation,   // VIRTUAL
         /* 35 */ item_metadata_updated_operation,     // VIRTUAL
         /* 36 */ item_rescued_operation,              // VIRTUAL
         /* 37 */ collection_approved_set_operation,   // VIRTUAL
         /* 38 */ collection_editable_set_operation,   // VIRTUAL
         /* 39 */ collection_base_uri_set_operation,   // VIRTUAL
         /* 40 */ collection_completed_operation,      // VIRTUAL
         /* 41 */ creatorship_transferred_operation,   // VIRTUAL
         /* 42 */ minter_set_operation,                // VIRTUAL
         /* 43 */ manager_set_operation,               // VIRTUAL
         /* 44 */ item_minter_set_operation,           // VIRTUAL
         /* 45 */ item_manager_set_operation,          // VIRTUAL
         /* 46 */ token_issued_operation,              // VIRTUAL
         /* 47 */ token_transferred_operation,         // VIRTUAL
         /* 48 */ token_approved_operation,            // VIRTUAL
         /* 49 */ approval_for_all_operation,          // VIRTUAL
         /* 50 */ proxy_created_operation,             // VIRTUAL
         /* 51 */ ownership_transferred_operation,     // VIRTUAL
         /* 52 */ fungible_transferred_operation       // VIRTUAL
      > operation;

      /// Result of a successfully applied operation
      typedef fc::static_variant<
         void_result,
         address,
         token_id_type,
         vector<token_id_type>
      > operation_result;

      /**
       * @brief Run the stateless checks of any operation
       */
      void operation_validate( const operation& op );

      /// Wrap a forwardable call into an operation executed with @p caller as its caller
      operation make_forwarded_operation( const forwardable_operation& call, const address& caller );
   }
} // nftcore::protocol

FC_REFLECT_TYPENAME( nftcore::protocol::operation )
FC_REFLECT_TYPENAME( nftcore::protocol::operation_result )
