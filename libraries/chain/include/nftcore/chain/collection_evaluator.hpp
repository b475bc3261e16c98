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

#include <nftcore/chain/evaluator.hpp>
#include <nftcore/chain/collection_object.hpp>
#include <nftcore/protocol/collection.hpp>

namespace nftcore {
   namespace chain {

      class collection_deploy_evaluator : public evaluator<collection_deploy_evaluator> {
      public:
         typedef collection_deploy_operation operation_type;

         void_result do_evaluate(const collection_deploy_operation &o);

         address do_apply(const collection_deploy_operation &o);
      };

      class collection_initialize_evaluator : public evaluator<collection_initialize_evaluator> {
      public:
         typedef collection_initialize_operation operation_type;

         void_result do_evaluate(const collection_initialize_operation &o);

         void_result do_apply(const collection_initialize_operation &o);

         const collection_object* _collection = nullptr;
      };

      class collection_add_items_evaluator : public evaluator<collection_add_items_evaluator> {
      public:
         typedef collection_add_items_operation operation_type;

         void_result do_evaluate(const collection_add_items_operation &o);

         void_result do_apply(const collection_add_items_operation &o);

         const collection_object* _collection = nullptr;
      };

      class collection_edit_items_sales_data_evaluator : public evaluator<collection_edit_items_sales_data_evaluator> {
      public:
         typedef collection_edit_items_sales_data_operation operation_type;

         void_result do_evaluate(const collection_edit_items_sales_data_operation &o);

         void_result do_apply(const collection_edit_items_sales_data_operation &o);

         const collection_object* _collection = nullptr;
         vector<const collection_item_object*> _items;
      };

      class collection_edit_items_metadata_evaluator : public evaluator<collection_edit_items_metadata_evaluator> {
      public:
         typedef collection_edit_items_metadata_operation operation_type;

         void_result do_evaluate(const collection_edit_items_metadata_operation &o);

         void_result do_apply(const collection_edit_items_metadata_operation &o);

         const collection_object* _collection = nullptr;
         vector<const collection_item_object*> _items;
      };

      class collection_rescue_items_evaluator : public evaluator<collection_rescue_items_evaluator> {
      public:
         typedef collection_rescue_items_operation operation_type;

         void_result do_evaluate(const collection_rescue_items_operation &o);

         void_result do_apply(const collection_rescue_items_operation &o);

         const collection_object* _collection = nullptr;
         vector<const collection_item_object*> _items;
      };

      class collection_set_approved_evaluator : public evaluator<collection_set_approved_evaluator> {
      public:
         typedef collection_set_approved_operation operation_type;

         void_result do_evaluate(const collection_set_approved_operation &o);

         void_result do_apply(const collection_set_approved_operation &o);

         const collection_object* _collection = nullptr;
      };

      class collection_set_editable_evaluator : public evaluator<collection_set_editable_evaluator> {
      public:
         typedef collection_set_editable_operation operation_type;

         void_result do_evaluate(const collection_set_editable_operation &o);

         void_result do_apply(const collection_set_editable_operation &o);

         const collection_object* _collection = nullptr;
      };

      class collection_set_base_uri_evaluator : public evaluator<collection_set_base_uri_evaluator> {
      public:
         typedef collection_set_base_uri_operation operation_type;

         void_result do_evaluate(const collection_set_base_uri_operation &o);

         void_result do_apply(const collection_set_base_uri_operation &o);

         const collection_object* _collection = nullptr;
      };

      class collection_complete_evaluator : public evaluator<collection_complete_evaluator> {
      public:
         typedef collection_complete_operation operation_type;

         void_result do_evaluate(const collection_complete_operation &o);

         void_result do_apply(const collection_complete_operation &o);

         const collection_object* _collection = nullptr;
      };

      class collection_transfer_creatorship_evaluator : public evaluator<collection_transfer_creatorship_evaluator> {
      public:
         typedef collection_transfer_creatorship_operation operation_type;

         void_result do_evaluate(const collection_transfer_creatorship_operation &o);

         void_result do_apply(const collection_transfer_creatorship_operation &o);

         const collection_object* _collection = nullptr;
      };

      class collection_set_minters_evaluator : public evaluator<collection_set_minters_evaluator> {
      public:
         typedef collection_set_minters_operation operation_type;

         void_result do_evaluate(const collection_set_minters_operation &o);

         void_result do_apply(const collection_set_minters_operation &o);

         const collection_object* _collection = nullptr;
      };

      class collection_set_managers_evaluator : public evaluator<collection_set_managers_evaluator> {
      public:
         typedef collection_set_managers_operation operation_type;

         void_result do_evaluate(const collection_set_managers_operation &o);

         void_result do_apply(const collection_set_managers_operation &o);

         const collection_object* _collection = nullptr;
      };

      class collection_set_items_minters_evaluator : public evaluator<collection_set_items_minters_evaluator> {
      public:
         typedef collection_set_items_minters_operation operation_type;

         void_result do_evaluate(const collection_set_items_minters_operation &o);

         void_result do_apply(const collection_set_items_minters_operation &o);

         const collection_object* _collection = nullptr;
         vector<const collection_item_object*> _items;
      };

      class collection_set_items_managers_evaluator : public evaluator<collection_set_items_managers_evaluator> {
      public:
         typedef collection_set_items_managers_operation operation_type;

         void_result do_evaluate(const collection_set_items_managers_operation &o);

         void_result do_apply(const collection_set_items_managers_operation &o);

         const collection_object* _collection = nullptr;
         vector<const collection_item_object*> _items;
      };

      class collection_issue_token_evaluator : public evaluator<collection_issue_token_evaluator> {
      public:
         typedef collection_issue_token_operation operation_type;

         void_result do_evaluate(const collection_issue_token_operation &o);

         token_id_type do_apply(const collection_issue_token_operation &o);

         const collection_object* _collection = nullptr;
      };

      class collection_issue_tokens_evaluator : public evaluator<collection_issue_tokens_evaluator> {
      public:
         typedef collection_issue_tokens_operation operation_type;

         void_result do_evaluate(const collection_issue_tokens_operation &o);

         vector<token_id_type> do_apply(const collection_issue_tokens_operation &o);

         const collection_object* _collection = nullptr;
      };
   }
} // nftcore::chain
