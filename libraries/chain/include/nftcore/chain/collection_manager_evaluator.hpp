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
#include <nftcore/chain/collection_manager_object.hpp>
#include <nftcore/protocol/collection_manager.hpp>

namespace nftcore {
   namespace chain {

      class fungible_token_create_evaluator : public evaluator<fungible_token_create_evaluator> {
      public:
         typedef fungible_token_create_operation operation_type;

         void_result do_evaluate(const fungible_token_create_operation &o);

         address do_apply(const fungible_token_create_operation &o);
      };

      class fungible_token_transfer_evaluator : public evaluator<fungible_token_transfer_evaluator> {
      public:
         typedef fungible_token_transfer_operation operation_type;

         void_result do_evaluate(const fungible_token_transfer_operation &o);

         void_result do_apply(const fungible_token_transfer_operation &o);

         const fungible_token_object* _token = nullptr;
      };

      class fungible_token_approve_evaluator : public evaluator<fungible_token_approve_evaluator> {
      public:
         typedef fungible_token_approve_operation operation_type;

         void_result do_evaluate(const fungible_token_approve_operation &o);

         void_result do_apply(const fungible_token_approve_operation &o);

         const fungible_token_object* _token = nullptr;
      };

      class forwarder_create_evaluator : public evaluator<forwarder_create_evaluator> {
      public:
         typedef forwarder_create_operation operation_type;

         void_result do_evaluate(const forwarder_create_operation &o);

         address do_apply(const forwarder_create_operation &o);
      };

      class forwarder_forward_call_evaluator : public evaluator<forwarder_forward_call_evaluator> {
      public:
         typedef forwarder_forward_call_operation operation_type;

         void_result do_evaluate(const forwarder_forward_call_operation &o);

         operation_result do_apply(const forwarder_forward_call_operation &o);

         const forwarder_object* _forwarder = nullptr;
      };

      class collection_manager_create_evaluator : public evaluator<collection_manager_create_evaluator> {
      public:
         typedef collection_manager_create_operation operation_type;

         void_result do_evaluate(const collection_manager_create_operation &o);

         address do_apply(const collection_manager_create_operation &o);
      };

      class collection_manager_update_evaluator : public evaluator<collection_manager_update_evaluator> {
      public:
         typedef collection_manager_update_operation operation_type;

         void_result do_evaluate(const collection_manager_update_operation &o);

         void_result do_apply(const collection_manager_update_operation &o);

         const collection_manager_object* _manager = nullptr;
      };

      class manager_create_collection_evaluator : public evaluator<manager_create_collection_evaluator> {
      public:
         typedef manager_create_collection_operation operation_type;

         void_result do_evaluate(const manager_create_collection_operation &o);

         address do_apply(const manager_create_collection_operation &o);

         const collection_manager_object* _manager = nullptr;
         const fungible_token_object* _accepted_token = nullptr;
         uint256_t _fee;
      };

      class manager_manage_collection_evaluator : public evaluator<manager_manage_collection_evaluator> {
      public:
         typedef manager_manage_collection_operation operation_type;

         void_result do_evaluate(const manager_manage_collection_operation &o);

         operation_result do_apply(const manager_manage_collection_operation &o);

         const collection_manager_object* _manager = nullptr;
      };
   }
} // nftcore::chain
