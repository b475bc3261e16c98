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
#include <nftcore/chain/proxy_factory_object.hpp>
#include <nftcore/protocol/proxy_factory.hpp>

namespace nftcore {
   namespace chain {

      class proxy_factory_create_evaluator : public evaluator<proxy_factory_create_evaluator> {
      public:
         typedef proxy_factory_create_operation operation_type;

         void_result do_evaluate(const proxy_factory_create_operation &o);

         address do_apply(const proxy_factory_create_operation &o);
      };

      class factory_create_collection_evaluator : public evaluator<factory_create_collection_evaluator> {
      public:
         typedef factory_create_collection_operation operation_type;

         void_result do_evaluate(const factory_create_collection_operation &o);

         address do_apply(const factory_create_collection_operation &o);

         const proxy_factory_object* _factory = nullptr;
         address _collection_address;
         fc::sha256 _proof;
      };
   }
} // nftcore::chain
