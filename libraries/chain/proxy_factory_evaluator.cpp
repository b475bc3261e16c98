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
#include <nftcore/chain/proxy_factory_evaluator.hpp>

#include <fc/log/logger.hpp>

namespace nftcore {
   namespace chain {
      void_result proxy_factory_create_evaluator::do_evaluate(const proxy_factory_create_operation &op) {
         try {
            const database& d = db();

            // Verify that the implementation is a deployed collection
            const contract_object* implementation = d.find_contract( op.implementation );
            NFTCORE_ASSERT( implementation != nullptr && implementation->kind == collection_contract,
                            invalid_implementation_exception,
                            "The implementation ${i} is not a collection contract (INVALID_IMPLEMENTATION)",
                            ("i", op.implementation) );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      address proxy_factory_create_evaluator::do_apply(const proxy_factory_create_operation &op) {
         try {
            database& d = db();
            const address factory = d.next_contract_address( op.caller );
            const vector<char> code = build_minimal_proxy_code( op.implementation );

            const contract_object& contract = d.create_contract( factory, proxy_factory_contract, op.caller );
            d.create<proxy_factory_object>( [&]( proxy_factory_object& obj ) {
               obj.factory = factory;
               obj.implementation = op.implementation;
               obj.code = code;
               obj.code_hash = fc::sha256::hash( code.data(), code.size() );
            });
            d.transfer_contract_ownership( contract, op.owner );

            return factory;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result factory_create_collection_evaluator::do_evaluate(const factory_create_collection_operation &op) {
         try {
            const database& d = db();
            _factory = &d.get_proxy_factory( op.factory );

            _proof = derive_creation_proof( op.salt, op.caller );
            _collection_address = compute_create2_address( op.factory, _proof, _factory->code_hash );

            // A salt can only be used once per deployer
            NFTCORE_ASSERT( d.find_contract( _collection_address ) == nullptr, creation_failed_exception,
                            "A contract already exists at ${a} (CREATION_FAILED)", ("a", _collection_address) );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      address factory_create_collection_evaluator::do_apply(const factory_create_collection_operation &op) {
         try {
            database& d = db();

            d.create_contract( _collection_address, collection_contract, op.factory );
            d.create<collection_object>( [this]( collection_object& obj ) {
               obj.collection = _collection_address;
               obj.proof_of_creation = _proof;
            });

            proxy_created_operation vop;
            vop.factory = op.factory;
            vop.proxy = _collection_address;
            vop.salt = op.salt;
            d.push_applied_operation( vop );

            if( op.init.valid() ) {
               collection_initialize_operation init_op;
               init_op.caller = op.factory;
               init_op.collection = _collection_address;
               init_op.data = *op.init;

               try {
                  d.apply_operation( init_op );
               } catch( const fc::exception& e ) {
                  dlog( "Initialization of ${c} failed: ${e}", ("c", _collection_address)("e", e.to_detail_string()) );
                  FC_THROW_EXCEPTION( call_failed_exception,
                                      "The initialization of collection ${c} failed (CALL_FAILED): ${reason}",
                                      ("c", _collection_address)("reason", e.to_string()) );
               }

               // Hand the collection over to the owner of the factory
               d.transfer_contract_ownership( d.get_contract( _collection_address ), d.get_owner( op.factory ) );
            }

            dlog( "Collection ${c} deployed by factory ${f} for ${a}",
                  ("c", _collection_address)("f", op.factory)("a", op.caller) );

            return _collection_address;
         } FC_CAPTURE_AND_RETHROW((op))
      }
   }
} // nftcore::chain
