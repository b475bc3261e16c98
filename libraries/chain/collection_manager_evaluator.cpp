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
#include <nftcore/chain/collection_manager_evaluator.hpp>

#include <fc/log/logger.hpp>

namespace nftcore {
   namespace chain {
      void_result fungible_token_create_evaluator::do_evaluate(const fungible_token_create_operation &op) {
         return void_result();
      }

      address fungible_token_create_evaluator::do_apply(const fungible_token_create_operation &op) {
         try {
            database& d = db();
            const address token = d.next_contract_address( op.caller );

            const contract_object& contract = d.create_contract( token, fungible_token_contract, op.caller );
            d.create<fungible_token_object>( [&]( fungible_token_object& obj ) {
               obj.token = token;
               obj.symbol = op.symbol;
               obj.total_supply = op.initial_supply;
               obj.balances[op.caller] = op.initial_supply;
            });
            d.transfer_contract_ownership( contract, op.caller );

            fungible_transferred_operation vop;
            vop.token = token;
            vop.to = op.caller;
            vop.amount = op.initial_supply;
            d.push_applied_operation( vop );

            return token;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result fungible_token_transfer_evaluator::do_evaluate(const fungible_token_transfer_operation &op) {
         try {
            _token = &db().get_fungible_token( op.token );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result fungible_token_transfer_evaluator::do_apply(const fungible_token_transfer_operation &op) {
         try {
            db().fungible_transfer( *_token, op.caller, op.to, op.amount );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result fungible_token_approve_evaluator::do_evaluate(const fungible_token_approve_operation &op) {
         try {
            _token = &db().get_fungible_token( op.token );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result fungible_token_approve_evaluator::do_apply(const fungible_token_approve_operation &op) {
         try {
            db().modify( *_token, [&op]( fungible_token_object& obj ) {
               obj.allowances[std::make_pair( op.caller, op.spender )] = op.amount;
            });
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result forwarder_create_evaluator::do_evaluate(const forwarder_create_operation &op) {
         return void_result();
      }

      address forwarder_create_evaluator::do_apply(const forwarder_create_operation &op) {
         try {
            database& d = db();
            const address forwarder = d.next_contract_address( op.caller );

            const contract_object& contract = d.create_contract( forwarder, forwarder_contract, op.caller );
            d.create<forwarder_object>( [&]( forwarder_object& obj ) {
               obj.forwarder = forwarder;
               obj.forward_caller = op.forward_caller;
            });
            d.transfer_contract_ownership( contract, op.owner );

            return forwarder;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result forwarder_forward_call_evaluator::do_evaluate(const forwarder_forward_call_operation &op) {
         try {
            const database& d = db();
            _forwarder = &d.get_forwarder( op.forwarder );

            NFTCORE_ASSERT( op.caller == d.get_owner( op.forwarder ) || op.caller == _forwarder->forward_caller,
                            unauthorized_sender_exception,
                            "${caller} may not relay calls through ${f} (UNAUTHORIZED_SENDER)",
                            ("caller", op.caller)("f", op.forwarder) );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      operation_result forwarder_forward_call_evaluator::do_apply(const forwarder_forward_call_operation &op) {
         try {
            database& d = db();
            const operation forwarded = make_forwarded_operation( op.call, op.forwarder );
            try {
               return d.apply_operation( forwarded );
            } catch( const fc::exception& e ) {
               dlog( "Call relayed by ${f} failed: ${e}", ("f", op.forwarder)("e", e.to_detail_string()) );
               FC_THROW_EXCEPTION( call_failed_exception, "The relayed call failed (CALL_FAILED): ${reason}",
                                   ("reason", e.to_string()) );
            }
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_manager_create_evaluator::do_evaluate(const collection_manager_create_operation &op) {
         return void_result();
      }

      address collection_manager_create_evaluator::do_apply(const collection_manager_create_operation &op) {
         try {
            database& d = db();
            const address manager = d.next_contract_address( op.caller );

            const contract_object& contract = d.create_contract( manager, collection_manager_contract, op.caller );
            d.create<collection_manager_object>( [&]( collection_manager_object& obj ) {
               obj.manager = manager;
               obj.accepted_token = op.accepted_token;
               obj.committee = op.committee;
               obj.fees_collector = op.fees_collector;
               obj.price_per_item = op.price_per_item;
            });
            d.transfer_contract_ownership( contract, op.owner );

            ilog( "Collection manager ${m} created, committee ${c}", ("m", manager)("c", op.committee) );
            return manager;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_manager_update_evaluator::do_evaluate(const collection_manager_update_operation &op) {
         try {
            const database& d = db();
            _manager = &d.get_collection_manager( op.manager );

            NFTCORE_ASSERT( op.caller == d.get_owner( op.manager ), caller_is_not_owner_exception,
                            "Ownable: caller is not the owner", ("caller", op.caller) );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result collection_manager_update_evaluator::do_apply(const collection_manager_update_operation &op) {
         try {
            db().modify( *_manager, [&op]( collection_manager_object& obj ) {
               if( op.new_accepted_token.valid() )
                  obj.accepted_token = *op.new_accepted_token;
               if( op.new_committee.valid() )
                  obj.committee = *op.new_committee;
               if( op.new_fees_collector.valid() )
                  obj.fees_collector = *op.new_fees_collector;
               if( op.new_price_per_item.valid() )
                  obj.price_per_item = *op.new_price_per_item;
            });
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result manager_create_collection_evaluator::do_evaluate(const manager_create_collection_operation &op) {
         try {
            const database& d = db();
            _manager = &d.get_collection_manager( op.manager );

            // Verify the existence of the forwarder and the factory
            d.get_forwarder( op.forwarder );
            d.get_proxy_factory( op.factory );

            // The accepted token is only needed when there is a fee to charge
            _fee = _manager->price_per_item * op.items.size();
            if( _fee > 0 )
               _accepted_token = &d.get_fungible_token( _manager->accepted_token );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      address manager_create_collection_evaluator::do_apply(const manager_create_collection_operation &op) {
         try {
            database& d = db();

            if( _fee > 0 )
               d.fungible_transfer_from( *_accepted_token, op.manager, op.caller, _manager->fees_collector, _fee );

            collection_init_data init;
            init.name = op.name;
            init.symbol = op.symbol;
            init.creator = op.creator;
            init.should_complete = true;
            init.base_uri = op.base_uri;
            init.proof_of_creation = derive_creation_proof( op.salt, op.forwarder );
            init.items = op.items;

            factory_create_collection_operation create_op;
            create_op.factory = op.factory;
            create_op.salt = op.salt;
            create_op.init = init;

            forwarder_forward_call_operation relay;
            relay.caller = op.manager;
            relay.forwarder = op.forwarder;
            relay.call = create_op;
            const operation_result created = d.apply_operation( relay );
            const address collection = created.get<address>();

            // The collection waits for the committee's approval
            collection_set_approved_operation reject_op;
            reject_op.collection = collection;
            reject_op.value = false;

            relay.call = reject_op;
            d.apply_operation( relay );

            return collection;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result manager_manage_collection_evaluator::do_evaluate(const manager_manage_collection_operation &op) {
         try {
            const database& d = db();
            _manager = &d.get_collection_manager( op.manager );

            NFTCORE_ASSERT( op.caller == _manager->committee, unauthorized_sender_exception,
                            "Only the committee may manage collections (UNAUTHORIZED_SENDER)",
                            ("caller", op.caller)("committee", _manager->committee) );

            const address target = forwardable_target( op.call );
            NFTCORE_ASSERT( d.find_collection( target ) != nullptr, invalid_collection_exception,
                            "${t} is not a collection (INVALID_COLLECTION)", ("t", target) );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      operation_result manager_manage_collection_evaluator::do_apply(const manager_manage_collection_operation &op) {
         try {
            forwarder_forward_call_operation relay;
            relay.caller = op.manager;
            relay.forwarder = op.forwarder;
            relay.call = op.call;
            return db().apply_operation( relay );
         } FC_CAPTURE_AND_RETHROW((op))
      }
   }
} // nftcore::chain
