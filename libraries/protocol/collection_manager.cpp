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
#include <nftcore/protocol/collection_manager.hpp>
#include <nftcore/protocol/exceptions.hpp>

namespace nftcore {
   namespace protocol {
      namespace {
         struct forwardable_target_visitor {
            typedef address result_type;

            template<typename Op>
            address operator()( const Op& op )const { return op.collection; }

            address operator()( const contract_transfer_ownership_operation& op )const { return op.contract; }
            address operator()( const factory_create_collection_operation& op )const { return op.factory; }
         };

         void validate_settings_address( const address& a, const char* reason ) {
            NFTCORE_ASSERT( !a.is_zero(), invalid_address_exception,
                            "The address may not be zero (${reason})", ("reason", reason) );
         }
      }

      address forwardable_target( const forwardable_operation& call ) {
         return call.visit( forwardable_target_visitor() );
      }

      void fungible_token_create_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         FC_ASSERT( !symbol.empty(), "A token symbol should not be empty" );
      }

      void fungible_token_transfer_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         NFTCORE_ASSERT( !to.is_zero(), invalid_address_exception,
                         "ERC20: transfer to the zero address", ("to", to) );
      }

      void fungible_token_approve_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         NFTCORE_ASSERT( !spender.is_zero(), invalid_address_exception,
                         "ERC20: approve to the zero address", ("spender", spender) );
      }

      void forwarder_create_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         NFTCORE_ASSERT( !owner.is_zero(), invalid_address_exception,
                         "Ownable: new owner is the zero address", ("owner", owner) );
         validate_settings_address( forward_caller, "INVALID_FORWARD_CALLER" );
      }

      void forwarder_forward_call_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         FC_ASSERT( !forwarder.is_zero(), "The forwarder may not be the zero address" );
      }

      void collection_manager_create_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         NFTCORE_ASSERT( !owner.is_zero(), invalid_address_exception,
                         "Ownable: new owner is the zero address", ("owner", owner) );
         validate_settings_address( accepted_token, "INVALID_ACCEPTED_TOKEN" );
         validate_settings_address( committee, "INVALID_COMMITTEE" );
         validate_settings_address( fees_collector, "INVALID_FEES_COLLECTOR" );
      }

      void collection_manager_update_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         FC_ASSERT( new_accepted_token.valid() || new_committee.valid() ||
                    new_fees_collector.valid() || new_price_per_item.valid(),
                    "Nothing to update" );
         if( new_accepted_token.valid() )
            validate_settings_address( *new_accepted_token, "INVALID_ACCEPTED_TOKEN" );
         if( new_committee.valid() )
            validate_settings_address( *new_committee, "INVALID_COMMITTEE" );
         if( new_fees_collector.valid() )
            validate_settings_address( *new_fees_collector, "INVALID_FEES_COLLECTOR" );
      }

      void manager_create_collection_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         for( const collection_item& item : items )
            item.validate();
      }

      void manager_manage_collection_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
      }
   }
} // nftcore::protocol
