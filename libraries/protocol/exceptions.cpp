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
#include <nftcore/protocol/exceptions.hpp>

namespace nftcore {
   namespace protocol {
      FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

      FC_IMPLEMENT_DERIVED_EXCEPTION( validation_exception, protocol_exception, 4010000, "invalid operation" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( length_mismatch_exception, validation_exception, 4010001, "length mismatch" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_item_id_exception, validation_exception, 4010002, "invalid item id" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_issued_id_exception, validation_exception, 4010003, "invalid issued id" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_rarity_exception, validation_exception, 4010004, "invalid rarity" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_item_supply_exception, validation_exception, 4010005, "item total supply should start at zero" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_price_and_beneficiary_exception, validation_exception, 4010006, "invalid price and beneficiary" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( empty_metadata_exception, validation_exception, 4010007, "empty metadata" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_content_hash_exception, validation_exception, 4010008, "content hash should start empty" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_address_exception, validation_exception, 4010009, "invalid address" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_creator_address_exception, invalid_address_exception, 4010010, "invalid creator address" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_minter_address_exception, invalid_address_exception, 4010011, "invalid minter address" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_manager_address_exception, invalid_address_exception, 4010012, "invalid manager address" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( state_exception, protocol_exception, 4020000, "invalid state" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( item_does_not_exist_exception, state_exception, 4020001, "item does not exist" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( already_initialized_exception, state_exception, 4020002, "already initialized" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( not_initialized_exception, state_exception, 4020003, "not initialized" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( already_completed_exception, state_exception, 4020004, "collection already completed" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( value_is_the_same_exception, state_exception, 4020005, "value is the same" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( not_editable_exception, state_exception, 4020006, "not editable" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( not_approved_exception, state_exception, 4020007, "not approved" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( not_completed_exception, state_exception, 4020008, "not completed" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( in_grace_period_exception, state_exception, 4020009, "in grace period" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_token_id_exception, state_exception, 4020010, "invalid token id" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( authorization_exception, protocol_exception, 4030000, "unauthorized caller" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( caller_is_not_owner_exception, authorization_exception, 4030001, "caller is not the owner" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( caller_is_not_creator_exception, authorization_exception, 4030002, "caller is not creator" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( caller_is_not_owner_or_creator_exception, authorization_exception, 4030003, "caller is not owner or creator" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( caller_is_not_creator_or_manager_exception, authorization_exception, 4030004, "caller is not creator or manager" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( caller_can_not_mint_exception, authorization_exception, 4030005, "caller can not mint" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_sender_exception, authorization_exception, 4030006, "unauthorized sender" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( item_exhausted_exception, protocol_exception, 4040000, "item exhausted" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( addressing_exception, protocol_exception, 4050000, "contract addressing failure" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_implementation_exception, addressing_exception, 4050001, "invalid implementation" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( creation_failed_exception, addressing_exception, 4050002, "creation failed" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( call_failed_exception, addressing_exception, 4050003, "call failed" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_collection_exception, addressing_exception, 4050004, "invalid collection" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_contract_exception, addressing_exception, 4050005, "no contract at address" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( ledger_exception, protocol_exception, 4060000, "token ledger failure" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( mint_to_zero_address_exception, ledger_exception, 4060001, "mint to the zero address" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( transfer_to_zero_address_exception, ledger_exception, 4060002, "transfer to the zero address" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( transfer_not_owner_nor_approved_exception, ledger_exception, 4060003, "transfer caller is not owner nor approved" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( transfer_of_token_not_own_exception, ledger_exception, 4060004, "transfer of token that is not own" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( approval_to_current_owner_exception, ledger_exception, 4060005, "approval to current owner" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( approve_not_owner_nor_operator_exception, ledger_exception, 4060006, "approve caller is not owner nor approved for all" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( approve_to_caller_exception, ledger_exception, 4060007, "approve to caller" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance_exception, ledger_exception, 4060008, "transfer amount exceeds balance" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_allowance_exception, ledger_exception, 4060009, "transfer amount exceeds allowance" )
   }
} // nftcore::protocol
