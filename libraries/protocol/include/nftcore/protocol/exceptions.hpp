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

#include <fc/exception/exception.hpp>

#define NFTCORE_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                           \
      if( !(expr) )                                                   \
         FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );         \
   FC_MULTILINE_MACRO_END

namespace nftcore {
   namespace protocol {
      FC_DECLARE_EXCEPTION( protocol_exception, 4000000 )

      /// Malformed input, detected before any state is read
      FC_DECLARE_DERIVED_EXCEPTION( validation_exception, protocol_exception, 4010000 )
      FC_DECLARE_DERIVED_EXCEPTION( length_mismatch_exception,               validation_exception, 4010001 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_item_id_exception,               validation_exception, 4010002 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_issued_id_exception,             validation_exception, 4010003 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_rarity_exception,                validation_exception, 4010004 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_item_supply_exception,           validation_exception, 4010005 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_price_and_beneficiary_exception, validation_exception, 4010006 )
      FC_DECLARE_DERIVED_EXCEPTION( empty_metadata_exception,                validation_exception, 4010007 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_content_hash_exception,          validation_exception, 4010008 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_address_exception,               validation_exception, 4010009 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_creator_address_exception,       invalid_address_exception, 4010010 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_minter_address_exception,        invalid_address_exception, 4010011 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_manager_address_exception,       invalid_address_exception, 4010012 )

      /// The target is not in a state that admits the call
      FC_DECLARE_DERIVED_EXCEPTION( state_exception, protocol_exception, 4020000 )
      FC_DECLARE_DERIVED_EXCEPTION( item_does_not_exist_exception,           state_exception, 4020001 )
      FC_DECLARE_DERIVED_EXCEPTION( already_initialized_exception,           state_exception, 4020002 )
      FC_DECLARE_DERIVED_EXCEPTION( not_initialized_exception,               state_exception, 4020003 )
      FC_DECLARE_DERIVED_EXCEPTION( already_completed_exception,             state_exception, 4020004 )
      FC_DECLARE_DERIVED_EXCEPTION( value_is_the_same_exception,             state_exception, 4020005 )
      FC_DECLARE_DERIVED_EXCEPTION( not_editable_exception,                  state_exception, 4020006 )
      FC_DECLARE_DERIVED_EXCEPTION( not_approved_exception,                  state_exception, 4020007 )
      FC_DECLARE_DERIVED_EXCEPTION( not_completed_exception,                 state_exception, 4020008 )
      FC_DECLARE_DERIVED_EXCEPTION( in_grace_period_exception,               state_exception, 4020009 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_token_id_exception,              state_exception, 4020010 )

      /// The caller lacks the role the call requires
      FC_DECLARE_DERIVED_EXCEPTION( authorization_exception, protocol_exception, 4030000 )
      FC_DECLARE_DERIVED_EXCEPTION( caller_is_not_owner_exception,              authorization_exception, 4030001 )
      FC_DECLARE_DERIVED_EXCEPTION( caller_is_not_creator_exception,            authorization_exception, 4030002 )
      FC_DECLARE_DERIVED_EXCEPTION( caller_is_not_owner_or_creator_exception,   authorization_exception, 4030003 )
      FC_DECLARE_DERIVED_EXCEPTION( caller_is_not_creator_or_manager_exception, authorization_exception, 4030004 )
      FC_DECLARE_DERIVED_EXCEPTION( caller_can_not_mint_exception,              authorization_exception, 4030005 )
      FC_DECLARE_DERIVED_EXCEPTION( unauthorized_sender_exception,              authorization_exception, 4030006 )

      /// An item has reached its maximum supply
      FC_DECLARE_DERIVED_EXCEPTION( item_exhausted_exception, protocol_exception, 4040000 )

      /// Contract deployment and cross-contract calls
      FC_DECLARE_DERIVED_EXCEPTION( addressing_exception, protocol_exception, 4050000 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_implementation_exception,        addressing_exception, 4050001 )
      FC_DECLARE_DERIVED_EXCEPTION( creation_failed_exception,               addressing_exception, 4050002 )
      FC_DECLARE_DERIVED_EXCEPTION( call_failed_exception,                   addressing_exception, 4050003 )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_collection_exception,            addressing_exception, 4050004 )
      FC_DECLARE_DERIVED_EXCEPTION( unknown_contract_exception,              addressing_exception, 4050005 )

      /// Ownership ledger rules
      FC_DECLARE_DERIVED_EXCEPTION( ledger_exception, protocol_exception, 4060000 )
      FC_DECLARE_DERIVED_EXCEPTION( mint_to_zero_address_exception,          ledger_exception, 4060001 )
      FC_DECLARE_DERIVED_EXCEPTION( transfer_to_zero_address_exception,      ledger_exception, 4060002 )
      FC_DECLARE_DERIVED_EXCEPTION( transfer_not_owner_nor_approved_exception, ledger_exception, 4060003 )
      FC_DECLARE_DERIVED_EXCEPTION( transfer_of_token_not_own_exception,     ledger_exception, 4060004 )
      FC_DECLARE_DERIVED_EXCEPTION( approval_to_current_owner_exception,     ledger_exception, 4060005 )
      FC_DECLARE_DERIVED_EXCEPTION( approve_not_owner_nor_operator_exception, ledger_exception, 4060006 )
      FC_DECLARE_DERIVED_EXCEPTION( approve_to_caller_exception,             ledger_exception, 4060007 )
      FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance_exception,          ledger_exception, 4060008 )
      FC_DECLARE_DERIVED_EXCEPTION( insufficient_allowance_exception,        ledger_exception, 4060009 )
   }
} // nftcore::protocol
