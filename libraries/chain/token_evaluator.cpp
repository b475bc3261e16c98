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
#include <nftcore/chain/token_evaluator.hpp>
#include <nftcore/chain/database.hpp>

namespace nftcore { namespace chain {

namespace {
   // Checks shared by single and batch transfers, against the current owner of the token
   void verify_transfer( const database& d, const collection_token_object& token,
                         const address& caller, const address& from )
   {
      NFTCORE_ASSERT( d.is_approved_or_owner( token, caller ), transfer_not_owner_nor_approved_exception,
                      "ERC721: transfer caller is not owner nor approved",
                      ("caller",caller)("token_id",token.token_id) );
      NFTCORE_ASSERT( token.owner == from, transfer_of_token_not_own_exception,
                      "ERC721: transfer of token that is not own",
                      ("from",from)("owner",token.owner)("token_id",token.token_id) );
   }
}

void_result token_transfer_evaluator::do_evaluate( const token_transfer_operation& op )
{ try {
   const database& d = db();

   d.get_collection( op.collection );
   _token = &d.get_token( op.collection, op.token_id );
   verify_transfer( d, *_token, op.caller, op.from );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_transfer_evaluator::do_apply( const token_transfer_operation& op )
{ try {
   db().transfer_token( *_token, op.to );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_batch_transfer_evaluator::do_evaluate( const token_batch_transfer_operation& op )
{ try {
   db().get_collection( op.collection );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_batch_transfer_evaluator::do_apply( const token_batch_transfer_operation& op )
{ try {
   database& d = db();

   // Each transfer sees the effects of the previous ones
   for( const token_id_type& token_id : op.token_ids )
   {
      const collection_token_object& token = d.get_token( op.collection, token_id );
      verify_transfer( d, token, op.caller, op.from );
      d.transfer_token( token, op.to );
   }
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_approve_evaluator::do_evaluate( const token_approve_operation& op )
{ try {
   const database& d = db();

   _token = &d.get_token( op.collection, op.token_id );

   NFTCORE_ASSERT( op.approved != _token->owner, approval_to_current_owner_exception,
                   "ERC721: approval to current owner", ("approved",op.approved) );
   NFTCORE_ASSERT( op.caller == _token->owner || d.is_approved_for_all( op.collection, _token->owner, op.caller ),
                   approve_not_owner_nor_operator_exception,
                   "ERC721: approve caller is not owner nor approved for all",
                   ("caller",op.caller)("owner",_token->owner) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_approve_evaluator::do_apply( const token_approve_operation& op )
{ try {
   db().set_token_approval( *_token, op.approved );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_set_approval_for_all_evaluator::do_evaluate( const token_set_approval_for_all_operation& op )
{ try {
   db().get_collection( op.collection );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_set_approval_for_all_evaluator::do_apply( const token_set_approval_for_all_operation& op )
{ try {
   db().set_approval_for_all( op.collection, op.caller, op.operator_, op.approved );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // nftcore::chain
