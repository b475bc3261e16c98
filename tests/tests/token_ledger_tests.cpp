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
#include <boost/test/unit_test.hpp>

#include <nftcore/chain/database.hpp>
#include <nftcore/chain/collection_object.hpp>
#include <nftcore/protocol/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace nftcore::chain;
using namespace nftcore::chain::test;

BOOST_FIXTURE_TEST_SUITE( token_ledger_tests, database_fixture )

/**
 * Issuance requires approval, then completion, then the end of the grace period, checked in that order
 */
BOOST_AUTO_TEST_CASE( issuance_preconditions ) {
   try {
      ACTORS((alice)(carol)(bob));
      const address collection = create_collection( alice, carol, make_items( collection_rarity::rare, 1 ) );

      set_approved( alice, collection, false );
      REQUIRE_EXCEPTION_WITH_TEXT( issue_token( carol, collection, bob, 0 ), "NOT_APPROVED" );
      NFTCORE_REQUIRE_THROW( issue_token( carol, collection, bob, 0 ), not_approved_exception );

      set_approved( alice, collection, true );
      REQUIRE_EXCEPTION_WITH_TEXT( issue_token( carol, collection, bob, 0 ), "NOT_COMPLETED" );

      complete_collection( carol, collection );
      BOOST_CHECK( !db.is_minting_allowed( collection ) );
      REQUIRE_EXCEPTION_WITH_TEXT( issue_token( carol, collection, bob, 0 ), "IN_GRACE_PERIOD" );

      advance_time( NFTCORE_COLLECTION_GRACE_PERIOD - 1 );
      NFTCORE_REQUIRE_THROW( issue_token( carol, collection, bob, 0 ), in_grace_period_exception );

      BOOST_TEST_MESSAGE("Issuance opens exactly at the end of the grace period");
      advance_time( 1 );
      BOOST_CHECK( db.is_minting_allowed( collection ) );
      const token_id_type token_id = issue_token( carol, collection, bob, 0 );
      BOOST_CHECK( token_id == encode_token_id( 0, 1 ) );
      BOOST_CHECK( db.owner_of( collection, token_id ) == bob );

      BOOST_TEST_MESSAGE("Revoking the approval stops issuance again");
      set_approved( alice, collection, false );
      REQUIRE_EXCEPTION_WITH_TEXT( issue_token( carol, collection, bob, 0 ), "NOT_APPROVED" );
      BOOST_CHECK_EQUAL( db.total_supply( collection ), 1u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( issuance_exhausts_item ) {
   try {
      ACTORS((alice)(carol)(bob));
      const address collection = create_mintable_collection( alice, carol,
                                                             { make_item( collection_rarity::rare ),
                                                               make_item( collection_rarity::mythic ) } );

      for( uint64_t i = 1; i <= 5; ++i ) {
         const token_id_type token_id = issue_token( carol, collection, bob, 1 );
         const token_id_parts parts = decode_token_id( token_id );
         BOOST_CHECK_EQUAL( parts.item_id, 1u );
         BOOST_CHECK( parts.issued_id == i );

         const auto issued = get_applied<token_issued_operation>();
         BOOST_REQUIRE_EQUAL( issued.size(), 1u );
         BOOST_CHECK( issued[0].token_id == token_id );
         BOOST_CHECK( issued[0].beneficiary == bob );
         BOOST_CHECK( issued[0].caller == carol );
         BOOST_CHECK_EQUAL( issued[0].item_id, 1u );
      }
      BOOST_CHECK_EQUAL( db.get_item( collection, 1 ).total_supply, 5u );
      BOOST_CHECK( db.get_item( collection, 1 ).is_exhausted() );

      REQUIRE_EXCEPTION_WITH_TEXT( issue_token( carol, collection, bob, 1 ), "ITEM_EXHAUSTED" );
      NFTCORE_REQUIRE_THROW( issue_token( carol, collection, bob, 1 ), item_exhausted_exception );
      BOOST_CHECK_EQUAL( db.get_item( collection, 1 ).total_supply, 5u );
      BOOST_CHECK_EQUAL( db.balance_of( collection, bob ), 5u );

      // Other items are unaffected
      BOOST_CHECK( issue_token( carol, collection, bob, 0 ) == encode_token_id( 0, 1 ) );

      REQUIRE_EXCEPTION_WITH_TEXT( issue_token( carol, collection, bob, 2 ), "ITEM_DOES_NOT_EXIST" );
      REQUIRE_EXCEPTION_WITH_TEXT( issue_token( carol, collection, address(), 0 ), "ERC721: mint to the zero address" );
   } FC_LOG_AND_RETHROW()
}

/**
 * Per-item minters draw on their allowance; creators and collection-wide minters do not
 */
BOOST_AUTO_TEST_CASE( issuance_minter_allowances ) {
   try {
      ACTORS((alice)(carol)(bob)(dave)(erin)(mallory));
      const address collection = create_collection( alice, carol, make_items( collection_rarity::rare, 2 ), true );
      set_item_minter( carol, collection, 0, bob, minter_allowance( 2 ) );
      set_item_minter( carol, collection, 1, erin, minter_allowance::unlimited() );

      collection_set_minters_operation minters_op;
      minters_op.caller = carol;
      minters_op.collection = collection;
      minters_op.minters = { dave };
      minters_op.values = { true };
      push( minters_op );
      pass_grace_period();

      BOOST_TEST_MESSAGE("Bob spends his allowance on item 0");
      issue_token( bob, collection, bob, 0 );
      BOOST_CHECK( db.get_item_minter_allowance( collection, 0, bob ) == minter_allowance( 1 ) );
      issue_token( bob, collection, mallory, 0 );
      BOOST_CHECK( db.get_item_minter_allowance( collection, 0, bob ) == minter_allowance( 0 ) );
      REQUIRE_EXCEPTION_WITH_TEXT( issue_token( bob, collection, bob, 0 ), "CALLER_CAN_NOT_MINT" );
      NFTCORE_REQUIRE_THROW( issue_token( bob, collection, bob, 1 ), caller_can_not_mint_exception );

      BOOST_TEST_MESSAGE("Unlimited allowances are never spent");
      for( int i = 0; i < 3; ++i )
         issue_token( erin, collection, erin, 1 );
      BOOST_CHECK( db.get_item_minter_allowance( collection, 1, erin ).is_unlimited() );
      NFTCORE_REQUIRE_THROW( issue_token( erin, collection, erin, 0 ), caller_can_not_mint_exception );

      BOOST_TEST_MESSAGE("Collection-wide minters and the creator mint any item");
      issue_token( dave, collection, dave, 0 );
      issue_token( dave, collection, dave, 1 );
      issue_token( carol, collection, carol, 0 );
      BOOST_CHECK( db.get_item( collection, 0 ).minters.size() == 1u );
      BOOST_CHECK( db.get_item_minter_allowance( collection, 0, dave ) == minter_allowance() );

      NFTCORE_REQUIRE_THROW( issue_token( mallory, collection, mallory, 0 ), caller_can_not_mint_exception );
      // The owner has no minting rights of its own
      NFTCORE_REQUIRE_THROW( issue_token( alice, collection, alice, 0 ), caller_can_not_mint_exception );

      BOOST_CHECK_EQUAL( db.get_item( collection, 0 ).total_supply, 4u );
      BOOST_CHECK_EQUAL( db.get_item( collection, 1 ).total_supply, 4u );
      BOOST_CHECK_EQUAL( db.total_supply( collection ), 8u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( issuance_batch ) {
   try {
      ACTORS((alice)(carol)(bob)(dave));
      const address collection = create_mintable_collection( alice, carol,
                                                             { make_item( collection_rarity::common, "ipfs://0" ),
                                                               make_item( collection_rarity::common, "ipfs://1" ),
                                                               make_item( collection_rarity::unique, "ipfs://2" ) } );

      vector<address> beneficiaries;
      vector<uint64_t> item_ids;
      for( size_t i = 0; i < 70; ++i ) {
         beneficiaries.push_back( i % 2 ? bob : dave );
         item_ids.push_back( i % 2 );
      }

      const vector<token_id_type> token_ids = issue_tokens( carol, collection, beneficiaries, item_ids );
      BOOST_REQUIRE_EQUAL( token_ids.size(), 70u );
      BOOST_CHECK_EQUAL( count_applied<token_issued_operation>(), 70u );
      BOOST_CHECK( token_ids[0] == encode_token_id( 0, 1 ) );
      BOOST_CHECK( token_ids[1] == encode_token_id( 1, 1 ) );
      BOOST_CHECK( token_ids[69] == encode_token_id( 1, 35 ) );
      BOOST_CHECK_EQUAL( db.total_supply( collection ), 70u );
      BOOST_CHECK_EQUAL( db.get_item( collection, 0 ).total_supply, 35u );
      BOOST_CHECK_EQUAL( db.balance_of( collection, bob ), 35u );
      BOOST_CHECK_EQUAL( db.balance_of( collection, dave ), 35u );

      BOOST_TEST_MESSAGE("A failing entry rejects the whole batch");
      REQUIRE_EXCEPTION_WITH_TEXT( issue_tokens( carol, collection, { bob, bob, bob }, { 0, 2, 2 } ), "ITEM_EXHAUSTED" );
      REQUIRE_EXCEPTION_WITH_TEXT( issue_tokens( carol, collection, { bob, bob }, { 0, 5 } ), "ITEM_DOES_NOT_EXIST" );
      REQUIRE_EXCEPTION_WITH_TEXT( issue_tokens( carol, collection, { bob, address() }, { 0, 0 } ),
                                   "ERC721: mint to the zero address" );
      REQUIRE_EXCEPTION_WITH_TEXT( issue_tokens( carol, collection, { bob }, { 0, 0 } ), "LENGTH_MISMATCH" );
      BOOST_CHECK_EQUAL( db.total_supply( collection ), 70u );
      BOOST_CHECK_EQUAL( db.get_item( collection, 0 ).total_supply, 35u );
      BOOST_CHECK_EQUAL( db.get_item( collection, 2 ).total_supply, 0u );
      BOOST_CHECK( db.find_token( collection, encode_token_id( 0, 36 ) ) == nullptr );

      // Identifiers continue where the last successful issuance stopped
      BOOST_CHECK( issue_token( carol, collection, bob, 0 ) == encode_token_id( 0, 36 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( token_transfers_and_approvals ) {
   try {
      ACTORS((alice)(carol)(bob)(dave)(erin)(mallory));
      const address collection = create_mintable_collection( alice, carol, make_items( collection_rarity::rare, 1 ) );
      const token_id_type t1 = issue_token( carol, collection, bob, 0 );
      const token_id_type t2 = issue_token( carol, collection, bob, 0 );

      BOOST_TEST_MESSAGE("Bob transfers his own token");
      transfer_token( bob, collection, bob, dave, t1 );
      BOOST_CHECK( db.owner_of( collection, t1 ) == dave );
      const auto moved = get_applied<token_transferred_operation>();
      BOOST_REQUIRE_EQUAL( moved.size(), 1u );
      BOOST_CHECK( moved[0].from == bob );
      BOOST_CHECK( moved[0].to == dave );

      REQUIRE_EXCEPTION_WITH_TEXT( transfer_token( mallory, collection, dave, mallory, t1 ),
                                   "ERC721: transfer caller is not owner nor approved" );
      REQUIRE_EXCEPTION_WITH_TEXT( transfer_token( dave, collection, bob, mallory, t1 ),
                                   "ERC721: transfer of token that is not own" );
      REQUIRE_EXCEPTION_WITH_TEXT( transfer_token( dave, collection, dave, address(), t1 ),
                                   "ERC721: transfer to the zero address" );
      NFTCORE_REQUIRE_THROW( transfer_token( dave, collection, dave, bob, encode_token_id( 0, 99 ) ),
                             invalid_token_id_exception );

      BOOST_TEST_MESSAGE("Single-token approvals are cleared by a transfer");
      token_approve_operation approve_op;
      approve_op.caller = bob;
      approve_op.collection = collection;
      approve_op.approved = bob;
      approve_op.token_id = t2;
      REQUIRE_EXCEPTION_WITH_TEXT( push( approve_op ), "ERC721: approval to current owner" );
      approve_op.caller = mallory;
      approve_op.approved = mallory;
      REQUIRE_EXCEPTION_WITH_TEXT( push( approve_op ), "ERC721: approve caller is not owner nor approved for all" );
      approve_op.caller = bob;
      approve_op.approved = erin;
      push( approve_op );
      BOOST_CHECK( db.get_approved( collection, t2 ) == erin );

      transfer_token( erin, collection, bob, erin, t2 );
      BOOST_CHECK( db.owner_of( collection, t2 ) == erin );
      BOOST_CHECK( db.get_approved( collection, t2 ).is_zero() );

      BOOST_TEST_MESSAGE("Operators act for every token of the owner");
      token_set_approval_for_all_operation operator_op;
      operator_op.caller = dave;
      operator_op.collection = collection;
      operator_op.operator_ = dave;
      operator_op.approved = true;
      REQUIRE_EXCEPTION_WITH_TEXT( push( operator_op ), "ERC721: approve to caller" );
      operator_op.operator_ = mallory;
      push( operator_op );
      BOOST_CHECK( db.is_approved_for_all( collection, dave, mallory ) );

      // An operator may grant single-token approvals on behalf of the owner
      approve_op.caller = mallory;
      approve_op.approved = bob;
      approve_op.token_id = t1;
      push( approve_op );
      BOOST_CHECK( db.get_approved( collection, t1 ) == bob );

      transfer_token( mallory, collection, dave, mallory, t1 );
      BOOST_CHECK( db.owner_of( collection, t1 ) == mallory );

      operator_op.approved = false;
      push( operator_op );
      BOOST_CHECK( !db.is_approved_for_all( collection, dave, mallory ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( token_batch_transfer ) {
   try {
      ACTORS((alice)(carol)(bob)(dave));
      const address collection = create_mintable_collection( alice, carol, make_items( collection_rarity::rare, 1 ) );
      const vector<token_id_type> ids = issue_tokens( carol, collection, { bob, bob, bob, dave }, { 0, 0, 0, 0 } );

      token_batch_transfer_operation op;
      op.caller = bob;
      op.collection = collection;
      op.from = bob;
      op.to = dave;
      op.token_ids = { ids[0], ids[1], ids[3] };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "ERC721: transfer caller is not owner nor approved" );
      BOOST_CHECK( db.owner_of( collection, ids[0] ) == bob );
      BOOST_CHECK_EQUAL( db.balance_of( collection, bob ), 3u );

      // A token listed twice fails on its second transfer
      op.token_ids = { ids[0], ids[0] };
      NFTCORE_REQUIRE_THROW( push( op ), transfer_not_owner_nor_approved_exception );

      op.token_ids = { ids[0], ids[2] };
      push( op );
      BOOST_CHECK_EQUAL( count_applied<token_transferred_operation>(), 2u );
      BOOST_CHECK_EQUAL( db.balance_of( collection, bob ), 1u );
      BOOST_CHECK_EQUAL( db.balance_of( collection, dave ), 3u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( token_enumeration_and_uri ) {
   try {
      ACTORS((alice)(carol)(bob)(dave));
      const address collection = create_mintable_collection( alice, carol, make_items( collection_rarity::rare, 2 ) );
      const vector<token_id_type> ids = issue_tokens( carol, collection, { bob, dave, bob }, { 1, 0, 0 } );

      BOOST_CHECK_EQUAL( db.total_supply( collection ), 3u );
      BOOST_CHECK( db.token_by_index( collection, 0 ) == ids[0] );
      BOOST_CHECK( db.token_by_index( collection, 1 ) == ids[1] );
      BOOST_CHECK( db.token_by_index( collection, 2 ) == ids[2] );
      NFTCORE_REQUIRE_THROW( db.token_by_index( collection, 3 ), fc::exception );

      // Tokens of an owner are listed in ascending token id
      BOOST_CHECK_EQUAL( db.balance_of( collection, bob ), 2u );
      BOOST_CHECK( db.token_of_owner_by_index( collection, bob, 0 ) == encode_token_id( 0, 2 ) );
      BOOST_CHECK( db.token_of_owner_by_index( collection, bob, 1 ) == encode_token_id( 1, 1 ) );
      NFTCORE_REQUIRE_THROW( db.token_of_owner_by_index( collection, bob, 2 ), fc::exception );
      NFTCORE_REQUIRE_THROW( db.balance_of( collection, address() ), fc::exception );

      BOOST_CHECK_EQUAL( db.token_uri( collection, ids[0] ),
                         "https://nft.example/1/" + collection.to_string() + "/1/1" );
      BOOST_CHECK_EQUAL( db.token_uri( collection, ids[2] ),
                         "https://nft.example/1/" + collection.to_string() + "/0/2" );
      NFTCORE_REQUIRE_THROW( db.token_uri( collection, encode_token_id( 1, 2 ) ), invalid_token_id_exception );

      collection_set_base_uri_operation uri_op;
      uri_op.caller = alice;
      uri_op.collection = collection;
      uri_op.base_uri = "ipfs://base/";
      push( uri_op );
      BOOST_CHECK_EQUAL( db.token_uri( collection, ids[1] ),
                         "ipfs://base/1/" + collection.to_string() + "/0/1" );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
