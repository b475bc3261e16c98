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

BOOST_FIXTURE_TEST_SUITE( collection_tests, database_fixture )

/**
 * Deploy a collection, initialize it and check its settings
 */
BOOST_AUTO_TEST_CASE( collection_initialization ) {
   try {
      ACTORS((alice)(carol)(mallory));

      BOOST_TEST_MESSAGE("Alice deploys a collection");
      const address collection = deploy_collection( alice );
      {
         const collection_object& c = db.get_collection( collection );
         BOOST_CHECK( !c.is_initialized() );
         BOOST_CHECK( c.creator.is_zero() );
         BOOST_CHECK( db.get_contract( collection ).deployer == alice );
      }

      // Items may not be added before the collection is initialized
      collection_add_items_operation add_op;
      add_op.caller = carol;
      add_op.collection = collection;
      add_op.items = { make_item( collection_rarity::rare ) };
      NFTCORE_REQUIRE_THROW( push( add_op ), not_initialized_exception );

      BOOST_TEST_MESSAGE("Alice initializes the collection with Carol as its creator");
      vector<collection_item> items = { make_item( collection_rarity::common, "ipfs://a" ),
                                        make_item( collection_rarity::mythic, "ipfs://b" ),
                                        make_item( collection_rarity::unique, "ipfs://c", 100, alice ) };
      initialize_collection( alice, collection, make_init_data( carol, items, false ) );
      BOOST_CHECK_EQUAL( count_applied<item_added_operation>(), 3u );
      BOOST_CHECK_EQUAL( count_applied<ownership_transferred_operation>(), 1u );
      BOOST_CHECK_EQUAL( count_applied<collection_completed_operation>(), 0u );

      const collection_object& c = db.get_collection( collection );
      BOOST_CHECK( c.is_initialized() );
      BOOST_CHECK( !c.is_completed() );
      BOOST_CHECK( c.approved );
      BOOST_CHECK( c.editable );
      BOOST_CHECK( c.creator == carol );
      BOOST_CHECK_EQUAL( c.name, "Test Collection" );
      BOOST_CHECK_EQUAL( c.symbol, "TEST" );
      BOOST_CHECK_EQUAL( c.items_count, 3u );
      BOOST_CHECK( db.get_owner( collection ) == alice );

      BOOST_TEST_MESSAGE("Verifying the maximum supply of each item");
      BOOST_CHECK_EQUAL( db.get_item( collection, 0 ).max_supply, 100000u );
      BOOST_CHECK_EQUAL( db.get_item( collection, 1 ).max_supply, 5u );
      BOOST_CHECK_EQUAL( db.get_item( collection, 2 ).max_supply, 1u );
      BOOST_CHECK( db.get_item( collection, 2 ).beneficiary == alice );
      BOOST_CHECK( db.get_item( collection, 2 ).price == 100 );

      const vector<collection_item> stored = db.get_items( collection );
      BOOST_REQUIRE_EQUAL( stored.size(), 3u );
      BOOST_CHECK_EQUAL( stored[1].metadata, "ipfs://b" );
      BOOST_CHECK_EQUAL( stored[1].total_supply, 0u );

      BOOST_TEST_MESSAGE("Mallory attempts to initialize the collection again");
      REQUIRE_EXCEPTION_WITH_TEXT( initialize_collection( mallory, collection, make_init_data( mallory, {}, true ) ),
                                   "ALREADY_INITIALIZED" );
      BOOST_CHECK( db.get_owner( collection ) == alice );
      BOOST_CHECK( db.get_collection( collection ).creator == carol );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( collection_initialization_invalid ) {
   try {
      ACTORS((alice));
      const address collection = deploy_collection( alice );

      // A creator is required
      REQUIRE_EXCEPTION_WITH_TEXT( initialize_collection( alice, collection, make_init_data( address(), {}, false ) ),
                                   "INVALID_CREATOR_ADDRESS" );

      // Every item is validated
      vector<collection_item> items = { make_item( collection_rarity::rare ), make_item( collection_rarity::rare, "" ) };
      REQUIRE_EXCEPTION_WITH_TEXT( initialize_collection( alice, collection, make_init_data( alice, items, false ) ),
                                   "EMPTY_METADATA" );

      items = { make_item( collection_rarity::rare, "ipfs://x", 0, alice ) };
      REQUIRE_EXCEPTION_WITH_TEXT( initialize_collection( alice, collection, make_init_data( alice, items, false ) ),
                                   "INVALID_PRICE_AND_BENEFICIARY" );

      items = { make_item( collection_rarity::rare ) };
      items[0].rarity = rarity_count;
      NFTCORE_REQUIRE_THROW( initialize_collection( alice, collection, make_init_data( alice, items, false ) ),
                             invalid_rarity_exception );

      // Nothing was applied
      BOOST_CHECK( !db.get_collection( collection ).is_initialized() );
      BOOST_CHECK( db.find_item( collection, 0 ) == nullptr );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( collection_initialized_as_completed ) {
   try {
      ACTORS((alice));
      const address collection = create_collection( alice, alice, make_items( collection_rarity::epic, 2 ), true );
      BOOST_CHECK_EQUAL( count_applied<collection_completed_operation>(), 1u );

      const collection_object& c = db.get_collection( collection );
      BOOST_CHECK( c.is_completed() );
      BOOST_CHECK( c.completed_at == db.head_block_time() );
      BOOST_CHECK( c.grace_period_end() == db.head_block_time() + NFTCORE_COLLECTION_GRACE_PERIOD );

      REQUIRE_EXCEPTION_WITH_TEXT( complete_collection( alice, collection ), "COLLECTION_ALREADY_COMPLETED" );
   } FC_LOG_AND_RETHROW()
}

/**
 * Items are appended with dense identifiers and a batch applies completely or not at all
 */
BOOST_AUTO_TEST_CASE( collection_add_items ) {
   try {
      ACTORS((alice)(carol)(mallory));
      const address collection = create_collection( alice, carol, make_items( collection_rarity::rare, 2 ) );

      collection_add_items_operation op;
      op.caller = carol;
      op.collection = collection;
      op.items = { make_item( collection_rarity::legendary, "ipfs://new-1" ),
                   make_item( collection_rarity::uncommon, "ipfs://new-2" ) };
      push( op );

      BOOST_CHECK_EQUAL( db.get_collection( collection ).items_count, 4u );
      const auto added = get_applied<item_added_operation>();
      BOOST_REQUIRE_EQUAL( added.size(), 2u );
      BOOST_CHECK_EQUAL( added[0].item_id, 2u );
      BOOST_CHECK_EQUAL( added[1].item_id, 3u );
      BOOST_CHECK_EQUAL( db.get_item( collection, 3 ).max_supply, 10000u );
      BOOST_CHECK_EQUAL( db.get_item( collection, 2 ).metadata, "ipfs://new-1" );

      BOOST_TEST_MESSAGE("Only the creator may add items");
      op.caller = alice;
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "CALLER_IS_NOT_CREATOR" );
      op.caller = mallory;
      NFTCORE_REQUIRE_THROW( push( op ), caller_is_not_creator_exception );

      BOOST_TEST_MESSAGE("A single invalid entry rejects the whole batch");
      op.caller = carol;
      op.items = { make_item( collection_rarity::rare, "ipfs://ok" ), make_item( collection_rarity::rare, "" ) };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "EMPTY_METADATA" );
      op.items = { make_item( collection_rarity::rare, "ipfs://ok" ), make_item( collection_rarity::rare, "ipfs://bad", 5 ) };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "INVALID_PRICE_AND_BENEFICIARY" );

      collection_item bad_item = make_item( collection_rarity::rare, "ipfs://bad" );
      bad_item.rarity = rarity_count;
      op.items = { make_item( collection_rarity::rare, "ipfs://ok" ), bad_item };
      NFTCORE_REQUIRE_THROW( push( op ), invalid_rarity_exception );

      bad_item = make_item( collection_rarity::rare, "ipfs://bad" );
      bad_item.total_supply = 1;
      op.items = { make_item( collection_rarity::rare, "ipfs://ok" ), bad_item };
      NFTCORE_REQUIRE_THROW( push( op ), invalid_item_supply_exception );

      bad_item = make_item( collection_rarity::rare, "ipfs://bad" );
      bad_item.content_hash = make_salt( "content" );
      op.items = { make_item( collection_rarity::rare, "ipfs://ok" ), bad_item };
      NFTCORE_REQUIRE_THROW( push( op ), invalid_content_hash_exception );

      BOOST_CHECK_EQUAL( db.get_collection( collection ).items_count, 4u );
      BOOST_CHECK( db.find_item( collection, 4 ) == nullptr );
      BOOST_CHECK_EQUAL( count_applied<item_added_operation>(), 0u );

      BOOST_TEST_MESSAGE("Items may not be added once the collection is completed");
      complete_collection( carol, collection );
      op.items = { make_item( collection_rarity::rare, "ipfs://late" ) };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "COLLECTION_ALREADY_COMPLETED" );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( collection_edit_sales_data ) {
   try {
      ACTORS((alice)(carol)(manager)(item_manager)(mallory)(treasury));
      const address collection = create_collection( alice, carol, make_items( collection_rarity::rare, 3 ) );

      collection_edit_items_sales_data_operation op;
      op.caller = carol;
      op.collection = collection;
      op.item_ids = { 0, 2 };
      op.prices = { 10, 20 };
      op.beneficiaries = { treasury, treasury };
      push( op );
      BOOST_CHECK_EQUAL( count_applied<item_sales_data_updated_operation>(), 2u );
      BOOST_CHECK( db.get_item( collection, 0 ).price == 10 );
      BOOST_CHECK( db.get_item( collection, 2 ).price == 20 );
      BOOST_CHECK( db.get_item( collection, 2 ).beneficiary == treasury );

      BOOST_TEST_MESSAGE("Checking argument validation");
      op.prices = { 10 };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "LENGTH_MISMATCH" );
      op.prices = { 10, 0 };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "INVALID_PRICE_AND_BENEFICIARY" );
      op.prices = { 10, 20 };
      op.item_ids = { 0, 7 };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "ITEM_DOES_NOT_EXIST" );

      BOOST_TEST_MESSAGE("Collection-wide and per-item managers may edit");
      collection_set_managers_operation managers_op;
      managers_op.caller = carol;
      managers_op.collection = collection;
      managers_op.managers = { manager };
      managers_op.values = { true };
      push( managers_op );

      collection_set_items_managers_operation item_managers_op;
      item_managers_op.caller = carol;
      item_managers_op.collection = collection;
      item_managers_op.item_ids = { 1 };
      item_managers_op.managers = { item_manager };
      item_managers_op.values = { true };
      push( item_managers_op );
      BOOST_CHECK( db.is_item_manager( collection, 1, item_manager ) );

      op.caller = manager;
      op.item_ids = { 0, 1 };
      op.prices = { 0, 0 };
      op.beneficiaries = { address(), address() };
      push( op );
      BOOST_CHECK( db.get_item( collection, 0 ).price == 0 );
      BOOST_CHECK( db.get_item( collection, 0 ).beneficiary.is_zero() );

      op.caller = item_manager;
      op.item_ids = { 1 };
      op.prices = { 7 };
      op.beneficiaries = { item_manager };
      push( op );
      BOOST_CHECK( db.get_item( collection, 1 ).beneficiary == item_manager );

      // A per-item manager may not touch other items, even within a batch that includes its own
      op.item_ids = { 1, 2 };
      op.prices = { 7, 7 };
      op.beneficiaries = { item_manager, item_manager };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "CALLER_IS_NOT_CREATOR_OR_MANAGER" );
      BOOST_CHECK( db.get_item( collection, 2 ).beneficiary == treasury );

      op.caller = mallory;
      op.item_ids = { 0 };
      op.prices = { 1 };
      op.beneficiaries = { mallory };
      NFTCORE_REQUIRE_THROW( push( op ), caller_is_not_creator_or_manager_exception );

      // The owner is not a manager by virtue of ownership
      op.caller = alice;
      NFTCORE_REQUIRE_THROW( push( op ), caller_is_not_creator_or_manager_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( collection_edit_metadata_and_editable_flag ) {
   try {
      ACTORS((alice)(carol));
      const address collection = create_collection( alice, carol, make_items( collection_rarity::rare, 2 ) );

      collection_edit_items_metadata_operation op;
      op.caller = carol;
      op.collection = collection;
      op.item_ids = { 1 };
      op.metadatas = { "ipfs://edited" };
      push( op );
      BOOST_CHECK_EQUAL( db.get_item( collection, 1 ).metadata, "ipfs://edited" );
      BOOST_CHECK_EQUAL( count_applied<item_metadata_updated_operation>(), 1u );

      op.metadatas = { "" };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "EMPTY_METADATA" );

      BOOST_TEST_MESSAGE("The owner locks the metadata");
      collection_set_editable_operation editable_op;
      editable_op.caller = carol;
      editable_op.collection = collection;
      editable_op.value = false;
      REQUIRE_EXCEPTION_WITH_TEXT( push( editable_op ), "Ownable: caller is not the owner" );
      editable_op.caller = alice;
      push( editable_op );
      BOOST_CHECK( !db.get_collection( collection ).editable );
      BOOST_CHECK_EQUAL( count_applied<collection_editable_set_operation>(), 1u );
      REQUIRE_EXCEPTION_WITH_TEXT( push( editable_op ), "VALUE_IS_THE_SAME" );

      op.metadatas = { "ipfs://locked" };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "NOT_EDITABLE" );
      BOOST_CHECK_EQUAL( db.get_item( collection, 1 ).metadata, "ipfs://edited" );

      BOOST_TEST_MESSAGE("Rescue bypasses the editable flag");
      collection_rescue_items_operation rescue_op;
      rescue_op.caller = carol;
      rescue_op.collection = collection;
      rescue_op.item_ids = { 0, 1 };
      rescue_op.content_hashes = { fc::sha256::hash( std::string( "content-0" ) ),
                                   fc::sha256::hash( std::string( "content-1" ) ) };
      rescue_op.metadatas = { "ipfs://rescued", "" };
      NFTCORE_REQUIRE_THROW( push( rescue_op ), caller_is_not_owner_exception );

      rescue_op.caller = alice;
      push( rescue_op );
      BOOST_CHECK_EQUAL( count_applied<item_rescued_operation>(), 2u );
      BOOST_CHECK_EQUAL( db.get_item( collection, 0 ).metadata, "ipfs://rescued" );
      BOOST_CHECK_EQUAL( db.get_item( collection, 1 ).metadata, "ipfs://edited" );
      BOOST_CHECK( db.get_item( collection, 1 ).content_hash == fc::sha256::hash( std::string( "content-1" ) ) );

      rescue_op.metadatas = { "" };
      REQUIRE_EXCEPTION_WITH_TEXT( push( rescue_op ), "LENGTH_MISMATCH" );

      // Unlock again
      editable_op.value = true;
      push( editable_op );
      op.metadatas = { "ipfs://unlocked" };
      push( op );
      BOOST_CHECK_EQUAL( db.get_item( collection, 1 ).metadata, "ipfs://unlocked" );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( collection_owner_settings ) {
   try {
      ACTORS((alice)(bob)(carol)(dave)(mallory));
      const address collection = create_collection( alice, carol, make_items( collection_rarity::rare, 1 ) );

      BOOST_TEST_MESSAGE("Approval is controlled by the owner");
      set_approved( alice, collection, false );
      BOOST_CHECK( !db.get_collection( collection ).approved );
      const auto approved_set = get_applied<collection_approved_set_operation>();
      BOOST_REQUIRE_EQUAL( approved_set.size(), 1u );
      BOOST_CHECK( approved_set[0].old_value );
      BOOST_CHECK( !approved_set[0].new_value );
      REQUIRE_EXCEPTION_WITH_TEXT( set_approved( alice, collection, false ), "VALUE_IS_THE_SAME" );
      NFTCORE_REQUIRE_THROW( set_approved( carol, collection, true ), caller_is_not_owner_exception );

      BOOST_TEST_MESSAGE("The base URI is controlled by the owner");
      collection_set_base_uri_operation uri_op;
      uri_op.caller = alice;
      uri_op.collection = collection;
      uri_op.base_uri = "https://other.example/";
      push( uri_op );
      BOOST_CHECK_EQUAL( db.get_collection( collection ).base_uri, "https://other.example/" );
      uri_op.caller = mallory;
      NFTCORE_REQUIRE_THROW( push( uri_op ), caller_is_not_owner_exception );

      BOOST_TEST_MESSAGE("Ownership moves between accounts");
      contract_transfer_ownership_operation own_op;
      own_op.caller = mallory;
      own_op.contract = collection;
      own_op.new_owner = mallory;
      REQUIRE_EXCEPTION_WITH_TEXT( push( own_op ), "Ownable: caller is not the owner" );
      own_op.caller = alice;
      own_op.new_owner = address();
      REQUIRE_EXCEPTION_WITH_TEXT( push( own_op ), "Ownable: new owner is the zero address" );
      own_op.new_owner = bob;
      push( own_op );
      BOOST_CHECK( db.get_owner( collection ) == bob );
      NFTCORE_REQUIRE_THROW( set_approved( alice, collection, true ), caller_is_not_owner_exception );
      set_approved( bob, collection, true );

      BOOST_TEST_MESSAGE("The creatorship moves at the request of the owner or the creator");
      collection_transfer_creatorship_operation creator_op;
      creator_op.caller = mallory;
      creator_op.collection = collection;
      creator_op.new_creator = mallory;
      REQUIRE_EXCEPTION_WITH_TEXT( push( creator_op ), "CALLER_IS_NOT_OWNER_OR_CREATOR" );
      // The caller is checked before the new creator
      creator_op.new_creator = address();
      NFTCORE_REQUIRE_THROW( push( creator_op ), caller_is_not_owner_or_creator_exception );
      creator_op.caller = carol;
      REQUIRE_EXCEPTION_WITH_TEXT( push( creator_op ), "INVALID_CREATOR_ADDRESS" );
      NFTCORE_REQUIRE_THROW( push( creator_op ), invalid_creator_address_exception );
      creator_op.new_creator = dave;
      push( creator_op );
      BOOST_CHECK( db.get_collection( collection ).creator == dave );
      creator_op.caller = bob;
      creator_op.new_creator = carol;
      push( creator_op );
      BOOST_CHECK( db.get_collection( collection ).creator == carol );
      const auto transferred = get_applied<creatorship_transferred_operation>();
      BOOST_REQUIRE_EQUAL( transferred.size(), 1u );
      BOOST_CHECK( transferred[0].previous_creator == dave );

      BOOST_TEST_MESSAGE("Only the creator completes the collection");
      NFTCORE_REQUIRE_THROW( complete_collection( bob, collection ), caller_is_not_creator_exception );
      complete_collection( carol, collection );
      BOOST_CHECK( db.get_collection( collection ).is_completed() );
      BOOST_CHECK( db.get_collection( collection ).completed_at == db.head_block_time() );
   } FC_LOG_AND_RETHROW()
}

/**
 * Batches of role changes are checked entry by entry against the state left by earlier entries
 */
BOOST_AUTO_TEST_CASE( collection_roles ) {
   try {
      ACTORS((alice)(carol)(bob)(dave));
      const address collection = create_collection( alice, carol, make_items( collection_rarity::rare, 2 ) );

      collection_set_minters_operation op;
      op.caller = carol;
      op.collection = collection;
      op.minters = { bob, dave };
      op.values = { true, true };
      push( op );
      BOOST_CHECK( db.get_collection( collection ).is_minter( bob ) );
      BOOST_CHECK( db.get_collection( collection ).is_minter( dave ) );
      BOOST_CHECK_EQUAL( count_applied<minter_set_operation>(), 2u );

      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "VALUE_IS_THE_SAME" );

      // Repeated entries are compared with each other
      op.minters = { bob, bob };
      op.values = { false, false };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "VALUE_IS_THE_SAME" );
      BOOST_CHECK( db.get_collection( collection ).is_minter( bob ) );
      op.values = { false, true };
      push( op );
      BOOST_CHECK( db.get_collection( collection ).is_minter( bob ) );

      op.minters = { address() };
      op.values = { true };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "INVALID_MINTER_ADDRESS" );
      NFTCORE_REQUIRE_THROW( push( op ), invalid_minter_address_exception );
      op.minters = { bob };
      op.values = { false, true };
      REQUIRE_EXCEPTION_WITH_TEXT( push( op ), "LENGTH_MISMATCH" );
      op.caller = alice;
      op.values = { false };
      NFTCORE_REQUIRE_THROW( push( op ), caller_is_not_creator_exception );

      BOOST_TEST_MESSAGE("Per-item managers");
      collection_set_items_managers_operation managers_op;
      managers_op.caller = carol;
      managers_op.collection = collection;
      managers_op.item_ids = { 0, 1, 0 };
      managers_op.managers = { dave, dave, dave };
      managers_op.values = { true, true, true };
      REQUIRE_EXCEPTION_WITH_TEXT( push( managers_op ), "VALUE_IS_THE_SAME" );
      BOOST_CHECK( !db.is_item_manager( collection, 0, dave ) );
      managers_op.values = { true, true, false };
      push( managers_op );
      BOOST_CHECK( !db.is_item_manager( collection, 0, dave ) );
      BOOST_CHECK( db.is_item_manager( collection, 1, dave ) );

      managers_op.item_ids = { 9 };
      managers_op.managers = { dave };
      managers_op.values = { true };
      REQUIRE_EXCEPTION_WITH_TEXT( push( managers_op ), "ITEM_DOES_NOT_EXIST" );

      BOOST_TEST_MESSAGE("Per-item minters");
      set_item_minter( carol, collection, 0, dave, minter_allowance( 3 ) );
      BOOST_CHECK( db.get_item_minter_allowance( collection, 0, dave ) == minter_allowance( 3 ) );
      REQUIRE_EXCEPTION_WITH_TEXT( set_item_minter( carol, collection, 0, dave, minter_allowance( 3 ) ),
                                   "VALUE_IS_THE_SAME" );
      set_item_minter( carol, collection, 0, dave, minter_allowance::unlimited() );
      BOOST_CHECK( db.get_item_minter_allowance( collection, 0, dave ).is_unlimited() );

      // A zero allowance revokes the minter
      set_item_minter( carol, collection, 0, dave, minter_allowance( 0 ) );
      BOOST_CHECK( db.get_item( collection, 0 ).minters.empty() );
      REQUIRE_EXCEPTION_WITH_TEXT( set_item_minter( carol, collection, 0, dave, minter_allowance() ),
                                   "VALUE_IS_THE_SAME" );
   } FC_LOG_AND_RETHROW()
}

/**
 * Granted minters and managers hold no creator powers
 */
BOOST_AUTO_TEST_CASE( collection_creator_only_operations ) {
   try {
      ACTORS((alice)(carol)(bob)(dave)(erin));
      const address collection = create_collection( alice, carol, make_items( collection_rarity::rare, 2 ) );

      collection_set_managers_operation managers_op;
      managers_op.caller = carol;
      managers_op.collection = collection;
      managers_op.managers = { bob };
      managers_op.values = { true };
      push( managers_op );

      collection_set_minters_operation minters_op;
      minters_op.caller = carol;
      minters_op.collection = collection;
      minters_op.minters = { dave };
      minters_op.values = { true };
      push( minters_op );

      collection_set_items_managers_operation item_managers_op;
      item_managers_op.caller = carol;
      item_managers_op.collection = collection;
      item_managers_op.item_ids = { 0 };
      item_managers_op.managers = { erin };
      item_managers_op.values = { true };
      push( item_managers_op );
      set_item_minter( carol, collection, 1, erin, minter_allowance::unlimited() );

      managers_op.managers = { address() };
      NFTCORE_REQUIRE_THROW( push( managers_op ), invalid_manager_address_exception );

      for( const address& delegate : { bob, dave, erin } ) {
         BOOST_TEST_MESSAGE( "Checking creator-only operations for a granted role" );
         collection_add_items_operation add_op;
         add_op.caller = delegate;
         add_op.collection = collection;
         add_op.items = { make_item( collection_rarity::epic, "ipfs://delegated" ) };
         NFTCORE_REQUIRE_THROW( push( add_op ), caller_is_not_creator_exception );

         NFTCORE_REQUIRE_THROW( complete_collection( delegate, collection ), caller_is_not_creator_exception );

         minters_op.caller = delegate;
         minters_op.minters = { delegate };
         minters_op.values = { false };
         NFTCORE_REQUIRE_THROW( push( minters_op ), caller_is_not_creator_exception );

         managers_op.caller = delegate;
         managers_op.managers = { alice };
         managers_op.values = { true };
         NFTCORE_REQUIRE_THROW( push( managers_op ), caller_is_not_creator_exception );

         item_managers_op.caller = delegate;
         item_managers_op.item_ids = { 1 };
         item_managers_op.managers = { delegate };
         item_managers_op.values = { true };
         NFTCORE_REQUIRE_THROW( push( item_managers_op ), caller_is_not_creator_exception );

         NFTCORE_REQUIRE_THROW( set_item_minter( delegate, collection, 0, delegate, minter_allowance( 1 ) ),
                                caller_is_not_creator_exception );

         collection_transfer_creatorship_operation creator_op;
         creator_op.caller = delegate;
         creator_op.collection = collection;
         creator_op.new_creator = delegate;
         NFTCORE_REQUIRE_THROW( push( creator_op ), caller_is_not_owner_or_creator_exception );
      }

      const collection_object& c = db.get_collection( collection );
      BOOST_CHECK( c.creator == carol );
      BOOST_CHECK( !c.is_completed() );
      BOOST_CHECK_EQUAL( c.items_count, 2u );
      BOOST_CHECK( c.is_minter( dave ) );
      BOOST_CHECK( !c.is_minter( bob ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
