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
#include <nftcore/chain/proxy_factory_object.hpp>
#include <nftcore/protocol/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace nftcore::chain;
using namespace nftcore::chain::test;

struct proxy_factory_fixture : database_fixture {
   proxy_factory_fixture()
      : database_fixture() {
   }

   /// Deploy an implementation collection and a factory for it owned by @p owner
   address create_factory( const address& deployer, const address& owner ) {
      const address implementation = deploy_collection( deployer );
      return create_proxy_factory( deployer, implementation, owner );
   }
};

BOOST_FIXTURE_TEST_SUITE( proxy_factory_tests, proxy_factory_fixture )

BOOST_AUTO_TEST_CASE( proxy_factory_creation ) {
   try {
      ACTORS((alice)(bob));
      const address implementation = deploy_collection( alice );
      const address token = create_fungible_token( alice, "FEE", 1000 );

      BOOST_TEST_MESSAGE("The implementation should be a deployed collection");
      REQUIRE_EXCEPTION_WITH_TEXT( create_proxy_factory( alice, bob, alice ), "INVALID_IMPLEMENTATION" );
      NFTCORE_REQUIRE_THROW( create_proxy_factory( alice, token, alice ), invalid_implementation_exception );
      NFTCORE_REQUIRE_THROW( create_proxy_factory( alice, address(), alice ), invalid_implementation_exception );

      const address factory = create_proxy_factory( alice, implementation, bob );
      const proxy_factory_object& f = db.get_proxy_factory( factory );
      BOOST_CHECK( f.implementation == implementation );
      BOOST_CHECK( f.code == build_minimal_proxy_code( implementation ) );
      BOOST_CHECK( f.code_hash == fc::sha256::hash( f.code.data(), f.code.size() ) );
      BOOST_CHECK( db.get_owner( factory ) == bob );
      BOOST_CHECK( db.get_contract( factory ).kind == proxy_factory_contract );
   } FC_LOG_AND_RETHROW()
}

/**
 * Collections deployed through a factory land at the address predicted from the salt and the deployer
 */
BOOST_AUTO_TEST_CASE( proxy_factory_deterministic_address ) {
   try {
      ACTORS((alice)(bob)(dave));
      const address factory = create_factory( alice, alice );
      const salt_type salt = make_salt( "first" );

      const address predicted = db.compute_collection_address( factory, salt, bob );
      BOOST_CHECK( predicted != db.compute_collection_address( factory, salt, dave ) );
      BOOST_CHECK( predicted != db.compute_collection_address( factory, make_salt( "second" ), bob ) );

      const address collection = create_collection_with_factory( bob, factory, salt );
      BOOST_CHECK( collection == predicted );

      const auto created = get_applied<proxy_created_operation>();
      BOOST_REQUIRE_EQUAL( created.size(), 1u );
      BOOST_CHECK( created[0].factory == factory );
      BOOST_CHECK( created[0].proxy == collection );
      BOOST_CHECK( created[0].salt == salt );

      BOOST_TEST_MESSAGE("Without initialization data the collection waits to be initialized");
      const collection_object& c = db.get_collection( collection );
      BOOST_CHECK( !c.is_initialized() );
      BOOST_CHECK( c.proof_of_creation == derive_creation_proof( salt, bob ) );
      BOOST_CHECK( db.get_contract( collection ).deployer == factory );
      BOOST_CHECK( db.is_valid_collection( factory, collection ) );
      BOOST_CHECK( !db.is_valid_collection( factory, deploy_collection( bob ) ) );
      BOOST_CHECK( !db.is_valid_collection( factory, dave ) );

      BOOST_TEST_MESSAGE("A salt is spent once per deployer");
      REQUIRE_EXCEPTION_WITH_TEXT( create_collection_with_factory( bob, factory, salt ), "CREATION_FAILED" );
      NFTCORE_REQUIRE_THROW( create_collection_with_factory( bob, factory, salt ), creation_failed_exception );
      const address other = create_collection_with_factory( dave, factory, salt );
      BOOST_CHECK( other != collection );

      BOOST_TEST_MESSAGE("The factory proof survives a later initialization");
      collection_init_data data = make_init_data( bob, make_items( collection_rarity::rare, 1 ), false );
      data.proof_of_creation = make_salt( "forged" );
      initialize_collection( bob, collection, data );
      BOOST_CHECK( db.get_collection( collection ).proof_of_creation == derive_creation_proof( salt, bob ) );
      BOOST_CHECK( db.get_owner( collection ) == bob );
      BOOST_CHECK( db.is_valid_collection( factory, collection ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( proxy_factory_create_initialized ) {
   try {
      ACTORS((alice)(bob)(carol));
      const address factory = create_factory( alice, alice );

      const collection_init_data data = make_init_data( carol, make_items( collection_rarity::legendary, 3 ), true );
      const address collection = create_collection_with_factory( bob, factory, make_salt( "init" ), data );

      BOOST_CHECK_EQUAL( count_applied<proxy_created_operation>(), 1u );
      BOOST_CHECK_EQUAL( count_applied<item_added_operation>(), 3u );
      BOOST_CHECK_EQUAL( count_applied<collection_completed_operation>(), 1u );

      // Ownership passes from the factory to the owner of the factory
      const auto ownership = get_applied<ownership_transferred_operation>();
      BOOST_REQUIRE_EQUAL( ownership.size(), 2u );
      BOOST_CHECK( ownership[0].new_owner == factory );
      BOOST_CHECK( ownership[1].previous_owner == factory );
      BOOST_CHECK( ownership[1].new_owner == alice );
      BOOST_CHECK( db.get_owner( collection ) == alice );

      const collection_object& c = db.get_collection( collection );
      BOOST_CHECK( c.is_completed() );
      BOOST_CHECK( c.approved );
      BOOST_CHECK( c.creator == carol );
      BOOST_CHECK_EQUAL( c.items_count, 3u );

      pass_grace_period();
      const token_id_type token_id = issue_token( carol, collection, bob, 2 );
      BOOST_CHECK( db.owner_of( collection, token_id ) == bob );
   } FC_LOG_AND_RETHROW()
}

/**
 * A failing initialization rolls back the deployment as well
 */
BOOST_AUTO_TEST_CASE( proxy_factory_failed_initialization ) {
   try {
      ACTORS((alice)(bob));
      const address factory = create_factory( alice, alice );
      const salt_type salt = make_salt( "broken" );
      const address predicted = db.compute_collection_address( factory, salt, bob );

      collection_init_data data = make_init_data( bob, make_items( collection_rarity::rare, 2 ), false );
      data.items[1].metadata = "";
      REQUIRE_EXCEPTION_WITH_TEXT( create_collection_with_factory( bob, factory, salt, data ), "CALL_FAILED" );
      NFTCORE_REQUIRE_THROW( create_collection_with_factory( bob, factory, salt, data ), call_failed_exception );

      BOOST_CHECK( db.find_contract( predicted ) == nullptr );
      BOOST_CHECK( db.find_collection( predicted ) == nullptr );
      BOOST_CHECK( db.find_item( predicted, 0 ) == nullptr );

      // The salt is still available
      data.items[1].metadata = "ipfs://fixed";
      BOOST_CHECK( create_collection_with_factory( bob, factory, salt, data ) == predicted );
      BOOST_CHECK_EQUAL( db.get_collection( predicted ).items_count, 2u );

      NFTCORE_REQUIRE_THROW( create_collection_with_factory( bob, bob, salt ), unknown_contract_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
