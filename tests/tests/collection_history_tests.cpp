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
#include <nftcore/collection_history/collection_history.hpp>

#include <boost/program_options.hpp>

#include "../common/database_fixture.hpp"

using namespace nftcore::chain;
using namespace nftcore::chain::test;

namespace bpo = boost::program_options;

struct collection_history_fixture : database_fixture {
   nftcore::collection_history::collection_history history;

   collection_history_fixture()
      : database_fixture(), history( db ) {
   }

   void start_history( const vector<string>& args ) {
      bpo::options_description cli;
      bpo::options_description cfg;
      history.plugin_set_program_options( cli, cfg );

      bpo::variables_map options;
      bpo::store( bpo::command_line_parser( args ).options( cli ).run(), options );
      bpo::notify( options );

      history.plugin_initialize( options );
      history.plugin_startup();
   }
};

BOOST_FIXTURE_TEST_SUITE( collection_history_tests, collection_history_fixture )

BOOST_AUTO_TEST_CASE( history_records_issuances ) {
   try {
      ACTORS((alice)(carol)(bob)(dave));
      start_history( {} );
      BOOST_CHECK_EQUAL( history.plugin_name(), "collection_history" );

      const address collection = create_mintable_collection( alice, carol, make_items( collection_rarity::rare, 2 ) );
      const fc::time_point_sec first_time = db.head_block_time();
      const token_id_type first = issue_token( carol, collection, bob, 1 );

      advance_time( 60 );
      const fc::time_point_sec second_time = db.head_block_time();
      issue_tokens( carol, collection, { dave, bob }, { 0, 1 } );
      BOOST_CHECK_EQUAL( history.get_record_count(), 3u );

      BOOST_TEST_MESSAGE("Failed issuances leave no record");
      REQUIRE_EXCEPTION_WITH_TEXT( issue_tokens( carol, collection, { dave, dave }, { 0, 9 } ), "ITEM_DOES_NOT_EXIST" );
      BOOST_CHECK_EQUAL( history.get_record_count(), 3u );

      const auto all = history.get_issuances_by_collection( collection, first_time, second_time + 1 );
      BOOST_REQUIRE_EQUAL( all.size(), 3u );
      BOOST_CHECK( all[0].token_id == first );
      BOOST_CHECK( all[0].timestamp == first_time );
      BOOST_CHECK( all[0].beneficiary == bob );
      BOOST_CHECK( all[0].minter == carol );
      BOOST_CHECK( all[1].beneficiary == dave );
      BOOST_CHECK( all[1].timestamp == second_time );

      const auto early = history.get_issuances_by_collection( collection, first_time, second_time );
      BOOST_REQUIRE_EQUAL( early.size(), 1u );
      BOOST_CHECK( early[0].token_id == first );

      const auto by_item = history.get_issuances_by_item( collection, 1 );
      BOOST_REQUIRE_EQUAL( by_item.size(), 2u );
      BOOST_CHECK( by_item[0].issued_id == 1 );
      BOOST_CHECK( by_item[1].issued_id == 2 );
      BOOST_CHECK_EQUAL( history.get_issuance_count( collection, 0 ), 1u );
      BOOST_CHECK_EQUAL( history.get_issuance_count( collection, 1 ), 2u );
      BOOST_CHECK_EQUAL( history.get_issuance_count( collection, 7 ), 0u );

      history.plugin_shutdown();
      issue_token( carol, collection, bob, 0 );
      BOOST_CHECK_EQUAL( history.get_record_count(), 3u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( history_tracking_options ) {
   try {
      ACTORS((alice)(carol)(bob));
      const address tracked = create_mintable_collection( alice, carol, make_items( collection_rarity::rare, 1 ) );
      const address untracked = create_mintable_collection( alice, carol, make_items( collection_rarity::rare, 1 ) );

      start_history( { "--collection-history-track-collection", tracked.to_string(),
                       "--collection-history-max-records", "3" } );

      issue_token( carol, untracked, bob, 0 );
      BOOST_CHECK_EQUAL( history.get_record_count(), 0u );

      issue_tokens( carol, tracked, { bob, bob, bob, bob, bob }, { 0, 0, 0, 0, 0 } );
      BOOST_CHECK_EQUAL( history.get_record_count(), 3u );

      // The oldest records were pruned
      const auto records = history.get_issuances_by_item( tracked, 0 );
      BOOST_REQUIRE_EQUAL( records.size(), 3u );
      BOOST_CHECK( records[0].issued_id == 3 );
      BOOST_CHECK( records[2].issued_id == 5 );
      BOOST_CHECK( history.get_issuances_by_collection( untracked, fc::time_point_sec(),
                                                        fc::time_point_sec::maximum() ).empty() );
   } FC_LOG_AND_RETHROW()
}

/**
 * Observers run once the operation is committed and can not undo it
 */
BOOST_AUTO_TEST_CASE( observers_run_after_commit ) {
   try {
      ACTORS((alice)(carol)(bob));
      start_history( {} );
      const address first = create_collection( alice, carol, make_items( collection_rarity::rare, 1 ) );
      const address second = create_collection( alice, carol, make_items( collection_rarity::rare, 1 ) );

      size_t observed = 0;
      boost::signals2::scoped_connection counting = db.applied_operation.connect( [&observed]( const operation& ) {
         ++observed;
      });
      boost::signals2::scoped_connection failing = db.applied_operation.connect( []( const operation& ) {
         FC_THROW( "Observer failure" );
      });

      BOOST_TEST_MESSAGE("A failing observer does not fail the operation");
      complete_collection( carol, first );
      BOOST_CHECK( db.get_collection( first ).is_completed() );
      BOOST_CHECK_EQUAL( count_applied<collection_completed_operation>(), 1u );
      BOOST_CHECK_EQUAL( observed, 2u );

      pass_grace_period();
      issue_token( carol, first, bob, 0 );
      BOOST_CHECK_EQUAL( db.balance_of( first, bob ), 1u );
      BOOST_CHECK_EQUAL( history.get_record_count(), 1u );
      failing.disconnect();

      BOOST_TEST_MESSAGE("An observer may push an operation of its own");
      boost::signals2::scoped_connection reacting = db.applied_operation.connect(
         [this, &alice, &second]( const operation& o ) {
            if( o.which() == operation::tag<collection_completed_operation>::value )
               set_approved( alice, second, false );
         });
      observed = 0;
      complete_collection( carol, second );
      BOOST_CHECK( db.get_collection( second ).is_completed() );
      BOOST_CHECK( !db.get_collection( second ).approved );
      // complete and its event, then set_approved and its event
      BOOST_CHECK_EQUAL( observed, 4u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
