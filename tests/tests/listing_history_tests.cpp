/*
 * Copyright (c) 2020-2023 Revolution Populi Limited, and contributors.
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

#include <atelier/listing_history/listing_history_plugin.hpp>

#include "../common/database_fixture.hpp"

using namespace atelier::chain;
using namespace atelier::chain::test;
using atelier::listing_history::listing_history_plugin;

BOOST_FIXTURE_TEST_SUITE( listing_history_tests, database_fixture )

BOOST_AUTO_TEST_CASE( follows_listings )
{ try {
   auto plugin = app.get_plugin<listing_history_plugin>( "listing_history" );

   create_gallery( "main-gallery", "alice" );
   const auto first = create_artwork( "alice", "main-gallery", one_unit, 10, "Dawn" );
   const auto second = create_artwork( "alice", "main-gallery", 2 * one_unit.value, 10, "Dusk" );

   BOOST_CHECK_EQUAL( plugin->get_listings_for_sale().size(), 2u );

   purchase( "bob", first, one_unit );
   update_price( "bob", first, 3 * one_unit.value );
   purchase( "carol", first, 3 * one_unit.value );
   add_review( "bob", first, 4 );
   add_review( "dave", first, 1 );

   const auto listing = plugin->get_listing( first );
   BOOST_REQUIRE( listing.valid() );
   BOOST_CHECK_EQUAL( listing->title, "Dawn" );
   BOOST_CHECK_EQUAL( listing->gallery, "main-gallery" );
   BOOST_CHECK_EQUAL( listing->creator, "alice" );
   BOOST_CHECK_EQUAL( listing->owner, "carol" );
   BOOST_CHECK( !listing->for_sale );
   BOOST_CHECK_EQUAL( listing->price.value, 3 * one_unit.value );
   BOOST_CHECK_EQUAL( listing->sales, 2u );
   BOOST_CHECK_EQUAL( listing->last_sale_price.value, 3 * one_unit.value );
   BOOST_CHECK_EQUAL( listing->royalties_paid.value, 30000 );
   BOOST_CHECK_EQUAL( listing->rating_count, 2u );
   BOOST_CHECK_EQUAL( listing->rating_sum, 5u );
   const vector<account_name_type> provenance = { "alice", "bob", "carol" };
   BOOST_CHECK_EQUAL_COLLECTIONS( listing->provenance.begin(), listing->provenance.end(),
                                  provenance.begin(), provenance.end() );

   // the registry and the plugin agree
   BOOST_CHECK_EQUAL( listing->owner, get_artwork( first ).owner );
   BOOST_CHECK_EQUAL( listing->rating_sum, get_artwork( first ).rating_sum );

   const auto for_sale = plugin->get_listings_for_sale();
   BOOST_REQUIRE_EQUAL( for_sale.size(), 1u );
   BOOST_CHECK( for_sale[0].artwork == second );

   BOOST_CHECK( !plugin->get_listing( artwork_id_type( second.instance + 1 ) ).valid() );
   BOOST_CHECK_EQUAL( plugin->get_next_sequence(), db.get_next_event_sequence() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( earnings_match_the_ledger )
{ try {
   auto plugin = app.get_plugin<listing_history_plugin>( "listing_history" );

   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit, 10 );
   purchase( "bob", id, one_unit );
   update_price( "bob", id, 2 * one_unit.value );
   purchase( "carol", id, 2 * one_unit.value );

   const auto alice = plugin->get_account_earnings( "alice" );
   BOOST_CHECK_EQUAL( alice.royalties.value, 20000 );
   BOOST_CHECK_EQUAL( alice.sale_proceeds.value, 97500 );
   BOOST_CHECK_EQUAL( alice.artworks_sold, 1u );
   BOOST_CHECK_EQUAL( ( alice.royalties + alice.sale_proceeds ).value, ledger->get_balance( "alice" ).value );

   const auto bob = plugin->get_account_earnings( "bob" );
   BOOST_CHECK_EQUAL( bob.purchases.value, one_unit.value );
   BOOST_CHECK_EQUAL( bob.artworks_bought, 1u );
   BOOST_CHECK_EQUAL( bob.artworks_sold, 1u );
   BOOST_CHECK_EQUAL( bob.sale_proceeds.value, ledger->get_balance( "bob" ).value );

   const auto admin = plugin->get_account_earnings( administrator );
   BOOST_CHECK_EQUAL( admin.platform_fees.value, 2500 + 5000 );
   BOOST_CHECK_EQUAL( admin.platform_fees.value, ledger->get_balance( administrator ).value );

   const auto nobody = plugin->get_account_earnings( "nobody" );
   BOOST_CHECK_EQUAL( nobody.account, "nobody" );
   BOOST_CHECK_EQUAL( nobody.purchases.value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( rejected_operations_are_not_seen )
{ try {
   auto plugin = app.get_plugin<listing_history_plugin>( "listing_history" );

   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );
   ledger->reject_transfers_to( "alice" );
   ATELIER_CHECK_THROW( purchase( "bob", id, one_unit ), transfer_failed_exception );

   const auto listing = plugin->get_listing( id );
   BOOST_REQUIRE( listing.valid() );
   BOOST_CHECK_EQUAL( listing->owner, "alice" );
   BOOST_CHECK( listing->for_sale );
   BOOST_CHECK_EQUAL( listing->sales, 0u );
   BOOST_CHECK_EQUAL( plugin->get_account_earnings( administrator ).platform_fees.value, 0 );
   BOOST_CHECK_EQUAL( plugin->get_next_sequence(), db.get_next_event_sequence() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( follows_platform_fee )
{ try {
   auto plugin = app.get_plugin<listing_history_plugin>( "listing_history" );
   BOOST_CHECK_EQUAL( plugin->get_platform_fee(), ATELIER_DEFAULT_PLATFORM_FEE );
   update_platform_fee( administrator, 60 );
   BOOST_CHECK_EQUAL( plugin->get_platform_fee(), 60u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( duplicate_entries_are_skipped )
{ try {
   auto plugin = app.get_plugin<listing_history_plugin>( "listing_history" );

   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );
   purchase( "bob", id, one_unit );

   // feeding the whole log again changes nothing
   plugin->apply_events( get_events() );
   const auto listing = plugin->get_listing( id );
   BOOST_REQUIRE( listing.valid() );
   BOOST_CHECK_EQUAL( listing->sales, 1u );
   BOOST_CHECK_EQUAL( listing->provenance.size(), 2u );
   BOOST_CHECK_EQUAL( plugin->get_account_earnings( "bob" ).artworks_bought, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( rebuilds_from_a_saved_log )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit, 10 );
   purchase( "bob", id, one_unit );
   update_price( "bob", id, one_unit );
   purchase( "carol", id, one_unit );
   update_platform_fee( administrator, 50 );

   const string saved = fc::json::to_string( fc::variant( get_events(), ATELIER_MAX_NESTED_OBJECTS ) );

   // a second node that never saw the operations
   atelier::app::application other;
   auto plugin = other.register_plugin<listing_history_plugin>( true );
   boost::program_options::variables_map options;
   other.initialize( options );
   other.startup();
   BOOST_CHECK_EQUAL( plugin->get_next_sequence(), 0u );

   plugin->apply_events( fc::json::from_string( saved ).as<vector<event_history_object>>( ATELIER_MAX_NESTED_OBJECTS ) );

   const auto listing = plugin->get_listing( id );
   BOOST_REQUIRE( listing.valid() );
   BOOST_CHECK_EQUAL( listing->owner, "carol" );
   BOOST_CHECK_EQUAL( listing->royalties_paid.value, 10000 );
   BOOST_CHECK_EQUAL( plugin->get_platform_fee(), 50u );
   BOOST_CHECK_EQUAL( plugin->get_account_earnings( "bob" ).sale_proceeds.value, 87500 );
   BOOST_CHECK_EQUAL( plugin->get_next_sequence(), db.get_next_event_sequence() );

   other.shutdown();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( catches_up_on_entries_it_did_not_see )
{ try {
   auto plugin = app.get_plugin<listing_history_plugin>( "listing_history" );

   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );

   // stop following the log, then fall behind by one purchase
   plugin->plugin_shutdown();
   purchase( "bob", id, one_unit );
   const auto events = get_events();
   BOOST_REQUIRE_EQUAL( events.size(), 4u );
   BOOST_CHECK_EQUAL( plugin->get_next_sequence(), 2u );

   // the sale is read back from the database before the last entry is applied
   plugin->apply_events( { events.back() } );
   BOOST_CHECK_EQUAL( plugin->get_next_sequence(), 4u );
   const auto listing = plugin->get_listing( id );
   BOOST_REQUIRE( listing.valid() );
   BOOST_CHECK_EQUAL( listing->owner, "bob" );
   BOOST_CHECK_EQUAL( listing->sales, 1u );
   BOOST_CHECK_EQUAL( plugin->get_account_earnings( administrator ).platform_fees.value, 2500 );
   BOOST_CHECK_EQUAL( plugin->get_account_earnings( "alice" ).sale_proceeds.value, 97500 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( missing_entries_are_passed_over )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );
   purchase( "bob", id, one_unit );

   auto events = get_events();
   BOOST_REQUIRE_EQUAL( events.size(), 4u );
   // drop the artwork creation
   events.erase( events.begin() + 1 );

   // a second node with an empty database can not fill the hole
   atelier::app::application other;
   auto plugin = other.register_plugin<listing_history_plugin>( true );
   boost::program_options::variables_map options;
   other.initialize( options );
   other.startup();

   plugin->apply_events( events );
   BOOST_CHECK_EQUAL( plugin->get_next_sequence(), 4u );
   BOOST_CHECK( !plugin->get_listing( id ).valid() );
   BOOST_CHECK_EQUAL( plugin->get_account_earnings( administrator ).platform_fees.value, 2500 );

   other.shutdown();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( track_selected_accounts )
{ try {
   auto plugin = app.get_plugin<listing_history_plugin>( "listing_history" );

   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );
   purchase( "bob", id, one_unit );

   BOOST_CHECK_EQUAL( plugin->get_account_earnings( "alice" ).sale_proceeds.value, 97500 );
   BOOST_CHECK_EQUAL( plugin->get_account_earnings( administrator ).platform_fees.value, 2500 );

   // bob is not tracked
   const auto bob = plugin->get_account_earnings( "bob" );
   BOOST_CHECK_EQUAL( bob.artworks_bought, 0u );
   BOOST_CHECK_EQUAL( bob.purchases.value, 0 );

   // listings are kept for every artwork
   BOOST_REQUIRE( plugin->get_listing( id ).valid() );
   BOOST_CHECK_EQUAL( plugin->get_listing( id )->owner, "bob" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
