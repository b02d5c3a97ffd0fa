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

#include <atelier/app/database_api.hpp>
#include <atelier/chain/artwork_object.hpp>

#include "../common/database_fixture.hpp"

using namespace atelier::chain;
using namespace atelier::chain::test;

BOOST_FIXTURE_TEST_SUITE( artwork_tests, database_fixture )

BOOST_AUTO_TEST_CASE( create_artwork_lists_it_for_sale )
{ try {
   create_gallery( "main-gallery", "alice" );
   const uint64_t first_event = db.get_next_event_sequence();

   const auto id = create_artwork( "alice", "main-gallery", one_unit, 10, "Harbour at Dusk", "ipfs://QmHarbour" );

   const artwork_object& a = get_artwork( id );
   BOOST_CHECK_EQUAL( a.title, "Harbour at Dusk" );
   BOOST_CHECK_EQUAL( a.creator, "alice" );
   BOOST_CHECK_EQUAL( a.owner, "alice" );
   BOOST_CHECK_EQUAL( a.price.value, one_unit.value );
   BOOST_CHECK( a.for_sale );
   BOOST_CHECK_EQUAL( a.content_ref, "ipfs://QmHarbour" );
   BOOST_CHECK_EQUAL( a.gallery, "main-gallery" );
   BOOST_CHECK_EQUAL( a.royalty_percent, 10 );
   BOOST_CHECK_EQUAL( a.rating_count, 0u );
   BOOST_CHECK_EQUAL( a.rating_sum, 0u );
   BOOST_CHECK( a.created != fc::time_point_sec() );

   const auto& g = get_gallery( "main-gallery" );
   BOOST_REQUIRE_EQUAL( g.artworks.size(), 1u );
   BOOST_CHECK( g.artworks[0] == id );

   const auto events = get_events( first_event );
   BOOST_REQUIRE_EQUAL( events.size(), 1u );
   const auto& e = events[0].event.get<artwork_created_event>();
   BOOST_CHECK( e.artwork == id );
   BOOST_CHECK_EQUAL( e.title, "Harbour at Dusk" );
   BOOST_CHECK_EQUAL( e.creator, "alice" );
   BOOST_CHECK_EQUAL( e.price.value, one_unit.value );
   BOOST_CHECK_EQUAL( e.gallery, "main-gallery" );
   BOOST_CHECK_EQUAL( e.royalty_percent, 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_artwork_validation )
{ try {
   create_gallery( "main-gallery", "alice" );

   ATELIER_CHECK_THROW( create_artwork( "alice", "main-gallery", 0 ), invalid_argument_exception );
   ATELIER_CHECK_THROW( create_artwork( "alice", "main-gallery", -5 ), invalid_argument_exception );
   ATELIER_CHECK_THROW( create_artwork( "alice", "main-gallery", one_unit, 10, "" ), invalid_argument_exception );
   ATELIER_CHECK_THROW( create_artwork( "alice", "no-such-gallery", one_unit ), not_found_exception );
   ATELIER_CHECK_THROW( create_artwork( "alice", "main-gallery", one_unit, 101 ), invalid_argument_exception );

   // an unknown gallery is reported before a bad royalty
   ATELIER_CHECK_THROW( create_artwork( "alice", "no-such-gallery", one_unit, 150 ), not_found_exception );

   BOOST_CHECK( get_gallery( "main-gallery" ).artworks.empty() );

   // the bounds themselves are fine
   create_artwork( "alice", "main-gallery", 1, 0 );
   create_artwork( "alice", "main-gallery", 1, 100 );
   BOOST_CHECK_EQUAL( get_gallery( "main-gallery" ).artworks.size(), 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( artwork_ids_increase_and_are_not_reused )
{ try {
   create_gallery( "main-gallery", "alice" );

   const auto first = create_artwork( "alice", "main-gallery", one_unit );
   ATELIER_CHECK_THROW( create_artwork( "alice", "main-gallery", 0 ), invalid_argument_exception );
   ATELIER_CHECK_THROW( create_artwork( "alice", "main-gallery", one_unit, 200 ), invalid_argument_exception );
   const auto second = create_artwork( "bob", "main-gallery", one_unit );
   const auto third = create_artwork( "carol", "main-gallery", one_unit );

   BOOST_CHECK( first < second );
   BOOST_CHECK( second < third );
   BOOST_CHECK_EQUAL( second.instance, first.instance + 1 );
   BOOST_CHECK_EQUAL( third.instance, second.instance + 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( owner_and_gallery_indexes )
{ try {
   create_gallery( "main-gallery", "alice" );
   create_gallery( "side-gallery", "bob" );
   const auto a1 = create_artwork( "alice", "main-gallery", one_unit );
   const auto a2 = create_artwork( "alice", "side-gallery", one_unit );
   const auto b1 = create_artwork( "bob", "main-gallery", one_unit );

   atelier::app::database_api db_api( db, &app.get_options() );

   const auto alice_owned = db_api.get_artworks_by_owner( "alice" );
   BOOST_REQUIRE_EQUAL( alice_owned.size(), 2u );
   BOOST_CHECK( alice_owned[0] == a1 );
   BOOST_CHECK( alice_owned[1] == a2 );

   const auto main_artworks = db_api.get_artworks_by_gallery( "main-gallery" );
   BOOST_REQUIRE_EQUAL( main_artworks.size(), 2u );
   BOOST_CHECK( main_artworks[0] == a1 );
   BOOST_CHECK( main_artworks[1] == b1 );

   BOOST_CHECK( db_api.get_artworks_by_owner( "nobody" ).empty() );
   BOOST_CHECK( db_api.get_artworks_by_gallery( "no-such-gallery" ).empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( owner_updates_price )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );
   purchase( "bob", id, one_unit );
   BOOST_CHECK( !get_artwork( id ).for_sale );

   const uint64_t first_event = db.get_next_event_sequence();
   update_price( "bob", id, 3 * one_unit.value );

   const artwork_object& a = get_artwork( id );
   BOOST_CHECK_EQUAL( a.price.value, 3 * one_unit.value );
   BOOST_CHECK( a.for_sale );

   const auto events = get_events( first_event );
   BOOST_REQUIRE_EQUAL( events.size(), 1u );
   const auto& e = events[0].event.get<price_updated_event>();
   BOOST_CHECK( e.artwork == id );
   BOOST_CHECK_EQUAL( e.owner, "bob" );
   BOOST_CHECK_EQUAL( e.new_price.value, 3 * one_unit.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( update_price_errors_in_order )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );
   const artwork_id_type unknown( id.instance + 100 );

   // existence is checked first, then ownership, then the price
   ATELIER_CHECK_THROW( update_price( "alice", unknown, 0 ), not_found_exception );
   ATELIER_CHECK_THROW( update_price( "mallory", id, 0 ), unauthorized_exception );
   ATELIER_CHECK_THROW( update_price( "mallory", id, 2 * one_unit.value ), unauthorized_exception );
   ATELIER_CHECK_THROW( update_price( "alice", id, 0 ), invalid_argument_exception );
   ATELIER_CHECK_THROW( update_price( "alice", id, -1 ), invalid_argument_exception );
   ATELIER_CHECK_THROW( update_price( "alice", id, ATELIER_MAX_SHARE_SUPPLY + 1 ), invalid_argument_exception );

   BOOST_CHECK_EQUAL( get_artwork( id ).price.value, one_unit.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( creator_cannot_reprice_after_sale )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );
   purchase( "bob", id, one_unit );

   ATELIER_CHECK_THROW( update_price( "alice", id, 2 * one_unit.value ), unauthorized_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
