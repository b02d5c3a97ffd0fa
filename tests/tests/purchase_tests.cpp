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

#include <stdexcept>

#include <atelier/app/database_api.hpp>
#include <atelier/chain/artwork_object.hpp>
#include <atelier/chain/payment_split.hpp>

#include "../common/database_fixture.hpp"

using namespace atelier::chain;
using namespace atelier::chain::test;

namespace {

/// Tries to buy the artwork again while the payout of a purchase is in progress
class reentrant_gateway : public escrow_ledger
{
   public:
      database* db = nullptr;
      account_name_type attacker;
      artwork_id_type target;
      share_type offer;

      bool attempted = false;
      fc::optional<int64_t> nested_error;

      bool transfer( const account_name_type& to, share_type amount ) override
      {
         if( db != nullptr && to == attacker && !attempted )
         {
            attempted = true;
            artwork_purchase_operation op;
            op.buyer   = attacker;
            op.artwork = target;
            op.payment = offer;
            try {
               db->push_operation( op );
            } catch( const fc::exception& e ) {
               nested_error = e.code();
            }
         }
         return escrow_ledger::transfer( to, amount );
      }
};

/// Reprices another artwork of the seller from inside the payout
class relisting_gateway : public escrow_ledger
{
   public:
      database* db = nullptr;
      account_name_type seller;
      artwork_id_type own_artwork;
      bool reject_seller = false;

      bool transfer( const account_name_type& to, share_type amount ) override
      {
         if( db != nullptr && to == seller )
         {
            artwork_update_price_operation op;
            op.owner     = seller;
            op.artwork   = own_artwork;
            op.new_price = 7;
            db->push_operation( op );
            if( reject_seller )
               return false;
         }
         return escrow_ledger::transfer( to, amount );
      }
};

/// Fails with a standard exception instead of refusing the transfer
class throwing_gateway : public escrow_ledger
{
   public:
      account_name_type broken_account;

      bool transfer( const account_name_type& to, share_type amount ) override
      {
         if( to == broken_account )
            throw std::runtime_error( "connection reset" );
         return escrow_ledger::transfer( to, amount );
      }
};

}

BOOST_FIXTURE_TEST_SUITE( purchase_tests, database_fixture )

BOOST_AUTO_TEST_CASE( primary_sale_pays_fee_and_seller )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit, 10 );
   const uint64_t first_event = db.get_next_event_sequence();

   purchase( "bob", id, one_unit );

   const artwork_object& a = get_artwork( id );
   BOOST_CHECK_EQUAL( a.owner, "bob" );
   BOOST_CHECK( !a.for_sale );
   BOOST_CHECK_EQUAL( a.creator, "alice" );

   // 2.5% of 1.0 to the administrator, no royalty on a primary sale
   BOOST_CHECK_EQUAL( ledger->get_balance( administrator ).value, 2500 );
   BOOST_CHECK_EQUAL( ledger->get_balance( "alice" ).value, 97500 );

   const auto events = get_events( first_event );
   BOOST_REQUIRE_EQUAL( events.size(), 2u );
   const auto& sold = events[0].event.get<artwork_sold_event>();
   BOOST_CHECK( sold.artwork == id );
   BOOST_CHECK_EQUAL( sold.seller, "alice" );
   BOOST_CHECK_EQUAL( sold.buyer, "bob" );
   BOOST_CHECK_EQUAL( sold.payment.value, one_unit.value );
   const auto& fee = events[1].event.get<platform_fee_paid_event>();
   BOOST_CHECK_EQUAL( fee.administrator, administrator );
   BOOST_CHECK_EQUAL( fee.amount.value, 2500 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( secondary_sale_pays_royalty )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit, 10 );
   purchase( "bob", id, one_unit );
   update_price( "bob", id, one_unit );

   const share_type alice_before = ledger->get_balance( "alice" );
   const share_type admin_before = ledger->get_balance( administrator );
   const uint64_t first_event = db.get_next_event_sequence();

   purchase( "carol", id, one_unit );

   BOOST_CHECK_EQUAL( get_artwork( id ).owner, "carol" );
   BOOST_CHECK_EQUAL( ( ledger->get_balance( "alice" ) - alice_before ).value, 10000 );
   BOOST_CHECK_EQUAL( ( ledger->get_balance( administrator ) - admin_before ).value, 2500 );
   BOOST_CHECK_EQUAL( ledger->get_balance( "bob" ).value, 87500 );

   const auto events = get_events( first_event );
   BOOST_REQUIRE_EQUAL( events.size(), 3u );
   BOOST_CHECK_EQUAL( events[0].event.which(), int64_t( event_type::tag<artwork_sold_event>::value ) );
   const auto& royalty = events[1].event.get<royalty_paid_event>();
   BOOST_CHECK( royalty.artwork == id );
   BOOST_CHECK_EQUAL( royalty.creator, "alice" );
   BOOST_CHECK_EQUAL( royalty.amount.value, 10000 );
   BOOST_CHECK_EQUAL( events[2].event.which(), int64_t( event_type::tag<platform_fee_paid_event>::value ) );

   atelier::app::database_api db_api( db, &app.get_options() );
   const auto carol_owned = db_api.get_artworks_by_owner( "carol" );
   BOOST_REQUIRE_EQUAL( carol_owned.size(), 1u );
   BOOST_CHECK( carol_owned[0] == id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( ownership_list_keeps_sold_artworks )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );
   purchase( "bob", id, one_unit );

   atelier::app::database_api db_api( db, &app.get_options() );
   const auto alice_owned = db_api.get_artworks_by_owner( "alice" );
   BOOST_REQUIRE_EQUAL( alice_owned.size(), 1u );
   BOOST_CHECK( alice_owned[0] == id );
   BOOST_CHECK_EQUAL( db_api.get_artworks_by_owner( "bob" ).size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( purchase_errors )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );
   const artwork_id_type unknown( id.instance + 1 );

   ATELIER_CHECK_THROW( purchase( "bob", unknown, one_unit ), not_found_exception );
   ATELIER_CHECK_THROW( purchase( "bob", id, one_unit.value - 1 ), insufficient_payment_exception );
   ATELIER_CHECK_THROW( purchase( "bob", id, 0 ), insufficient_payment_exception );

   purchase( "bob", id, one_unit );

   // not for sale wins over any payment
   ATELIER_CHECK_THROW( purchase( "carol", id, 100 * one_unit.value ), not_for_sale_exception );
   ATELIER_CHECK_THROW( purchase( "carol", id, 0 ), not_for_sale_exception );
   BOOST_CHECK_EQUAL( get_artwork( id ).owner, "bob" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( payment_above_supported_amount_is_rejected )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );
   const uint64_t next_event = db.get_next_event_sequence();

   ATELIER_CHECK_THROW( purchase( "bob", id, ATELIER_MAX_SHARE_SUPPLY + 1 ), invalid_argument_exception );
   ATELIER_CHECK_THROW( purchase( "bob", id, 50 * ATELIER_MAX_SHARE_SUPPLY ), invalid_argument_exception );
   BOOST_CHECK_EQUAL( get_artwork( id ).owner, "alice" );
   BOOST_CHECK_EQUAL( db.get_next_event_sequence(), next_event );

   // the largest supported payment still splits without overflow
   purchase( "bob", id, ATELIER_MAX_SHARE_SUPPLY );
   BOOST_CHECK_EQUAL( get_artwork( id ).owner, "bob" );
   BOOST_CHECK_EQUAL( ledger->get_balance( administrator ).value, ATELIER_MAX_SHARE_SUPPLY / 40 );
   BOOST_CHECK_EQUAL( ledger->get_balance( "alice" ).value,
                      ATELIER_MAX_SHARE_SUPPLY - ATELIER_MAX_SHARE_SUPPLY / 40 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( overpayment_is_split_in_full )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit, 10 );
   purchase( "bob", id, one_unit );
   update_price( "bob", id, one_unit );

   const share_type alice_before = ledger->get_balance( "alice" );
   const share_type admin_before = ledger->get_balance( administrator );
   purchase( "carol", id, 2 * one_unit.value );

   BOOST_CHECK_EQUAL( ( ledger->get_balance( "alice" ) - alice_before ).value, 20000 );
   BOOST_CHECK_EQUAL( ( ledger->get_balance( administrator ) - admin_before ).value, 5000 );
   BOOST_CHECK_EQUAL( ledger->get_balance( "bob" ).value, 175000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( split_always_adds_up )
{ try {
   const std::vector<int64_t> payments = { 1, 7, 99, 1000, 12345, 100000, 99999999, 123456789012345ll };
   const std::vector<uint16_t> fees = { 0, 1, 25, 99, 100 };
   const std::vector<uint16_t> royalties = { 0, 1, 10, 33, 50, 89 };
   for( int64_t payment : payments )
      for( uint16_t fee : fees )
         for( uint16_t royalty : royalties )
            for( bool primary : { true, false } )
            {
               const auto split = split_payment( payment, fee, royalty, primary );
               BOOST_CHECK_EQUAL( ( split.royalty + split.platform_fee + split.seller_proceeds ).value, payment );
               BOOST_CHECK_EQUAL( split.platform_fee.value, payment * fee / 1000 );
               BOOST_CHECK_EQUAL( split.royalty.value, primary ? 0 : payment * royalty / 100 );
               BOOST_CHECK( split.seller_proceeds >= 0 );
            }

   // truncation goes to the seller
   const auto split = split_payment( 999, 25, 10, false );
   BOOST_CHECK_EQUAL( split.royalty.value, 99 );
   BOOST_CHECK_EQUAL( split.platform_fee.value, 24 );
   BOOST_CHECK_EQUAL( split.seller_proceeds.value, 876 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( full_royalty_leaves_nothing_for_the_fee )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit, 100 );
   purchase( "bob", id, one_unit );
   update_price( "bob", id, one_unit );

   ATELIER_CHECK_THROW( purchase( "carol", id, one_unit ), insufficient_payment_exception );
   BOOST_CHECK_EQUAL( get_artwork( id ).owner, "bob" );
   BOOST_CHECK( get_artwork( id ).for_sale );

   // with no platform fee a full royalty is payable
   update_platform_fee( administrator, 0 );
   purchase( "carol", id, one_unit );
   BOOST_CHECK_EQUAL( get_artwork( id ).owner, "carol" );
   BOOST_CHECK_EQUAL( ledger->get_balance( "bob" ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( zero_fee_rate_skips_the_fee_transfer )
{ try {
   update_platform_fee( administrator, 0 );
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );
   const uint64_t first_event = db.get_next_event_sequence();

   purchase( "bob", id, one_unit );

   BOOST_CHECK_EQUAL( ledger->get_balance( "alice" ).value, one_unit.value );
   BOOST_CHECK_EQUAL( ledger->get_balance( administrator ).value, 0 );
   const auto tags = get_event_tags( first_event );
   BOOST_REQUIRE_EQUAL( tags.size(), 1u );
   BOOST_CHECK_EQUAL( tags[0], int64_t( event_type::tag<artwork_sold_event>::value ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_transfer_rolls_back_the_purchase )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit, 10 );
   purchase( "bob", id, one_unit );
   update_price( "bob", id, one_unit );

   const share_type alice_before = ledger->get_balance( "alice" );
   const share_type admin_before = ledger->get_balance( administrator );
   const uint64_t next_event = db.get_next_event_sequence();

   // royalty and fee go through, then the seller refuses
   ledger->reject_transfers_to( "bob" );
   ATELIER_REQUIRE_THROW( purchase( "carol", id, one_unit ), transfer_failed_exception );

   const artwork_object& a = get_artwork( id );
   BOOST_CHECK_EQUAL( a.owner, "bob" );
   BOOST_CHECK( a.for_sale );
   BOOST_CHECK_EQUAL( db.get_next_event_sequence(), next_event );
   BOOST_CHECK( get_events( next_event ).empty() );
   BOOST_CHECK_EQUAL( ledger->get_balance( "alice" ).value, alice_before.value );
   BOOST_CHECK_EQUAL( ledger->get_balance( administrator ).value, admin_before.value );

   atelier::app::database_api db_api( db, &app.get_options() );
   BOOST_CHECK( db_api.get_artworks_by_owner( "carol" ).empty() );

   // once the seller accepts again the same purchase goes through
   ledger->accept_transfers_to( "bob" );
   purchase( "carol", id, one_unit );
   BOOST_CHECK_EQUAL( get_artwork( id ).owner, "carol" );
   BOOST_CHECK_EQUAL( ledger->get_balance( "bob" ).value, 87500 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_royalty_transfer_rolls_back )
{ try {
   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit, 10 );
   purchase( "bob", id, one_unit );
   update_price( "bob", id, one_unit );

   ledger->reject_transfers_to( "alice" );
   ATELIER_REQUIRE_THROW( purchase( "carol", id, one_unit ), transfer_failed_exception );
   BOOST_CHECK_EQUAL( get_artwork( id ).owner, "bob" );
   BOOST_CHECK_EQUAL( ledger->get_balance( "bob" ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( gateway_error_rolls_back_accepted_transfers )
{ try {
   auto gateway = std::make_shared<throwing_gateway>();
   db.set_payment_gateway( gateway );

   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit, 10 );
   purchase( "bob", id, one_unit );
   update_price( "bob", id, one_unit );

   const share_type alice_before = gateway->get_balance( "alice" );
   const share_type admin_before = gateway->get_balance( administrator );
   const uint64_t next_event = db.get_next_event_sequence();

   // royalty and fee are accepted before the seller leg throws
   gateway->broken_account = "bob";
   ATELIER_REQUIRE_THROW( purchase( "carol", id, one_unit ), transfer_failed_exception );

   BOOST_CHECK_EQUAL( get_artwork( id ).owner, "bob" );
   BOOST_CHECK( get_artwork( id ).for_sale );
   BOOST_CHECK_EQUAL( db.get_next_event_sequence(), next_event );
   BOOST_CHECK_EQUAL( gateway->get_balance( "alice" ).value, alice_before.value );
   BOOST_CHECK_EQUAL( gateway->get_balance( administrator ).value, admin_before.value );
   BOOST_CHECK_EQUAL( gateway->get_balance( "bob" ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( reentrant_purchase_is_refused )
{ try {
   auto gateway = std::make_shared<reentrant_gateway>();
   db.set_payment_gateway( gateway );

   create_gallery( "main-gallery", "alice" );
   const auto id = create_artwork( "alice", "main-gallery", one_unit );

   // while alice is being paid she tries to buy the artwork back
   gateway->db       = &db;
   gateway->attacker = "alice";
   gateway->target   = id;
   gateway->offer    = one_unit;

   purchase( "bob", id, one_unit );

   BOOST_CHECK( gateway->attempted );
   BOOST_REQUIRE( gateway->nested_error.valid() );
   BOOST_CHECK_EQUAL( *gateway->nested_error, int64_t( not_for_sale_exception::code_value ) );
   BOOST_CHECK_EQUAL( get_artwork( id ).owner, "bob" );
   BOOST_CHECK_EQUAL( gateway->get_balance( "alice" ).value, 97500 );
   BOOST_CHECK_EQUAL( gateway->get_balance( administrator ).value, 2500 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( nested_operation_is_undone_with_the_purchase )
{ try {
   auto gateway = std::make_shared<relisting_gateway>();
   db.set_payment_gateway( gateway );

   create_gallery( "main-gallery", "alice" );
   const auto sold = create_artwork( "alice", "main-gallery", one_unit );
   const auto other = create_artwork( "alice", "main-gallery", one_unit );
   const uint64_t next_event = db.get_next_event_sequence();

   gateway->db            = &db;
   gateway->seller        = "alice";
   gateway->own_artwork   = other;
   gateway->reject_seller = true;

   // alice reprices her other artwork while being paid, then refuses the payment
   ATELIER_REQUIRE_THROW( purchase( "bob", sold, one_unit ), transfer_failed_exception );
   BOOST_CHECK_EQUAL( get_artwork( sold ).owner, "alice" );
   BOOST_CHECK( get_artwork( sold ).for_sale );
   BOOST_CHECK_EQUAL( get_artwork( other ).price.value, one_unit.value );
   BOOST_CHECK_EQUAL( db.get_next_event_sequence(), next_event );
   BOOST_CHECK_EQUAL( gateway->get_balance( administrator ).value, 0 );
   BOOST_CHECK_EQUAL( gateway->get_balance( "alice" ).value, 0 );

   // when the payout succeeds the nested change stands
   gateway->reject_seller = false;
   purchase( "bob", sold, one_unit );
   BOOST_CHECK_EQUAL( get_artwork( sold ).owner, "bob" );
   BOOST_CHECK_EQUAL( get_artwork( other ).price.value, 7 );
   BOOST_CHECK_EQUAL( gateway->get_balance( "alice" ).value, 97500 );

   const auto tags = get_event_tags( next_event );
   BOOST_REQUIRE_EQUAL( tags.size(), 3u );
   BOOST_CHECK_EQUAL( tags[0], int64_t( event_type::tag<artwork_sold_event>::value ) );
   BOOST_CHECK_EQUAL( tags[1], int64_t( event_type::tag<platform_fee_paid_event>::value ) );
   BOOST_CHECK_EQUAL( tags[2], int64_t( event_type::tag<price_updated_event>::value ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
