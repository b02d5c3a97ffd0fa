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
#pragma once

#include <atelier/app/application.hpp>
#include <atelier/chain/artwork_object.hpp>
#include <atelier/chain/database.hpp>
#include <atelier/chain/event_history_object.hpp>
#include <atelier/chain/gallery_object.hpp>
#include <atelier/chain/review_object.hpp>
#include <atelier/protocol/operations.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <boost/test/unit_test.hpp>

#include <iostream>

#define ATELIER_REQUIRE_THROW( expr, exc_type )          \
{                                                        \
   std::string req_throw_info = fc::json::to_string(     \
      fc::mutable_variant_object()                       \
      ("source_file", __FILE__)                          \
      ("source_lineno", __LINE__)                        \
      ("expr", #expr)                                    \
      ("exc_type", #exc_type)                            \
      );                                                 \
   if( fc::enable_record_assert_trip )                   \
      std::cout << "ATELIER_REQUIRE_THROW begin "        \
         << req_throw_info << std::endl;                 \
   BOOST_REQUIRE_THROW( expr, exc_type );                \
   if( fc::enable_record_assert_trip )                   \
      std::cout << "ATELIER_REQUIRE_THROW end "          \
         << req_throw_info << std::endl;                 \
}

#define ATELIER_CHECK_THROW( expr, exc_type )            \
{                                                        \
   std::string req_throw_info = fc::json::to_string(     \
      fc::mutable_variant_object()                       \
      ("source_file", __FILE__)                          \
      ("source_lineno", __LINE__)                        \
      ("expr", #expr)                                    \
      ("exc_type", #exc_type)                            \
      );                                                 \
   if( fc::enable_record_assert_trip )                   \
      std::cout << "ATELIER_CHECK_THROW begin "          \
         << req_throw_info << std::endl;                 \
   BOOST_CHECK_THROW( expr, exc_type );                  \
   if( fc::enable_record_assert_trip )                   \
      std::cout << "ATELIER_CHECK_THROW end "            \
         << req_throw_info << std::endl;                 \
}

namespace atelier { namespace chain { namespace test {

/// one whole unit of currency in base units
const share_type one_unit = share_type( ATELIER_BLOCKCHAIN_PRECISION );

struct database_fixture
{
   atelier::app::application app;
   std::shared_ptr<escrow_ledger> ledger;
   chain::database& db;
   const account_name_type administrator = "registry-admin";

   database_fixture();
   ~database_fixture();

   gallery_id_type create_gallery( const gallery_key_type& key, const account_name_type& curator,
                                   const string& name = "Gallery", const string& description = "" );
   artwork_id_type create_artwork( const account_name_type& creator, const gallery_key_type& gallery,
                                   share_type price, uint16_t royalty_percent = 10,
                                   const string& title = "Untitled", const string& content_ref = "ipfs://QmUntitled" );
   void update_price( const account_name_type& owner, artwork_id_type artwork, share_type new_price );
   void purchase( const account_name_type& buyer, artwork_id_type artwork, share_type payment );
   review_id_type add_review( const account_name_type& reviewer, artwork_id_type artwork, uint16_t rating,
                              const string& comment = "" );
   void update_platform_fee( const account_name_type& caller, uint16_t new_fee );

   const artwork_object& get_artwork( artwork_id_type id )const;
   const gallery_object& get_gallery( const gallery_key_type& key )const;

   /// all log entries with a sequence number of at least @p start
   vector<event_history_object> get_events( uint64_t start = 0 )const;
   /// tag of every log entry from @p start on, in order
   vector<int64_t> get_event_tags( uint64_t start = 0 )const;
};

} } } // atelier::chain::test
