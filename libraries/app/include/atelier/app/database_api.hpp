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
#include <atelier/chain/event_history_object.hpp>
#include <atelier/chain/gallery_object.hpp>
#include <atelier/chain/review_object.hpp>

#include <memory>

namespace atelier { namespace app {

using namespace atelier::chain;
using std::shared_ptr;
using std::vector;

class database_api_impl;

/// An artwork together with its derived values
struct artwork_info
{
   artwork_info(){}
   explicit artwork_info( const artwork_object& a );

   artwork_id_type   id;
   string            title;
   account_name_type creator;
   account_name_type owner;
   share_type        price;
   bool              for_sale = false;
   string            content_ref;
   gallery_key_type  gallery;
   uint16_t          royalty_percent = 0;
   time_point_sec    created;
   uint64_t          rating_count = 0;
   uint64_t          rating_sum = 0;
   uint64_t          average_rating = 0;
};

/**
 * @brief The database_api class implements the read only queries of the registry
 *
 * Every call takes a consistent snapshot: it holds the chain mutex shared, so it never
 * observes an operation that is only partly applied, and returns copies.
 */
class database_api
{
   public:
      database_api( chain::database& db, const application_options* app_options = nullptr );
      ~database_api();

      /////////////
      // Objects //
      /////////////

      /**
       * @brief Get the objects corresponding to the provided IDs
       * @param ids IDs of the objects to retrieve
       * @return The objects retrieved, in the order they are mentioned in ids
       *
       * If any of the provided IDs does not map to an object, a null variant is returned in its position.
       */
      fc::variants get_objects( const vector<object_id_type>& ids )const;

      //////////////
      // Galleries //
      //////////////

      fc::optional<gallery_object> get_gallery( const gallery_key_type& key )const;

      /**
       * @return the artworks of the gallery in registration order
       * @throws not_found_exception if no gallery has this key
       */
      vector<artwork_id_type> get_gallery_artworks( const gallery_key_type& key )const;

      /// @return keys of the galleries created by @p curator, oldest first
      vector<gallery_key_type> get_galleries_by_curator( const account_name_type& curator )const;

      //////////////
      // Artworks //
      //////////////

      fc::optional<artwork_info> get_artwork( artwork_id_type id )const;

      /// @return the artworks registered in the gallery, empty for an unknown key
      vector<artwork_id_type> get_artworks_by_gallery( const gallery_key_type& key )const;

      /**
       * @return every artwork @p account ever acquired, by registering or buying, in
       * acquisition order. Artworks the account sold since are still listed.
       */
      vector<artwork_id_type> get_artworks_by_owner( const account_name_type& account )const;

      /////////////
      // Reviews //
      /////////////

      /**
       * @return integer mean of the ratings of the artwork, 0 if it has none
       * @throws not_found_exception for an unknown artwork
       */
      uint64_t get_average_rating( artwork_id_type id )const;

      /**
       * @param id the artwork
       * @param start first review to return, 0 for the oldest
       * @param limit maximum number of results
       */
      vector<review_object> get_reviews( artwork_id_type id, review_id_type start, uint32_t limit )const;

      //////////////
      // Platform //
      //////////////

      uint16_t          get_platform_fee()const;
      account_name_type get_administrator()const;

      ////////////
      // Events //
      ////////////

      /**
       * @param start sequence number of the first entry to return
       * @param limit maximum number of entries, at most api_limit_get_events
       * @return log entries in sequence order
       */
      vector<event_history_object> get_events( uint64_t start, uint32_t limit )const;

      /// @return the sequence number the next log entry will get
      uint64_t get_next_event_sequence()const;

   private:
      std::shared_ptr< database_api_impl > my;
};

} } // atelier::app

FC_REFLECT( atelier::app::artwork_info,
            (id)(title)(creator)(owner)(price)(for_sale)(content_ref)(gallery)(royalty_percent)
            (created)(rating_count)(rating_sum)(average_rating) )
