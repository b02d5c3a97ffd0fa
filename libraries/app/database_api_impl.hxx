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

#include <atelier/app/database_api.hpp>

namespace atelier { namespace app {

class database_api_impl : public std::enable_shared_from_this<database_api_impl>
{
   public:
      explicit database_api_impl( chain::database& db, const application_options* app_options );
      virtual ~database_api_impl();

      // Objects
      fc::variants get_objects( const vector<object_id_type>& ids )const;

      // Galleries
      fc::optional<gallery_object> get_gallery( const gallery_key_type& key )const;
      vector<artwork_id_type> get_gallery_artworks( const gallery_key_type& key )const;
      vector<gallery_key_type> get_galleries_by_curator( const account_name_type& curator )const;

      // Artworks
      fc::optional<artwork_info> get_artwork( artwork_id_type id )const;
      vector<artwork_id_type> get_artworks_by_gallery( const gallery_key_type& key )const;
      vector<artwork_id_type> get_artworks_by_owner( const account_name_type& account )const;

      // Reviews
      uint64_t get_average_rating( artwork_id_type id )const;
      vector<review_object> get_reviews( artwork_id_type id, review_id_type start, uint32_t limit )const;

      // Platform
      uint16_t get_platform_fee()const;
      account_name_type get_administrator()const;

      // Events
      vector<event_history_object> get_events( uint64_t start, uint32_t limit )const;
      uint64_t get_next_event_sequence()const;

   private:
      typedef std::shared_lock<std::shared_timed_mutex> read_lock;

      read_lock lock_chain()const
      {
         if( _db.is_applying_operation() )
            return read_lock( _db.chain_mutex(), std::defer_lock );
         return read_lock( _db.chain_mutex() );
      }

      const application_options* _app_options = nullptr;
      const chain::database&     _db;
};

} } // atelier::app
