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
#include "database_api_impl.hxx"

#include <fc/log/logger.hpp>

#include <algorithm>
#include <iterator>

namespace atelier { namespace app {

artwork_info::artwork_info( const artwork_object& a )
:id(a.get_id()),
 title(a.title),
 creator(a.creator),
 owner(a.owner),
 price(a.price),
 for_sale(a.for_sale),
 content_ref(a.content_ref),
 gallery(a.gallery),
 royalty_percent(a.royalty_percent),
 created(a.created),
 rating_count(a.rating_count),
 rating_sum(a.rating_sum),
 average_rating(a.average_rating())
{}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Constructors                                                     //
//                                                                  //
//////////////////////////////////////////////////////////////////////

database_api::database_api( chain::database& db, const application_options* app_options )
   : my( new database_api_impl( db, app_options ) ) {}

database_api::~database_api() {}

database_api_impl::database_api_impl( chain::database& db, const application_options* app_options )
:_app_options( app_options != nullptr ? app_options : &application_options::get_default() ), _db(db)
{
   dlog( "creating database api ${x}", ("x",int64_t(this)) );
}

database_api_impl::~database_api_impl()
{
   dlog( "freeing database api ${x}", ("x",int64_t(this)) );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Objects                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

fc::variants database_api::get_objects( const vector<object_id_type>& ids )const
{
   return my->get_objects( ids );
}

fc::variants database_api_impl::get_objects( const vector<object_id_type>& ids )const
{
   auto lock = lock_chain();

   fc::variants result;
   result.reserve( ids.size() );

   std::transform( ids.begin(), ids.end(), std::back_inserter(result),
                   [this]( object_id_type id ) -> fc::variant {
      const object* obj = nullptr;
      try {
         obj = _db.find_object( id );
      } catch( const fc::assert_exception& ) {
         // no index for this space and type
      }
      if( obj != nullptr )
         return obj->to_variant();
      return {};
   });

   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Galleries                                                        //
//                                                                  //
//////////////////////////////////////////////////////////////////////

fc::optional<gallery_object> database_api::get_gallery( const gallery_key_type& key )const
{
   return my->get_gallery( key );
}

fc::optional<gallery_object> database_api_impl::get_gallery( const gallery_key_type& key )const
{
   auto lock = lock_chain();
   const gallery_object* gallery = _db.find_gallery( key );
   if( gallery == nullptr )
      return fc::optional<gallery_object>();
   return *gallery;
}

vector<artwork_id_type> database_api::get_gallery_artworks( const gallery_key_type& key )const
{
   return my->get_gallery_artworks( key );
}

vector<artwork_id_type> database_api_impl::get_gallery_artworks( const gallery_key_type& key )const
{
   auto lock = lock_chain();
   const gallery_object* gallery = _db.find_gallery( key );
   ATELIER_ASSERT( gallery != nullptr, not_found_exception, "Gallery ${g} does not exist", ("g",key) );
   return gallery->artworks;
}

vector<gallery_key_type> database_api::get_galleries_by_curator( const account_name_type& curator )const
{
   return my->get_galleries_by_curator( curator );
}

vector<gallery_key_type> database_api_impl::get_galleries_by_curator( const account_name_type& curator )const
{
   auto lock = lock_chain();
   const auto& by_curator_idx = _db.get_index_type<gallery_index>().indices().get<by_curator>();
   auto range = by_curator_idx.equal_range( boost::make_tuple( curator ) );

   vector<gallery_key_type> result;
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->key );
   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Artworks                                                         //
//                                                                  //
//////////////////////////////////////////////////////////////////////

fc::optional<artwork_info> database_api::get_artwork( artwork_id_type id )const
{
   return my->get_artwork( id );
}

fc::optional<artwork_info> database_api_impl::get_artwork( artwork_id_type id )const
{
   auto lock = lock_chain();
   const artwork_object* artwork = _db.find_artwork( id );
   if( artwork == nullptr )
      return fc::optional<artwork_info>();
   return artwork_info( *artwork );
}

vector<artwork_id_type> database_api::get_artworks_by_gallery( const gallery_key_type& key )const
{
   return my->get_artworks_by_gallery( key );
}

vector<artwork_id_type> database_api_impl::get_artworks_by_gallery( const gallery_key_type& key )const
{
   auto lock = lock_chain();
   const auto& by_gallery_idx = _db.get_index_type<artwork_index>().indices().get<by_gallery>();
   auto range = by_gallery_idx.equal_range( boost::make_tuple( key ) );

   vector<artwork_id_type> result;
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->get_id() );
   return result;
}

vector<artwork_id_type> database_api::get_artworks_by_owner( const account_name_type& account )const
{
   return my->get_artworks_by_owner( account );
}

vector<artwork_id_type> database_api_impl::get_artworks_by_owner( const account_name_type& account )const
{
   auto lock = lock_chain();
   const auto& by_account_idx = _db.get_index_type<artwork_holding_index>().indices().get<by_account>();
   auto range = by_account_idx.equal_range( boost::make_tuple( account ) );

   vector<artwork_id_type> result;
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->artwork );
   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Reviews                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

uint64_t database_api::get_average_rating( artwork_id_type id )const
{
   return my->get_average_rating( id );
}

uint64_t database_api_impl::get_average_rating( artwork_id_type id )const
{
   auto lock = lock_chain();
   return _db.get_artwork( id ).average_rating();
}

vector<review_object> database_api::get_reviews( artwork_id_type id, review_id_type start, uint32_t limit )const
{
   return my->get_reviews( id, start, limit );
}

vector<review_object> database_api_impl::get_reviews( artwork_id_type id, review_id_type start, uint32_t limit )const
{
   const auto configured_limit = _app_options->api_limit_get_reviews;
   FC_ASSERT( limit <= configured_limit,
              "limit can not be greater than ${configured_limit}",
              ("configured_limit", configured_limit) );

   auto lock = lock_chain();
   ATELIER_ASSERT( _db.find_artwork( id ) != nullptr, not_found_exception, "Artwork ${a} does not exist", ("a",id) );

   const auto& by_artwork_idx = _db.get_index_type<review_index>().indices().get<by_artwork>();
   auto itr = by_artwork_idx.lower_bound( boost::make_tuple( id, object_id_type( start ) ) );

   vector<review_object> result;
   while( itr != by_artwork_idx.end() && itr->artwork == id && limit-- )
   {
      result.push_back( *itr );
      ++itr;
   }
   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Platform                                                         //
//                                                                  //
//////////////////////////////////////////////////////////////////////

uint16_t database_api::get_platform_fee()const
{
   return my->get_platform_fee();
}

uint16_t database_api_impl::get_platform_fee()const
{
   auto lock = lock_chain();
   return _db.get_global_properties().platform_fee;
}

account_name_type database_api::get_administrator()const
{
   return my->get_administrator();
}

account_name_type database_api_impl::get_administrator()const
{
   auto lock = lock_chain();
   return _db.get_global_properties().administrator;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Events                                                           //
//                                                                  //
//////////////////////////////////////////////////////////////////////

vector<event_history_object> database_api::get_events( uint64_t start, uint32_t limit )const
{
   return my->get_events( start, limit );
}

vector<event_history_object> database_api_impl::get_events( uint64_t start, uint32_t limit )const
{
   const auto configured_limit = _app_options->api_limit_get_events;
   FC_ASSERT( limit <= configured_limit,
              "limit can not be greater than ${configured_limit}",
              ("configured_limit", configured_limit) );

   auto lock = lock_chain();
   const auto& events = _db.get_index_type<event_history_index>().indices().get<by_id>();
   auto itr = events.lower_bound( event_history_id_type( start ) );

   vector<event_history_object> result;
   while( itr != events.end() && limit-- )
   {
      result.push_back( *itr );
      ++itr;
   }
   return result;
}

uint64_t database_api::get_next_event_sequence()const
{
   return my->get_next_event_sequence();
}

uint64_t database_api_impl::get_next_event_sequence()const
{
   auto lock = lock_chain();
   return _db.get_next_event_sequence();
}

} } // atelier::app
