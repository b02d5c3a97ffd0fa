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
#include <atelier/listing_history/listing_history_plugin.hpp>

#include <fc/log/logger.hpp>

#include <boost/signals2/connection.hpp>

#include <limits>
#include <mutex>
#include <shared_mutex>

namespace atelier { namespace listing_history {

namespace detail {

class listing_history_impl
{
   public:
      explicit listing_history_impl( listing_history_plugin& _plugin ) : _self(_plugin) {}

      chain::database& database() { return _self.database(); }

      void apply_events( const vector<event_history_object>& events );
      void replay_database();

      void apply_entry( const event_history_object& entry );
      /// stored entries with start <= sequence < end
      vector<event_history_object> load_events( uint64_t start, uint64_t end );

      listing_summary*  find_listing( artwork_id_type id );
      account_earnings* find_earnings( const account_name_type& account );

      listing_history_plugin& _self;

      mutable std::mutex _mutex;

      std::map<artwork_id_type, listing_summary>    _listings;
      std::map<account_name_type, account_earnings> _earnings;
      std::map<artwork_id_type, account_name_type>  _last_seller;
      std::set<account_name_type>                   _tracked_accounts;
      uint16_t                                      _platform_fee = ATELIER_DEFAULT_PLATFORM_FEE;
      uint64_t                                      _next_sequence = 0;

      boost::signals2::scoped_connection            _applied_events_connection;
};

struct event_process_listing
{
   listing_history_impl& _impl;

   explicit event_process_listing( listing_history_impl& impl ) : _impl(impl) {}

   typedef void result_type;

   void operator()( const gallery_created_event& ) const {}

   void operator()( const artwork_created_event& e ) const
   {
      listing_summary& l = _impl._listings[e.artwork];
      l.artwork         = e.artwork;
      l.title           = e.title;
      l.gallery         = e.gallery;
      l.creator         = e.creator;
      l.owner           = e.creator;
      l.price           = e.price;
      l.for_sale        = true;
      l.royalty_percent = e.royalty_percent;
      l.provenance.push_back( e.creator );
   }

   void operator()( const artwork_sold_event& e ) const
   {
      listing_summary* l = _impl.find_listing( e.artwork );
      FC_ASSERT( l != nullptr, "Sale of unknown artwork ${a}", ("a",e.artwork) );
      l->owner           = e.buyer;
      l->for_sale        = false;
      l->sales          += 1;
      l->last_sale_price = e.payment;
      l->provenance.push_back( e.buyer );
      _impl._last_seller[e.artwork] = e.seller;

      // the seller is credited with the whole payment, royalty and fee events deduct their share
      if( account_earnings* seller = _impl.find_earnings( e.seller ) )
      {
         seller->sale_proceeds += e.payment;
         seller->artworks_sold += 1;
      }
      if( account_earnings* buyer = _impl.find_earnings( e.buyer ) )
      {
         buyer->purchases       += e.payment;
         buyer->artworks_bought += 1;
      }
   }

   void operator()( const royalty_paid_event& e ) const
   {
      if( listing_summary* l = _impl.find_listing( e.artwork ) )
         l->royalties_paid += e.amount;
      if( account_earnings* creator = _impl.find_earnings( e.creator ) )
         creator->royalties += e.amount;
      deduct_from_seller( e.artwork, e.amount );
   }

   void operator()( const platform_fee_paid_event& e ) const
   {
      if( account_earnings* administrator = _impl.find_earnings( e.administrator ) )
         administrator->platform_fees += e.amount;
      deduct_from_seller( e.artwork, e.amount );
   }

   void operator()( const price_updated_event& e ) const
   {
      listing_summary* l = _impl.find_listing( e.artwork );
      FC_ASSERT( l != nullptr, "Price update of unknown artwork ${a}", ("a",e.artwork) );
      l->price    = e.new_price;
      l->for_sale = true;
   }

   void operator()( const review_added_event& e ) const
   {
      listing_summary* l = _impl.find_listing( e.artwork );
      FC_ASSERT( l != nullptr, "Review of unknown artwork ${a}", ("a",e.artwork) );
      l->rating_count += 1;
      l->rating_sum   += e.rating;
   }

   void operator()( const platform_fee_updated_event& e ) const
   {
      _impl._platform_fee = e.new_fee;
   }

   private:
      void deduct_from_seller( artwork_id_type artwork, share_type amount )const
      {
         auto itr = _impl._last_seller.find( artwork );
         if( itr == _impl._last_seller.end() )
            return;
         if( account_earnings* seller = _impl.find_earnings( itr->second ) )
            seller->sale_proceeds -= amount;
      }
};

listing_summary* listing_history_impl::find_listing( artwork_id_type id )
{
   auto itr = _listings.find( id );
   return itr == _listings.end() ? nullptr : &itr->second;
}

account_earnings* listing_history_impl::find_earnings( const account_name_type& account )
{
   if( !_tracked_accounts.empty() && _tracked_accounts.find( account ) == _tracked_accounts.end() )
      return nullptr;
   account_earnings& result = _earnings[account];
   result.account = account;
   return &result;
}

void listing_history_impl::apply_events( const vector<event_history_object>& events )
{
   std::unique_lock<std::mutex> guard( _mutex );
   for( const event_history_object& entry : events )
   {
      if( entry.sequence() < _next_sequence )
         continue;
      if( entry.sequence() > _next_sequence )
      {
         // the chain lock is never taken while holding _mutex
         const uint64_t first_missing = _next_sequence;
         guard.unlock();
         const vector<event_history_object> missing = load_events( first_missing, entry.sequence() );
         guard.lock();
         for( const event_history_object& m : missing )
            if( m.sequence() >= _next_sequence )
               apply_entry( m );
         if( _next_sequence < entry.sequence() )
            wlog( "listing_history: events ${from} to ${to} are missing, the projection is incomplete",
                  ("from",_next_sequence)("to",entry.sequence() - 1) );
         if( entry.sequence() < _next_sequence )
            continue;
      }
      apply_entry( entry );
   }
}

void listing_history_impl::apply_entry( const event_history_object& entry )
{
   try {
      entry.event.visit( event_process_listing( *this ) );
   } catch( const fc::exception& e ) {
      elog( "listing_history: skipping event ${n}: ${e}", ("n",entry.sequence())("e",e.to_detail_string()) );
   }
   _next_sequence = entry.sequence() + 1;
}

vector<event_history_object> listing_history_impl::load_events( uint64_t start, uint64_t end )
{
   chain::database& db = database();
   // an operation in progress on this thread already holds the chain lock
   std::shared_lock<std::shared_timed_mutex> lock( db.chain_mutex(), std::defer_lock );
   if( !db.is_applying_operation() )
      lock.lock();

   vector<event_history_object> result;
   const auto& idx = db.get_index_type<event_history_index>().indices().get<by_id>();
   for( auto itr = idx.lower_bound( event_history_id_type( start ) );
        itr != idx.end() && itr->sequence() < end; ++itr )
      result.push_back( *itr );
   return result;
}

void listing_history_impl::replay_database()
{
   uint64_t start = 0;
   {
      std::lock_guard<std::mutex> guard( _mutex );
      start = _next_sequence;
   }
   const vector<event_history_object> events = load_events( start, std::numeric_limits<uint64_t>::max() );
   apply_events( events );
   ilog( "listing_history: replayed ${n} events", ("n",events.size()) );
}

} // end namespace detail

listing_history_plugin::listing_history_plugin( atelier::app::application& app ) :
   plugin(app),
   my( new detail::listing_history_impl(*this) )
{
}

listing_history_plugin::~listing_history_plugin() = default;

std::string listing_history_plugin::plugin_name()const
{
   return "listing_history";
}

std::string listing_history_plugin::plugin_description()const
{
   return "Keeps listings, provenance and earnings per account, built from the event log.";
}

void listing_history_plugin::plugin_set_program_options(
   boost::program_options::options_description& cli,
   boost::program_options::options_description& cfg
   )
{
   cli.add_options()
         ("listing-history-track-account", boost::program_options::value<std::vector<std::string>>()->composing()->multitoken(),
          "Account to keep earnings for (may specify multiple times, all accounts if omitted)")
         ;
   cfg.add(cli);
}

void listing_history_plugin::plugin_initialize( const boost::program_options::variables_map& options )
{ try {
   if( options.count("listing-history-track-account") > 0 )
   {
      const auto& accounts = options["listing-history-track-account"].as<std::vector<std::string>>();
      my->_tracked_accounts.insert( accounts.begin(), accounts.end() );
   }
   if( options.count("platform-fee") > 0 )
      my->_platform_fee = static_cast<uint16_t>( options["platform-fee"].as<uint32_t>() );

   my->_applied_events_connection = database().applied_events.connect(
      [this]( const vector<event_history_object>& events ){ my->apply_events( events ); } );
} FC_LOG_AND_RETHROW() }

void listing_history_plugin::plugin_startup()
{
   ilog( "listing_history: plugin_startup() begin" );
   my->replay_database();
}

void listing_history_plugin::plugin_shutdown()
{
   my->_applied_events_connection.disconnect();
}

void listing_history_plugin::apply_events( const vector<event_history_object>& events )
{
   my->apply_events( events );
}

fc::optional<listing_summary> listing_history_plugin::get_listing( artwork_id_type id )const
{
   std::lock_guard<std::mutex> guard( my->_mutex );
   auto itr = my->_listings.find( id );
   if( itr == my->_listings.end() )
      return fc::optional<listing_summary>();
   return itr->second;
}

vector<listing_summary> listing_history_plugin::get_listings_for_sale()const
{
   std::lock_guard<std::mutex> guard( my->_mutex );
   vector<listing_summary> result;
   for( const auto& entry : my->_listings )
      if( entry.second.for_sale )
         result.push_back( entry.second );
   return result;
}

account_earnings listing_history_plugin::get_account_earnings( const account_name_type& account )const
{
   std::lock_guard<std::mutex> guard( my->_mutex );
   auto itr = my->_earnings.find( account );
   if( itr == my->_earnings.end() )
   {
      account_earnings empty;
      empty.account = account;
      return empty;
   }
   return itr->second;
}

uint16_t listing_history_plugin::get_platform_fee()const
{
   std::lock_guard<std::mutex> guard( my->_mutex );
   return my->_platform_fee;
}

uint64_t listing_history_plugin::get_next_sequence()const
{
   std::lock_guard<std::mutex> guard( my->_mutex );
   return my->_next_sequence;
}

} }
