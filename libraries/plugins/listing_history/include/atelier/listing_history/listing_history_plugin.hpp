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

#include <atelier/app/plugin.hpp>
#include <atelier/chain/database.hpp>
#include <atelier/chain/event_history_object.hpp>

namespace atelier { namespace listing_history {
using namespace chain;

namespace detail
{
    class listing_history_impl;
}

/**
 * What the event log says about one artwork.
 */
struct listing_summary
{
   artwork_id_type            artwork;
   string                     title;
   gallery_key_type           gallery;
   account_name_type          creator;
   account_name_type          owner;
   share_type                 price;
   bool                       for_sale = true;
   uint16_t                   royalty_percent = 0;
   uint64_t                   rating_count = 0;
   uint64_t                   rating_sum = 0;
   uint32_t                   sales = 0;
   share_type                 last_sale_price;
   share_type                 royalties_paid;
   /// creator first, then every buyer
   vector<account_name_type>  provenance;
};

/**
 * What one account earned and spent according to the event log.
 */
struct account_earnings
{
   account_name_type account;
   share_type        royalties;
   share_type        platform_fees;
   share_type        sale_proceeds;
   share_type        purchases;
   uint32_t          artworks_bought = 0;
   uint32_t          artworks_sold = 0;
};

/**
 * Builds a read model of listings and earnings from the event log alone.
 *
 * At startup the plugin replays the events already in the database, afterwards it
 * follows database::applied_events. A log saved to a file can be loaded with
 * apply_events() as well.
 */
class listing_history_plugin : public atelier::app::plugin
{
   public:
      explicit listing_history_plugin( atelier::app::application& app );
      ~listing_history_plugin() override;

      std::string plugin_name()const override;
      std::string plugin_description()const override;
      void plugin_set_program_options(
         boost::program_options::options_description& cli,
         boost::program_options::options_description& cfg ) override;
      void plugin_initialize( const boost::program_options::variables_map& options ) override;
      void plugin_startup() override;
      void plugin_shutdown() override;

      /// Applies log entries in sequence order, entries already seen are skipped
      void apply_events( const vector<event_history_object>& events );

      fc::optional<listing_summary> get_listing( artwork_id_type id )const;
      vector<listing_summary>       get_listings_for_sale()const;
      /// @return an all zero record for accounts without activity or not tracked
      account_earnings              get_account_earnings( const account_name_type& account )const;
      uint16_t                      get_platform_fee()const;
      /// sequence number of the next log entry the plugin expects
      uint64_t                      get_next_sequence()const;

      friend class detail::listing_history_impl;
      std::unique_ptr<detail::listing_history_impl> my;
};

} } //atelier::listing_history

FC_REFLECT( atelier::listing_history::listing_summary,
            (artwork)(title)(gallery)(creator)(owner)(price)(for_sale)(royalty_percent)
            (rating_count)(rating_sum)(sales)(last_sale_price)(royalties_paid)(provenance) )
FC_REFLECT( atelier::listing_history::account_earnings,
            (account)(royalties)(platform_fees)(sale_proceeds)(purchases)(artworks_bought)(artworks_sold) )
