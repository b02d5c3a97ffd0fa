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

#include <atelier/protocol/base.hpp>

namespace atelier { namespace protocol {

   struct gallery_created_event
   {
      gallery_created_event(){}
      gallery_created_event( const gallery_key_type& k, const string& n, const string& d, const account_name_type& c )
      :key(k),name(n),description(d),curator(c){}

      gallery_key_type  key;
      string            name;
      string            description;
      account_name_type curator;
   };

   struct artwork_created_event
   {
      artwork_id_type   artwork;
      string            title;
      account_name_type creator;
      share_type        price;
      string            content_ref;
      gallery_key_type  gallery;
      uint16_t          royalty_percent = 0;
   };

   /// Emitted right after ownership changes hands, before any funds move.
   struct artwork_sold_event
   {
      artwork_sold_event(){}
      artwork_sold_event( artwork_id_type a, const account_name_type& s, const account_name_type& b, share_type p )
      :artwork(a),seller(s),buyer(b),payment(p){}

      artwork_id_type   artwork;
      account_name_type seller;
      account_name_type buyer;
      share_type        payment;
   };

   struct royalty_paid_event
   {
      royalty_paid_event(){}
      royalty_paid_event( artwork_id_type a, const account_name_type& c, share_type r )
      :artwork(a),creator(c),amount(r){}

      artwork_id_type   artwork;
      account_name_type creator;
      share_type        amount;
   };

   struct platform_fee_paid_event
   {
      platform_fee_paid_event(){}
      platform_fee_paid_event( artwork_id_type a, const account_name_type& adm, share_type f )
      :artwork(a),administrator(adm),amount(f){}

      artwork_id_type   artwork;
      account_name_type administrator;
      share_type        amount;
   };

   struct price_updated_event
   {
      price_updated_event(){}
      price_updated_event( artwork_id_type a, const account_name_type& o, share_type p )
      :artwork(a),owner(o),new_price(p){}

      artwork_id_type   artwork;
      account_name_type owner;
      share_type        new_price;
   };

   struct review_added_event
   {
      review_added_event(){}
      review_added_event( artwork_id_type a, const account_name_type& r, const string& c, uint16_t rt )
      :artwork(a),reviewer(r),comment(c),rating(rt){}

      artwork_id_type   artwork;
      account_name_type reviewer;
      string            comment;
      uint16_t          rating = 0;
   };

   struct platform_fee_updated_event
   {
      platform_fee_updated_event(){}
      platform_fee_updated_event( const account_name_type& adm, uint16_t o, uint16_t n )
      :administrator(adm),old_fee(o),new_fee(n){}

      account_name_type administrator;
      uint16_t          old_fee = 0;
      uint16_t          new_fee = 0;
   };

   /**
    * Everything observable that happens in the registry is recorded as one of these.
    * As with operations, the position in the list is the wire tag.
    */
   typedef fc::static_variant<
            /* 0 */ gallery_created_event,
            /* 1 */ artwork_created_event,
            /* 2 */ artwork_sold_event,
            /* 3 */ royalty_paid_event,
            /* 4 */ platform_fee_paid_event,
            /* 5 */ price_updated_event,
            /* 6 */ review_added_event,
            /* 7 */ platform_fee_updated_event
         > event_type;

} } // atelier::protocol

FC_REFLECT( atelier::protocol::gallery_created_event, (key)(name)(description)(curator) )
FC_REFLECT( atelier::protocol::artwork_created_event,
            (artwork)(title)(creator)(price)(content_ref)(gallery)(royalty_percent) )
FC_REFLECT( atelier::protocol::artwork_sold_event, (artwork)(seller)(buyer)(payment) )
FC_REFLECT( atelier::protocol::royalty_paid_event, (artwork)(creator)(amount) )
FC_REFLECT( atelier::protocol::platform_fee_paid_event, (artwork)(administrator)(amount) )
FC_REFLECT( atelier::protocol::price_updated_event, (artwork)(owner)(new_price) )
FC_REFLECT( atelier::protocol::review_added_event, (artwork)(reviewer)(comment)(rating) )
FC_REFLECT( atelier::protocol::platform_fee_updated_event, (administrator)(old_fee)(new_fee) )
