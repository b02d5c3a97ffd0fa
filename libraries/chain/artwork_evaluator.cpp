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
#include <atelier/chain/artwork_evaluator.hpp>
#include <atelier/chain/artwork_object.hpp>
#include <atelier/chain/database.hpp>
#include <atelier/chain/gallery_object.hpp>

namespace atelier { namespace chain {

void_result artwork_create_evaluator::do_evaluate( const artwork_create_operation& op )
{ try {
   const database& d = db();
   _gallery = d.find_gallery( op.gallery );
   ATELIER_ASSERT( _gallery != nullptr && _gallery->is_active, not_found_exception,
                   "Gallery ${g} does not exist", ("g",op.gallery) );
   ATELIER_ASSERT( op.royalty_percent <= ATELIER_100_PERCENT, invalid_argument_exception,
                   "Royalty of ${r}% is out of range", ("r",op.royalty_percent) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type artwork_create_evaluator::do_apply( const artwork_create_operation& o )
{ try {
   database& d = db();
   const auto& new_artwork = d.create<artwork_object>( [&o,&d]( artwork_object& obj )
   {
      obj.title           = o.title;
      obj.creator         = o.creator;
      obj.owner           = o.creator;
      obj.price           = o.price;
      obj.for_sale        = true;
      obj.content_ref     = o.content_ref;
      obj.gallery         = o.gallery;
      obj.royalty_percent = o.royalty_percent;
      obj.created         = d.head_time();
   });
   const artwork_id_type artwork_id = new_artwork.get_id();

   d.modify( *_gallery, [artwork_id]( gallery_object& g ) {
      g.artworks.push_back( artwork_id );
   });
   d.create<artwork_holding_object>( [&o,&d,artwork_id]( artwork_holding_object& h ) {
      h.account  = o.creator;
      h.artwork  = artwork_id;
      h.acquired = d.head_time();
   });

   artwork_created_event e;
   e.artwork         = artwork_id;
   e.title           = o.title;
   e.creator         = o.creator;
   e.price           = o.price;
   e.content_ref     = o.content_ref;
   e.gallery         = o.gallery;
   e.royalty_percent = o.royalty_percent;
   d.push_event( e );

   return new_artwork.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result artwork_update_price_evaluator::do_evaluate( const artwork_update_price_operation& op )
{ try {
   const database& d = db();
   _artwork = d.find_artwork( op.artwork );
   ATELIER_ASSERT( _artwork != nullptr, not_found_exception, "Artwork ${a} does not exist", ("a",op.artwork) );
   ATELIER_ASSERT( _artwork->owner == op.owner, unauthorized_exception,
                   "Only the owner can update the price of artwork ${a}", ("a",op.artwork)("caller",op.owner) );
   ATELIER_ASSERT( op.new_price > 0, invalid_argument_exception,
                   "Price must be greater than 0", ("price",op.new_price) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result artwork_update_price_evaluator::do_apply( const artwork_update_price_operation& o )
{ try {
   database& d = db();
   d.modify( *_artwork, [&o]( artwork_object& a ) {
      a.price    = o.new_price;
      a.for_sale = true;
   });
   d.push_event( price_updated_event( o.artwork, o.owner, o.new_price ) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result artwork_purchase_evaluator::do_evaluate( const artwork_purchase_operation& op )
{ try {
   const database& d = db();
   _artwork = d.find_artwork( op.artwork );
   ATELIER_ASSERT( _artwork != nullptr, not_found_exception, "Artwork ${a} does not exist", ("a",op.artwork) );
   ATELIER_ASSERT( _artwork->for_sale, not_for_sale_exception, "Artwork ${a} is not for sale", ("a",op.artwork) );
   ATELIER_ASSERT( op.payment >= _artwork->price, insufficient_payment_exception,
                   "Insufficient payment", ("payment",op.payment)("price",_artwork->price) );

   _split = split_payment( op.payment, d.get_global_properties().platform_fee, _artwork->royalty_percent,
                           _artwork->owner == _artwork->creator );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result artwork_purchase_evaluator::do_apply( const artwork_purchase_operation& o )
{ try {
   database& d = db();
   const account_name_type seller        = _artwork->owner;
   const account_name_type creator       = _artwork->creator;
   const account_name_type administrator = d.get_global_properties().administrator;

   d.modify( *_artwork, [&o]( artwork_object& a ) {
      a.owner    = o.buyer;
      a.for_sale = false;
   });
   d.create<artwork_holding_object>( [&o,&d]( artwork_holding_object& h ) {
      h.account  = o.buyer;
      h.artwork  = o.artwork;
      h.acquired = d.head_time();
   });
   d.push_event( artwork_sold_event( o.artwork, seller, o.buyer, o.payment ) );

   // Funds move last. The registry state must not be touched below this line.
   if( _split.royalty > 0 )
   {
      d.transfer( creator, _split.royalty );
      d.push_event( royalty_paid_event( o.artwork, creator, _split.royalty ) );
   }
   if( _split.platform_fee > 0 )
   {
      d.transfer( administrator, _split.platform_fee );
      d.push_event( platform_fee_paid_event( o.artwork, administrator, _split.platform_fee ) );
   }
   d.transfer( seller, _split.seller_proceeds );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // atelier::chain
