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
#include <atelier/chain/review_evaluator.hpp>
#include <atelier/chain/artwork_object.hpp>
#include <atelier/chain/database.hpp>
#include <atelier/chain/review_object.hpp>

namespace atelier { namespace chain {

void_result review_add_evaluator::do_evaluate( const review_add_operation& op )
{ try {
   const database& d = db();
   _artwork = d.find_artwork( op.artwork );
   ATELIER_ASSERT( _artwork != nullptr, not_found_exception, "Artwork ${a} does not exist", ("a",op.artwork) );
   ATELIER_ASSERT( op.rating >= ATELIER_MIN_REVIEW_RATING && op.rating <= ATELIER_MAX_REVIEW_RATING,
                   invalid_argument_exception, "Rating must be between ${min} and ${max}",
                   ("min",ATELIER_MIN_REVIEW_RATING)("max",ATELIER_MAX_REVIEW_RATING)("rating",op.rating) );

   const auto& by_reviewer = d.get_index_type<review_index>().indices().get<by_artwork_reviewer>();
   ATELIER_ASSERT( by_reviewer.find( boost::make_tuple( op.artwork, op.reviewer ) ) == by_reviewer.end(),
                   already_rated_exception, "User has already rated this artwork",
                   ("artwork",op.artwork)("reviewer",op.reviewer) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type review_add_evaluator::do_apply( const review_add_operation& o )
{ try {
   database& d = db();
   const auto& new_review = d.create<review_object>( [&o,&d]( review_object& obj )
   {
      obj.artwork   = o.artwork;
      obj.reviewer  = o.reviewer;
      obj.comment   = o.comment;
      obj.rating    = o.rating;
      obj.timestamp = d.head_time();
   });
   d.modify( *_artwork, [&o]( artwork_object& a ) {
      a.rating_count += 1;
      a.rating_sum   += o.rating;
   });
   d.push_event( review_added_event( o.artwork, o.reviewer, o.comment, o.rating ) );
   return new_review.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // atelier::chain
