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
#include <atelier/chain/gallery_evaluator.hpp>
#include <atelier/chain/database.hpp>
#include <atelier/chain/gallery_object.hpp>

namespace atelier { namespace chain {

void_result gallery_create_evaluator::do_evaluate( const gallery_create_operation& op )
{ try {
   const database& d = db();
   ATELIER_ASSERT( d.find_gallery( op.key ) == nullptr, already_exists_exception,
                   "Gallery ID already exists", ("key",op.key) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type gallery_create_evaluator::do_apply( const gallery_create_operation& o )
{ try {
   database& d = db();
   const auto& new_gallery = d.create<gallery_object>( [&o,&d]( gallery_object& obj )
   {
      obj.key         = o.key;
      obj.name        = o.name;
      obj.description = o.description;
      obj.curator     = o.curator;
      obj.is_active   = true;
      obj.created     = d.head_time();
   });

   d.push_event( gallery_created_event( o.key, o.name, o.description, o.curator ) );
   return new_gallery.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // atelier::chain
