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
#include <atelier/chain/database.hpp>

#include <atelier/chain/artwork_object.hpp>
#include <atelier/chain/gallery_object.hpp>

namespace atelier { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return get<global_property_object>( global_property_id_type() );
}

const gallery_object* database::find_gallery( const gallery_key_type& key )const
{
   const auto& by_key_idx = get_index_type<gallery_index>().indices().get<by_key>();
   auto itr = by_key_idx.find( key );
   return itr == by_key_idx.end() ? nullptr : &*itr;
}

const artwork_object* database::find_artwork( artwork_id_type id )const
{
   return find<artwork_object>( id );
}

const artwork_object& database::get_artwork( artwork_id_type id )const
{
   const artwork_object* artwork = find_artwork( id );
   ATELIER_ASSERT( artwork != nullptr, not_found_exception, "Artwork ${a} does not exist", ("a",id) );
   return *artwork;
}

uint64_t database::get_next_event_sequence()const
{
   return get_index<event_history_object>().get_next_id().instance();
}

} } // atelier::chain
