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
#include <atelier/db/object_id.hpp>

#include <fc/string.hpp>

#include <vector>

#include <boost/algorithm/string/split.hpp>

namespace atelier { namespace db {

object_id_type::object_id_type( const string& s )
{ try {
   std::vector<string> parts;
   boost::split( parts, s, []( char c ){ return c == '.'; } );
   FC_ASSERT( parts.size() == 3, "Object id must have the form space.type.instance" );
   const uint64_t space = fc::to_uint64( parts[0] );
   const uint64_t type = fc::to_uint64( parts[1] );
   FC_ASSERT( space <= 0xff && type <= 0xff, "Object id space or type out of range" );
   *this = object_id_type( uint8_t(space), uint8_t(type), fc::to_uint64( parts[2] ) );
} FC_CAPTURE_AND_RETHROW( (s) ) }

object_id_type::operator string()const
{
   return fc::to_string( uint64_t(space()) ) + "." + fc::to_string( uint64_t(type()) ) + "."
          + fc::to_string( instance() );
}

} } // atelier::db

namespace fc {

void to_variant( const atelier::db::object_id_type& var, fc::variant& vo, uint32_t max_depth )
{
   vo = static_cast<std::string>( var );
}

void from_variant( const fc::variant& var, atelier::db::object_id_type& vo, uint32_t max_depth )
{
   vo = atelier::db::object_id_type( var.as_string() );
}

} // fc
