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

#include <fc/exception/exception.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/variant.hpp>

#include <cstdint>
#include <functional>
#include <string>

#define ATELIER_DB_MAX_INSTANCE_ID  (uint64_t(-1)>>16)

namespace atelier { namespace db {
   using std::string;

   /**
    *  An object id packs the space, the type and the instance number into 64 bits:
    *  8 bits of space, 8 bits of type and 48 bits of instance.
    */
   struct object_id_type
   {
      object_id_type( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i >> 48 == 0, "instance overflow", ("instance",i) );
         number = ((uint64_t(s)<<56) | (uint64_t(t)<<48) | i);
      }
      object_id_type(){ number = 0; }
      explicit object_id_type( const string& s );

      uint8_t  space()const       { return number >> 56;              }
      uint8_t  type()const        { return number >> 48 & 0x00ff;     }
      uint16_t space_type()const  { return number >> 48;              }
      uint64_t instance()const    { return number & ATELIER_DB_MAX_INSTANCE_ID; }
      bool     is_null()const     { return number == 0; }
      explicit operator uint64_t()const { return number; }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }
      friend bool operator >  ( const object_id_type& a, const object_id_type& b ) { return a.number > b.number; }

      object_id_type& operator++() { ++number; return *this; }

      friend object_id_type operator+( const object_id_type& a, int64_t delta )
      {
         return object_id_type( a.space(), a.type(), a.instance() + delta );
      }
      friend size_t hash_value( const object_id_type& v ) { return std::hash<uint64_t>()(v.number); }

      template< typename T >
      bool is()const
      {
         return (number >> 48) == ((uint64_t(T::space_id) << 8) | uint64_t(T::type_id));
      }

      explicit operator string()const;

      uint64_t number;
   };

   template<uint8_t SpaceID, uint8_t TypeID>
   struct object_id
   {
      static constexpr uint8_t space_id = SpaceID;
      static constexpr uint8_t type_id = TypeID;

      object_id() = default;
      object_id( uint64_t i ):instance(i)
      {
         FC_ASSERT( (i >> 48) == 0, "instance overflow", ("instance",i) );
      }
      explicit object_id( const object_id_type& id ):instance(id.instance())
      {
         FC_ASSERT( id.is<object_id>(), "Wrong object id type", ("id",id.number)("expected",(uint16_t(SpaceID)<<8)|TypeID) );
      }

      operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance ); }
      explicit operator uint64_t()const { return object_id_type( *this ).number; }

      friend bool operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool operator <  ( const object_id& a, const object_id& b ) { return a.instance < b.instance; }
      friend bool operator >  ( const object_id& a, const object_id& b ) { return a.instance > b.instance; }
      friend bool operator == ( const object_id_type& a, const object_id& b ) { return a == object_id_type(b); }
      friend bool operator == ( const object_id& a, const object_id_type& b ) { return object_id_type(a) == b; }

      uint64_t instance = 0;
   };

} } // atelier::db

namespace fc {

   void to_variant( const atelier::db::object_id_type& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, atelier::db::object_id_type& vo, uint32_t max_depth = 1 );

   template<uint8_t SpaceID, uint8_t TypeID>
   void to_variant( const atelier::db::object_id<SpaceID,TypeID>& var, fc::variant& vo, uint32_t max_depth = 1 )
   {
      vo = static_cast<std::string>( atelier::db::object_id_type( var ) );
   }

   template<uint8_t SpaceID, uint8_t TypeID>
   void from_variant( const fc::variant& var, atelier::db::object_id<SpaceID,TypeID>& vo, uint32_t max_depth = 1 )
   {
      vo = atelier::db::object_id<SpaceID,TypeID>( atelier::db::object_id_type( var.as_string() ) );
   }

   template<uint8_t SpaceID, uint8_t TypeID>
   struct get_typename<atelier::db::object_id<SpaceID,TypeID>>
   {
      static const char* name()
      {
         static std::string _str = std::string("atelier::db::object_id<") + fc::to_string(uint64_t(SpaceID)) + ":"
                                   + fc::to_string(uint64_t(TypeID)) + ">";
         return _str.c_str();
      }
   };

} // fc

FC_REFLECT_TYPENAME( atelier::db::object_id_type )
