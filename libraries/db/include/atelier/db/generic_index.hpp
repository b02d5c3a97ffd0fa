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

#include <atelier/db/object.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/composite_key.hpp>

#include <cassert>
#include <functional>

namespace atelier { namespace db {
   class object_database;
   using boost::multi_index_container;
   using namespace boost::multi_index;

   struct by_id;

   /**
    *  @class index
    *  @brief abstract base class for accessing objects indexed in various ways.
    *
    *  All indexes assume that there exists an object ID space that will grow
    *  forever in a seqential manner.  These IDs are used to identify the
    *  index, type, and instance of the object.
    */
   class index
   {
      public:
         virtual ~index(){}

         virtual uint8_t object_space_id()const = 0;
         virtual uint8_t object_type_id()const = 0;

         virtual object_id_type get_next_id()const = 0;
         virtual void           use_next_id() = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         /**
          *  Builds a new object and assigns it the next available ID and then
          *  initializes it with constructor and lastly inserts it into the index.
          */
         virtual const object&  create( const std::function<void(object&)>& constructor ) = 0;

         /** Used by the undo database to restore a removed object. */
         virtual const object&  insert( object&& obj ) = 0;

         virtual const object*  find( object_id_type id )const = 0;

         /**
          *  Opens a mutable handle on the object, calls modify on it and then
          *  reindexes the object. If modify throws, the object is put back
          *  in its previous state before the exception is rethrown.
          */
         virtual void           modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void           remove( const object& obj ) = 0;

         virtual void           inspect_all_objects( std::function<void(const object&)> inspector )const = 0;

         const object& get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find Object", ("id",id) );
            return *maybe_found;
         }
   };

   /**
    *  Wraps a derived index and reports every change to the undo database of
    *  the owning object_database, and tracks the next instance number.
    */
   template<typename DerivedIndex>
   class primary_index : public DerivedIndex
   {
      public:
         typedef typename DerivedIndex::object_type object_type;

         explicit primary_index( object_database& db )
            :_db(db),_next_id(object_type::space_id,object_type::type_id,0) {}

         virtual uint8_t object_space_id()const override { return object_type::space_id; }
         virtual uint8_t object_type_id()const override { return object_type::type_id; }

         virtual object_id_type get_next_id()const override { return _next_id; }
         virtual void           use_next_id()override { ++_next_id.number; }
         virtual void           set_next_id( object_id_type id )override { _next_id = id; }

         virtual const object& create( const std::function<void(object&)>& constructor )override;
         virtual const object& insert( object&& obj )override;
         virtual void          modify( const object& obj, const std::function<void(object&)>& m )override;
         virtual void          remove( const object& obj )override;

      private:
         object_database& _db;
         object_id_type   _next_id;
   };

   template<typename ObjectType, typename MultiIndexType>
   class generic_index : public index
   {
      public:
         typedef MultiIndexType index_type;
         typedef ObjectType     object_type;

         virtual const object& create( const std::function<void(object&)>& constructor )override
         {
            ObjectType item;
            item.id = get_next_id();
            constructor( item );
            auto insert_result = _indices.insert( std::move( item ) );
            FC_ASSERT( insert_result.second, "Could not create object! Most likely a uniqueness constraint is violated." );
            use_next_id();
            return *insert_result.first;
         }

         virtual const object& insert( object&& obj )override
         {
            auto insert_result = _indices.insert( std::move( static_cast<ObjectType&>(obj) ) );
            FC_ASSERT( insert_result.second, "Could not insert object, most likely a uniqueness constraint was violated" );
            return *insert_result.first;
         }

         virtual void modify( const object& obj, const std::function<void(object&)>& m )override
         {
            assert( nullptr != dynamic_cast<const ObjectType*>(&obj) );
            std::exception_ptr exc;
            auto ok = _indices.modify( _indices.iterator_to( static_cast<const ObjectType&>(obj) ),
                                       [&m,&exc]( ObjectType& o ) {
               try {
                  m(o);
               } catch ( ... ) {
                  exc = std::current_exception();
               }
            });
            if( exc )
               std::rethrow_exception( exc );
            FC_ASSERT( ok, "Could not modify object, most likely an index constraint was violated" );
         }

         virtual void remove( const object& obj )override
         {
            _indices.erase( _indices.iterator_to( static_cast<const ObjectType&>(obj) ) );
         }

         virtual const object* find( object_id_type id )const override
         {
            auto itr = _indices.find( id );
            if( itr == _indices.end() ) return nullptr;
            return &*itr;
         }

         virtual void inspect_all_objects( std::function<void(const object&)> inspector )const override
         {
            for( const auto& item : _indices )
               inspector( item );
         }

         const index_type& indices()const { return _indices; }

      private:
         index_type _indices;
   };

} } // atelier::db
