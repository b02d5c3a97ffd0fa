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

#include <atelier/db/generic_index.hpp>
#include <atelier/db/undo_database.hpp>

#include <memory>
#include <type_traits>
#include <vector>

namespace atelier { namespace db {

   /**
    *   @class object_database
    *   @brief maintains a set of indexed objects that can be modified with multi-level rollback support
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database();

         undo_database::session start_undo_session() { return _undo_db.start_undo_session(); }

         template<typename T, typename F>
         const T& create( F&& constructor )
         {
            auto& idx = get_mutable_index<T>();
            return static_cast<const T&>( idx.create( [&](object& o)
            {
               assert( dynamic_cast<T*>(&o) );
               constructor( static_cast<T&>(o) );
            } ));
         }

         /// These methods are used to retrieve indexes on the object_database. All public index accessors are const-access only.
         /// @{
         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            static_assert( std::is_base_of<index,IndexType>::value, "Type must be an index type" );
            const auto* ptr = dynamic_cast<const IndexType*>( &get_index( IndexType::object_type::space_id,
                                                                          IndexType::object_type::type_id ) );
            FC_ASSERT( ptr != nullptr, "invalid index type" );
            return *ptr;
         }
         template<typename T>
         const index& get_index()const { return get_index(T::space_id,T::type_id); }
         const index& get_index( uint8_t space_id, uint8_t type_id )const;
         const index& get_index( object_id_type id )const { return get_index( id.space(), id.type() ); }
         /// @}

         const object& get_object( object_id_type id )const;
         const object* find_object( object_id_type id )const;

         template<typename T>
         const T* find( object_id_type id )const
         {
            const object* obj = get_index<T>().find( id );
            assert( !obj || nullptr != dynamic_cast<const T*>(obj) );
            return static_cast<const T*>(obj);
         }

         template<typename T>
         const T& get( object_id_type id )const
         {
            const object& obj = get_object( id );
            const T* result = dynamic_cast<const T*>( &obj );
            FC_ASSERT( result != nullptr, "Object ${id} is not of the requested type", ("id",id) );
            return *result;
         }

         template<typename IndexType>
         IndexType* add_index()
         {
            typedef typename IndexType::object_type ObjectType;
            if( _index[ObjectType::space_id].size() <= ObjectType::type_id  )
                _index[ObjectType::space_id].resize( 255 );
            FC_ASSERT( !_index[ObjectType::space_id][ObjectType::type_id], "Index already registered" );
            std::unique_ptr<index> indexptr( new primary_index<IndexType>( *this ) );
            _index[ObjectType::space_id][ObjectType::type_id] = std::move( indexptr );
            return static_cast<IndexType*>( _index[ObjectType::space_id][ObjectType::type_id].get() );
         }

         template<typename T, typename Lambda>
         void modify( const T& obj, const Lambda& m )
         {
            get_mutable_index( obj.id ).modify( obj, [&m]( object& o ){ m( static_cast<T&>(o) ); } );
         }

         void remove( const object& obj ) { get_mutable_index( obj.id ).remove( obj ); }

         const object& insert( object&& obj ) { return get_mutable_index( obj.id ).insert( std::move(obj) ); }

         void save_undo( const object& obj )        { _undo_db.on_modify( obj ); }
         void save_undo_add( const object& obj )    { _undo_db.on_create( obj ); }
         void save_undo_remove( const object& obj ) { _undo_db.on_remove( obj ); }

         index& get_mutable_index( uint8_t space_id, uint8_t type_id );
         index& get_mutable_index( object_id_type id ) { return get_mutable_index( id.space(), id.type() ); }
         template<typename T>
         index& get_mutable_index() { return get_mutable_index( T::space_id, T::type_id ); }

      protected:
         undo_database                                        _undo_db;

      private:
         /** Index is indexed by space, then by type */
         std::vector< std::vector< std::unique_ptr<index> > > _index;
   };

   template<typename DerivedIndex>
   const object& primary_index<DerivedIndex>::create( const std::function<void(object&)>& constructor )
   {
      const auto& result = DerivedIndex::create( constructor );
      _db.save_undo_add( result );
      return result;
   }

   template<typename DerivedIndex>
   const object& primary_index<DerivedIndex>::insert( object&& obj )
   {
      const auto& result = DerivedIndex::insert( std::move( obj ) );
      _db.save_undo_add( result );
      return result;
   }

   template<typename DerivedIndex>
   void primary_index<DerivedIndex>::modify( const object& obj, const std::function<void(object&)>& m )
   {
      _db.save_undo( obj );
      DerivedIndex::modify( obj, m );
   }

   template<typename DerivedIndex>
   void primary_index<DerivedIndex>::remove( const object& obj )
   {
      _db.save_undo_remove( obj );
      DerivedIndex::remove( obj );
   }

} } // atelier::db
