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

#include <atelier/db/object_id.hpp>

#include <fc/reflect/variant.hpp>

#include <memory>

#define ATELIER_DB_MAX_NESTING (200)

namespace atelier { namespace db {

   /**
    *  @brief base for all database objects
    *
    *  Every object carries the id it is stored under. Derived classes inherit
    *  abstract_object<Derived> to get cloning and moving, which the undo
    *  database needs to restore a previous state.
    */
   class object
   {
      public:
         object() = default;
         object( const object& ) = default;
         object& operator=( const object& ) = default;
         virtual ~object() = default;

         // serialized
         object_id_type id;

         /// these methods are implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual std::unique_ptr<object> clone()const = 0;
         virtual void                    move_from( object& obj ) = 0;
         virtual fc::variant             to_variant()const = 0;
   };

   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         virtual std::unique_ptr<object> clone()const override
         {
            return std::unique_ptr<object>( new DerivedClass( *static_cast<const DerivedClass*>(this) ) );
         }

         virtual void move_from( object& obj ) override
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }

         virtual fc::variant to_variant()const override
         {
            return fc::variant( static_cast<const DerivedClass&>(*this), ATELIER_DB_MAX_NESTING );
         }
   };

} } // atelier::db

FC_REFLECT( atelier::db::object, (id) )
