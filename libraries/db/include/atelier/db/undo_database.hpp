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

#include <deque>
#include <map>
#include <set>

namespace atelier { namespace db {

   class object_database;

   struct undo_state
   {
      std::map<object_id_type, std::unique_ptr<object> > old_values;
      std::map<object_id_type, object_id_type>           old_index_next_ids;
      std::set<object_id_type>                           new_ids;
      std::map<object_id_type, std::unique_ptr<object> > removed;
   };

   /**
    * @class undo_database
    * @brief tracks changes to the state and allows changes to be undone
    *
    * Changes made outside of a session are permanent. Sessions nest: when
    * an inner session commits, its changes are merged into the enclosing
    * session and are still undone if the enclosing session fails.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               /// undoes an open session, a failure is logged and not rethrown
               ~session();

               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               /// unlike the destructor, an explicit undo reports failures to the caller
               void undo()   { if( _apply_undo ) { _apply_undo = false; _db.undo(); } }

            private:
               friend class undo_database;
               explicit session( undo_database& db ): _db(db) {}

               undo_database& _db;
               bool _apply_undo = true;
         };

         void    disable();
         void    enable();
         bool    enabled()const { return !_disabled; }

         session start_undo_session();

         void on_create( const object& obj );
         void on_modify( const object& obj );
         void on_remove( const object& obj );

         size_t  active_sessions()const { return _active_sessions; }

      private:
         void undo();
         void merge();
         void commit();

         size_t                  _active_sessions = 0;
         bool                    _disabled = false;
         std::deque<undo_state>  _stack;
         object_database&        _db;
   };

} } // atelier::db
