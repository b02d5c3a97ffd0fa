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
#include <atelier/db/object_database.hpp>
#include <atelier/db/undo_database.hpp>

#include <fc/log/logger.hpp>

namespace atelier { namespace db {

void undo_database::enable()  { _disabled = false; }
void undo_database::disable() { _disabled = true; }

undo_database::session::~session()
{
   try {
      if( _apply_undo )
         _db.undo();
   }
   catch ( const fc::exception& e )
   {
      // may run during stack unwinding, must not throw
      elog( "Unable to undo session: ${e}", ("e",e.to_detail_string() ) );
   }
}

undo_database::session undo_database::start_undo_session()
{
   _stack.emplace_back();
   ++_active_sessions;
   return session(*this);
}

void undo_database::on_create( const object& obj )
{
   if( _disabled || _stack.empty() ) return;

   auto& state = _stack.back();
   auto index_id = object_id_type( obj.id.space(), obj.id.type(), 0 );
   auto itr = state.old_index_next_ids.find( index_id );
   if( itr == state.old_index_next_ids.end() )
      state.old_index_next_ids[index_id] = obj.id;
   state.new_ids.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( _disabled || _stack.empty() ) return;

   auto& state = _stack.back();
   if( state.new_ids.find( obj.id ) != state.new_ids.end() )
      return;
   auto itr = state.old_values.find( obj.id );
   if( itr != state.old_values.end() ) return;
   state.old_values[obj.id] = obj.clone();
}

void undo_database::on_remove( const object& obj )
{
   if( _disabled || _stack.empty() ) return;

   undo_state& state = _stack.back();
   if( state.new_ids.count( obj.id ) )
   {
      state.new_ids.erase( obj.id );
      return;
   }
   if( state.old_values.count( obj.id ) )
   {
      state.removed[obj.id] = std::move( state.old_values[obj.id] );
      state.old_values.erase( obj.id );
      return;
   }
   if( state.removed.count( obj.id ) ) return;
   state.removed[obj.id] = obj.clone();
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_disabled );
   FC_ASSERT( _active_sessions > 0 );
   disable();

   auto& state = _stack.back();
   for( auto& item : state.old_values )
   {
      _db.modify( _db.get_object( item.second->id ), [&]( object& obj ){ obj.move_from( *item.second ); } );
   }

   for( auto ritr = state.new_ids.begin(); ritr != state.new_ids.end(); ++ritr )
   {
      _db.remove( _db.get_object( *ritr ) );
   }

   for( auto& item : state.old_index_next_ids )
   {
      _db.get_mutable_index( item.first.space(), item.first.type() ).set_next_id( item.second );
   }

   for( auto& item : state.removed )
      _db.insert( std::move( *item.second ) );

   _stack.pop_back();
   enable();
   --_active_sessions;
} FC_CAPTURE_AND_RETHROW() }

void undo_database::commit()
{
   FC_ASSERT( _active_sessions > 0 );
   if( _stack.size() > 1 )
   {
      merge();
      return;
   }
   // outermost session: the changes become permanent
   _stack.pop_back();
   --_active_sessions;
}

void undo_database::merge()
{
   FC_ASSERT( _active_sessions > 0 );
   FC_ASSERT( _stack.size() >= 2 );
   auto& state = _stack.back();
   auto& prev_state = _stack[_stack.size()-2];

   // An object's relationship to a state can be:
   // in new_ids            : new
   // in old_values (was=X) : upd(was=X)
   // in removed (was=X)    : del(was=X)
   // not in any of above   : nop
   //
   // When merging A=prev_state and B=state we have a 4x4 matrix of all possibilities:
   //
   //                   |--------------------- B ----------------------|
   //
   //                +------------+------------+------------+------------+
   //                | new        | upd(was=Y) | del(was=Y) | nop        |
   //   +------------+------------+------------+------------+------------+
   // / | new        | N/A        | new       A| nop       C| new       A|
   // | +------------+------------+------------+------------+------------+
   // | | upd(was=X) | N/A        | upd(was=X)A| del(was=X)C| upd(was=X)A|
   // A +------------+------------+------------+------------+------------+
   // | | del(was=X) | N/A        | N/A        | N/A        | del(was=X)A|
   // | +------------+------------+------------+------------+------------+
   // \ | nop        | new       B| upd(was=Y)B| del(was=Y)B|            |
   //   +------------+------------+------------+------------+------------+

   for( auto& obj : state.old_values )
   {
      if( prev_state.new_ids.find( obj.second->id ) != prev_state.new_ids.end() )
         continue; // new+upd -> new, type A
      if( prev_state.old_values.find( obj.second->id ) == prev_state.old_values.end() )
         prev_state.old_values.emplace( obj.first, std::move( obj.second ) ); // nop+upd(was=Y) -> upd(was=Y), type B
      // upd(was=X) + upd(was=Y) -> upd(was=X), type A
   }

   for( const auto& id : state.new_ids )
      prev_state.new_ids.insert( id );

   for( auto& item : state.old_index_next_ids )
   {
      if( prev_state.old_index_next_ids.find( item.first ) == prev_state.old_index_next_ids.end() )
         prev_state.old_index_next_ids[item.first] = item.second;
   }

   for( auto& obj : state.removed )
   {
      const object_id_type id = obj.first;
      if( prev_state.new_ids.find( id ) != prev_state.new_ids.end() )
      {
         prev_state.new_ids.erase( id ); // new+del -> nop (type C)
         continue;
      }
      auto it = prev_state.old_values.find( id );
      if( it != prev_state.old_values.end() )
      {
         prev_state.removed[id] = std::move( it->second ); // upd(was=X) + del(was=Y) -> del(was=X)
         prev_state.old_values.erase( it );
         continue;
      }
      FC_ASSERT( prev_state.removed.find( id ) == prev_state.removed.end() ); // del+del -> N/A
      prev_state.removed.emplace( id, std::move( obj.second ) ); // nop+del(was=Y) -> del(was=Y)
   }

   _stack.pop_back();
   --_active_sessions;
}

} } // atelier::db
