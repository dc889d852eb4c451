/*
 * Copyright (c) 2023 Michel Santos and contributors.
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
#include <curio/db/object_database.hpp>
#include <curio/db/undo_database.hpp>

#include <fc/log/logger.hpp>

namespace curio { namespace db {

undo_database::session::~session()
{
   try {
      if( _apply_undo ) _db.undo();
   }
   catch ( const fc::exception& e )
   {
      elog( "Undo failed, the undo log stays disabled: ${e}", ("e",e.to_detail_string() ) );
   }
}

void undo_database::enable()  { _disabled = false; }
void undo_database::disable() { _disabled = true; }

undo_database::session undo_database::start_undo_session()
{
   FC_ASSERT( !_disabled, "undo is disabled, unable to start a session" );
   _stack.emplace_back();
   ++_active_sessions;
   return session(*this);
}

void undo_database::on_create( const object& obj )
{
   if( _disabled || _active_sessions == 0 ) return;

   auto& state = _stack.back();
   auto index_id = obj.id.space_type();
   auto itr = state.old_index_next_ids.find( index_id );
   if( itr == state.old_index_next_ids.end() )
      state.old_index_next_ids[index_id] = obj.id;
   state.new_ids.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( _disabled || _active_sessions == 0 ) return;

   auto& state = _stack.back();
   if( state.new_ids.find( obj.id ) != state.new_ids.end() )
      return;
   auto itr = state.old_values.find( obj.id );
   if( itr != state.old_values.end() ) return;
   state.old_values[obj.id] = obj.clone();
}

void undo_database::on_remove( const object& obj )
{
   if( _disabled || _active_sessions == 0 ) return;

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
   FC_ASSERT( !_disabled, "undo is disabled" );
   FC_ASSERT( _active_sessions > 0, "no active undo session" );
   disable();

   auto& state = _stack.back();
   for( auto& item : state.old_values )
   {
      _db.modify( _db.get_object( item.second->id ), [&]( object& obj ){ obj.move_from( *item.second ); } );
   }

   for( auto ritr = state.new_ids.begin(); ritr != state.new_ids.end(); ++ritr  )
   {
      _db.remove( _db.get_object(*ritr) );
   }

   for( auto& item : state.old_index_next_ids )
   {
      object_id_type next_id = item.second;
      _db.get_mutable_index( next_id.space(), next_id.type() ).set_next_id( next_id );
   }

   for( auto& item : state.removed )
      _db.insert( std::move(*item.second) );

   _stack.pop_back();
   enable();
   --_active_sessions;
} FC_CAPTURE_AND_RETHROW() }

void undo_database::merge()
{
   FC_ASSERT( _active_sessions > 0, "no active undo session" );
   if( _active_sessions == 1 && _stack.size() == 1 )
   {
      _stack.pop_back();
      --_active_sessions;
      return;
   }
   FC_ASSERT( _stack.size() >= 2, "nothing to merge into" );
   auto& state = _stack.back();
   auto& prev_state = _stack[_stack.size()-2];

   // An object's relationship to a state can be:
   // in new_ids            : new
   // in old_values (was=X) : upd(was=X)
   // in removed (was=X)    : del(was=X)
   // not in any of above   : nop
   for( auto& obj : state.old_values )
   {
      if( prev_state.new_ids.find( obj.second->id ) != prev_state.new_ids.end() )
      {
         // new + upd -> new
         continue;
      }
      if( prev_state.old_values.find( obj.second->id ) == prev_state.old_values.end() )
      {
         // nop + upd(was=Y) -> upd(was=Y)
         prev_state.old_values.emplace( obj.first, std::move( obj.second ) );
      }
      // upd(was=X) + upd(was=Y) -> upd(was=X)
   }

   for( const auto& item : state.old_index_next_ids )
   {
      if( prev_state.old_index_next_ids.find( item.first ) == prev_state.old_index_next_ids.end() )
         prev_state.old_index_next_ids[item.first] = item.second;
   }

   // nop + new -> new
   for( const auto& id : state.new_ids )
      prev_state.new_ids.insert( id );

   for( auto& obj : state.removed )
   {
      if( prev_state.new_ids.find( obj.second->id ) != prev_state.new_ids.end() )
      {
         // new + del -> nop
         prev_state.new_ids.erase( obj.second->id );
         continue;
      }
      auto it = prev_state.old_values.find( obj.second->id );
      if( it != prev_state.old_values.end() )
      {
         // upd(was=X) + del(was=Y) -> del(was=X)
         prev_state.removed[obj.second->id] = std::move( it->second );
         prev_state.old_values.erase( it );
         continue;
      }
      // nop + del(was=Y) -> del(was=Y)
      prev_state.removed.emplace( obj.first, std::move( obj.second ) );
   }
   _stack.pop_back();
   --_active_sessions;
}

} } // curio::db
