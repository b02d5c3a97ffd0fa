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

#include <fc/log/logger.hpp>
#include <fc/scoped_exit.hpp>

#include <exception>
#include <mutex>

namespace atelier { namespace chain {

operation_result database::push_operation( const operation& op )
{
   if( is_applying_operation() )
      return apply_nested_operation( op );

   std::unique_lock<std::shared_timed_mutex> lock( _chain_mutex );
   _writer = std::this_thread::get_id();
   auto reset_writer = fc::make_scoped_exit( [this](){ _writer = std::thread::id(); } );

   FC_ASSERT( _initialized, "Database is not initialized" );
   _current_time = fc::time_point::now();
   _accepted_transfers.clear();
   const uint64_t first_event = get_next_event_sequence();

   operation_result result;
   try {
      auto session = start_undo_session();
      result = apply_operation( op );
      session.commit();
   } catch( const fc::exception& e ) {
      reverse_transfers( 0 );
      dlog( "Operation rejected: ${e}", ("e",e.to_string()) );
      throw;
   }
   _accepted_transfers.clear();

   vector<event_history_object> applied;
   const auto& events = get_index_type<event_history_index>().indices();
   for( auto itr = events.lower_bound( event_history_id_type( first_event ) ); itr != events.end(); ++itr )
      applied.push_back( *itr );
   if( !applied.empty() )
      applied_events( applied );

   return result;
}

operation_result database::apply_nested_operation( const operation& op )
{
   const size_t transfers_before = _accepted_transfers.size();
   try {
      auto session = start_undo_session();
      auto result = apply_operation( op );
      session.commit();
      return result;
   } catch( const fc::exception& e ) {
      reverse_transfers( transfers_before );
      dlog( "Nested operation rejected: ${e}", ("e",e.to_string()) );
      throw;
   }
}

operation_result database::apply_operation( const operation& op )
{ try {
   operation_validate( op );
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag in operation ${op}", ("op",op) );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}", ("op",op) );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${op}", ("op",op) );
   return eval->evaluate( *this, op, true );
} FC_CAPTURE_AND_RETHROW( (op) ) }

void database::push_event( const event_type& e )
{
   create<event_history_object>( [this,&e]( event_history_object& h ) {
      h.timestamp = _current_time;
      h.event     = e;
   });
}

void database::transfer( const account_name_type& to, share_type amount )
{
   FC_ASSERT( amount >= 0, "Can not transfer a negative amount", ("to",to)("amount",amount) );
   if( amount == 0 )
      return;
   bool accepted = false;
   try {
      accepted = get_payment_gateway().transfer( to, amount );
   } catch( const std::exception& e ) {
      FC_THROW_EXCEPTION( transfer_failed_exception, "Transfer of ${amount} to ${to} failed: ${what}",
                          ("to",to)("amount",amount)("what",e.what()) );
   }
   ATELIER_ASSERT( accepted, transfer_failed_exception,
                   "Transfer of ${amount} to ${to} failed", ("to",to)("amount",amount) );
   _accepted_transfers.push_back( accepted_transfer{ to, amount } );
}

void database::reverse_transfers( size_t keep )
{
   while( _accepted_transfers.size() > keep )
   {
      const accepted_transfer t = _accepted_transfers.back();
      _accepted_transfers.pop_back();
      try {
         get_payment_gateway().reverse( t.to, t.amount );
      } catch( const fc::exception& e ) {
         elog( "Unable to reverse transfer of ${amount} to ${to}: ${e}",
               ("to",t.to)("amount",t.amount)("e",e.to_detail_string()) );
      } catch( const std::exception& e ) {
         elog( "Unable to reverse transfer of ${amount} to ${to}: ${e}",
               ("to",t.to)("amount",t.amount)("e",e.what()) );
      }
   }
}

} } // atelier::chain
