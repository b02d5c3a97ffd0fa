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

#include <atelier/chain/evaluator.hpp>
#include <atelier/chain/event_history_object.hpp>
#include <atelier/chain/global_property_object.hpp>
#include <atelier/chain/payment_gateway.hpp>

#include <atelier/db/object_database.hpp>
#include <atelier/protocol/event.hpp>
#include <atelier/protocol/exceptions.hpp>
#include <atelier/protocol/operations.hpp>

#include <fc/signals.hpp>

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>

namespace atelier { namespace chain {

   class artwork_object;
   class gallery_object;

   /**
    *   @class database
    *   @brief tracks the registry state and applies operations to it
    *
    *   Operations are applied one at a time. Each one either takes full effect,
    *   including its events and the transfers it made, or none at all.
    */
   class database : public db::object_database
   {
      public:
         database();
         ~database() override;

         /**
          * @brief Registers the indexes and evaluators and creates the global properties
          *
          * Must be called exactly once before any operation is pushed.
          */
         void initialize( const account_name_type& administrator,
                          uint16_t platform_fee = ATELIER_DEFAULT_PLATFORM_FEE );

         void             set_payment_gateway( std::shared_ptr<payment_gateway> gateway );
         payment_gateway& get_payment_gateway()const;

         /**
          * @brief Applies one operation atomically
          *
          * Callers on other threads wait until the operation in progress has finished.
          * A call made by the payment gateway while a purchase is paying out runs as a
          * nested operation: it stands or falls on its own, and it is undone as well if
          * the enclosing operation fails later.
          *
          * @return the id of the created object, if any
          */
         operation_result push_operation( const operation& op );

         /**
          *  This signal is emitted after an operation has been applied, with the log entries
          *  it produced, while other writers are still held off. Handlers may read through
          *  database_api on the same thread but must not push operations.
          */
         fc::signal<void(const vector<event_history_object>&)> applied_events;

         /// @{ @group Evaluator helpers
         /// Appends an entry to the event log of the operation in progress
         void push_event( const event_type& e );

         /**
          * Pays @p amount to @p to through the payment gateway. Zero amounts are skipped.
          * Throws transfer_failed_exception if the gateway refuses.
          */
         void transfer( const account_name_type& to, share_type amount );
         /// @}

         /// @{ @group Getters
         const global_property_object& get_global_properties()const;
         const gallery_object*         find_gallery( const gallery_key_type& key )const;
         const artwork_object*         find_artwork( artwork_id_type id )const;
         const artwork_object&         get_artwork( artwork_id_type id )const;
         /// time of the operation being applied
         time_point_sec                head_time()const { return _current_time; }
         /// sequence number the next event log entry will get
         uint64_t                      get_next_event_sequence()const;
         /// @}

         /**
          * Readers take this mutex shared, push_operation takes it exclusively.
          */
         std::shared_timed_mutex& chain_mutex()const { return _chain_mutex; }
         /// true on the thread that is applying an operation, which already holds chain_mutex()
         bool is_applying_operation()const { return _writer.load() == std::this_thread::get_id(); }

      private:
         void initialize_indexes();
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[ operation::tag<typename EvaluatorType::operation_type>::value ]
               .reset( new op_evaluator_impl<EvaluatorType>() );
         }

         operation_result apply_operation( const operation& op );
         operation_result apply_nested_operation( const operation& op );
         void             reverse_transfers( size_t keep );

         struct accepted_transfer
         {
            account_name_type to;
            share_type        amount;
         };

         vector< unique_ptr<op_evaluator> > _operation_evaluators;
         std::shared_ptr<payment_gateway>   _payment_gateway;
         vector<accepted_transfer>          _accepted_transfers;
         time_point_sec                     _current_time;
         bool                               _initialized = false;

         mutable std::shared_timed_mutex    _chain_mutex;
         std::atomic<std::thread::id>       _writer{ std::thread::id() };
   };

} } // atelier::chain
