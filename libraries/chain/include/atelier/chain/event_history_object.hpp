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

#include <atelier/chain/types.hpp>
#include <atelier/protocol/event.hpp>

namespace atelier { namespace chain {

   /**
    * @brief An entry of the event log
    * @ingroup object
    * @ingroup implementation
    *
    * Entries are created only by successful operations, in the order the
    * events happened. The instance of the id is the sequence number.
    */
   class event_history_object : public atelier::db::abstract_object<event_history_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_event_history_object_type;

         time_point_sec  timestamp;
         event_type      event;

         uint64_t sequence()const { return id.instance(); }
   };

   typedef multi_index_container<
      event_history_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
      >
   > event_history_multi_index_type;

   typedef generic_index<event_history_object, event_history_multi_index_type> event_history_index;

} } // atelier::chain

FC_REFLECT_DERIVED( atelier::chain::event_history_object, (atelier::db::object),
                    (timestamp)(event) )
