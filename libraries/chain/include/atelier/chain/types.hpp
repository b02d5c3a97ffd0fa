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
#include <atelier/protocol/types.hpp>

namespace atelier { namespace chain {

   using namespace atelier::protocol;
   using namespace atelier::db;

   enum impl_object_type
   {
      impl_global_property_object_type,
      impl_artwork_holding_object_type,
      impl_event_history_object_type
   };

   typedef object_id< implementation_ids, impl_global_property_object_type > global_property_id_type;
   typedef object_id< implementation_ids, impl_artwork_holding_object_type > artwork_holding_id_type;
   typedef object_id< implementation_ids, impl_event_history_object_type >   event_history_id_type;

} } // atelier::chain

FC_REFLECT_ENUM( atelier::chain::impl_object_type,
                 (impl_global_property_object_type)
                 (impl_artwork_holding_object_type)
                 (impl_event_history_object_type)
               )
