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

namespace atelier { namespace chain {

   /**
    * @class global_property_object
    * @brief Maintains the registry wide settings
    * @ingroup object
    * @ingroup implementation
    *
    * There is only one instance of this object, created when the database is initialized.
    */
   class global_property_object : public atelier::db::abstract_object<global_property_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_global_property_object_type;

         account_name_type administrator;
         /// in tenths of a percent
         uint16_t          platform_fee = ATELIER_DEFAULT_PLATFORM_FEE;
   };

   typedef multi_index_container<
      global_property_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
      >
   > global_property_multi_index_type;

   typedef generic_index<global_property_object, global_property_multi_index_type> global_property_index;

} } // atelier::chain

FC_REFLECT_DERIVED( atelier::chain::global_property_object, (atelier::db::object),
                    (administrator)(platform_fee) )
