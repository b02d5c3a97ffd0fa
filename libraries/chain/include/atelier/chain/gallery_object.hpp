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
    * @brief A named collection of artworks run by a curator
    * @ingroup object
    *
    * Galleries are never removed. The list of artworks only grows, in the
    * order the artworks were registered.
    */
   class gallery_object : public atelier::db::abstract_object<gallery_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = gallery_object_type;

         gallery_key_type          key;
         string                    name;
         string                    description;
         account_name_type         curator;
         bool                      is_active = true;
         vector<artwork_id_type>   artworks;
         time_point_sec            created;
   };

   struct by_key;
   struct by_curator;

   typedef multi_index_container<
      gallery_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_key>, member< gallery_object, gallery_key_type, &gallery_object::key > >,
         ordered_unique< tag<by_curator>,
            composite_key< gallery_object,
               member< gallery_object, account_name_type, &gallery_object::curator >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > gallery_multi_index_type;

   typedef generic_index<gallery_object, gallery_multi_index_type> gallery_index;

} } // atelier::chain

FC_REFLECT_DERIVED( atelier::chain::gallery_object, (atelier::db::object),
                    (key)(name)(description)(curator)(is_active)(artworks)(created) )
