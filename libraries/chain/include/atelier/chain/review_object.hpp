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
    * @brief A rating with comment left by a reviewer on an artwork
    * @ingroup object
    */
   class review_object : public atelier::db::abstract_object<review_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = review_object_type;

         artwork_id_type    artwork;
         account_name_type  reviewer;
         string             comment;
         uint16_t           rating = 0;
         time_point_sec     timestamp;
   };

   struct by_artwork;
   struct by_artwork_reviewer;

   typedef multi_index_container<
      review_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_artwork>,
            composite_key< review_object,
               member< review_object, artwork_id_type, &review_object::artwork >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_artwork_reviewer>,
            composite_key< review_object,
               member< review_object, artwork_id_type, &review_object::artwork >,
               member< review_object, account_name_type, &review_object::reviewer >
            >
         >
      >
   > review_multi_index_type;

   typedef generic_index<review_object, review_multi_index_type> review_index;

} } // atelier::chain

FC_REFLECT_DERIVED( atelier::chain::review_object, (atelier::db::object),
                    (artwork)(reviewer)(comment)(rating)(timestamp) )
