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
    * @brief A registered artwork
    * @ingroup object
    *
    * The creator is fixed at registration. The owner changes on every sale.
    */
   class artwork_object : public atelier::db::abstract_object<artwork_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = artwork_object_type;

         string             title;
         account_name_type  creator;
         account_name_type  owner;
         share_type         price;
         bool               for_sale = true;
         string             content_ref;
         gallery_key_type   gallery;
         uint16_t           royalty_percent = 0;
         time_point_sec     created;
         uint64_t           rating_count = 0;
         uint64_t           rating_sum = 0;

         artwork_id_type get_id()const { return artwork_id_type( id ); }

         /// integer mean of all ratings, 0 while unrated
         uint64_t average_rating()const { return rating_count == 0 ? 0 : rating_sum / rating_count; }
   };

   struct by_gallery;
   struct by_creator;

   typedef multi_index_container<
      artwork_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_gallery>,
            composite_key< artwork_object,
               member< artwork_object, gallery_key_type, &artwork_object::gallery >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_creator>,
            composite_key< artwork_object,
               member< artwork_object, account_name_type, &artwork_object::creator >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > artwork_multi_index_type;

   typedef generic_index<artwork_object, artwork_multi_index_type> artwork_index;

   /**
    * @brief Records that an account acquired an artwork
    * @ingroup object
    *
    * One entry is added whenever an account becomes the owner of an artwork, by
    * registering or by buying it. Entries are never removed when the artwork is
    * sold on, so the set of entries of an account is its acquisition history.
    */
   class artwork_holding_object : public atelier::db::abstract_object<artwork_holding_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_artwork_holding_object_type;

         account_name_type account;
         artwork_id_type   artwork;
         time_point_sec    acquired;
   };

   struct by_account;

   typedef multi_index_container<
      artwork_holding_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account>,
            composite_key< artwork_holding_object,
               member< artwork_holding_object, account_name_type, &artwork_holding_object::account >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > artwork_holding_multi_index_type;

   typedef generic_index<artwork_holding_object, artwork_holding_multi_index_type> artwork_holding_index;

} } // atelier::chain

FC_REFLECT_DERIVED( atelier::chain::artwork_object, (atelier::db::object),
                    (title)(creator)(owner)(price)(for_sale)(content_ref)(gallery)(royalty_percent)
                    (created)(rating_count)(rating_sum) )
FC_REFLECT_DERIVED( atelier::chain::artwork_holding_object, (atelier::db::object),
                    (account)(artwork)(acquired) )
