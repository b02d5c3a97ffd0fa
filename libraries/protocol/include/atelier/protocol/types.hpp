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

#include <atelier/db/object_id.hpp>
#include <atelier/protocol/config.hpp>

#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace atelier { namespace protocol {
   using namespace atelier::db;

   using std::map;
   using std::vector;
   using std::set;
   using std::string;
   using std::unique_ptr;
   using std::shared_ptr;
   using std::pair;

   using fc::optional;
   using fc::static_variant;
   using fc::time_point_sec;
   using fc::time_point;
   using fc::variant;
   using fc::variant_object;

   typedef fc::safe<int64_t> share_type;

   /// Callers are identified by an opaque account name supplied by the surrounding platform.
   typedef string account_name_type;
   /// Galleries are addressed by a caller chosen textual key.
   typedef string gallery_key_type;

   enum reserved_spaces
   {
      relative_protocol_ids = 0,
      protocol_ids          = 1,
      implementation_ids    = 2
   };

   enum object_type
   {
      null_object_type,
      gallery_object_type,
      artwork_object_type,
      review_object_type,
      OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

   typedef object_id< protocol_ids, gallery_object_type >    gallery_id_type;
   typedef object_id< protocol_ids, artwork_object_type >    artwork_id_type;
   typedef object_id< protocol_ids, review_object_type >     review_id_type;

} } // atelier::protocol

FC_REFLECT_ENUM( atelier::protocol::object_type,
                 (null_object_type)
                 (gallery_object_type)
                 (artwork_object_type)
                 (review_object_type)
                 (OBJECT_TYPE_COUNT)
               )
