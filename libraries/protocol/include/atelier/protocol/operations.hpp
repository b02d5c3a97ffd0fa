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

#include <atelier/protocol/gallery.hpp>
#include <atelier/protocol/artwork.hpp>
#include <atelier/protocol/review.hpp>
#include <atelier/protocol/platform_fee.hpp>

namespace atelier { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    * The position of an operation in this list is its wire tag and must not change.
    */
   typedef fc::static_variant<
            /*  0 */ gallery_create_operation,
            /*  1 */ artwork_create_operation,
            /*  2 */ artwork_update_price_operation,
            /*  3 */ artwork_purchase_operation,
            /*  4 */ review_add_operation,
            /*  5 */ platform_fee_update_operation
         > operation;

   /// @} // operations group

   /**
    *  Performs all checks of @ref op that do not depend on the registry state.
    */
   void operation_validate( const operation& op );
   /** @return the account that submitted @ref op */
   account_name_type operation_caller( const operation& op );

} } // atelier::protocol
