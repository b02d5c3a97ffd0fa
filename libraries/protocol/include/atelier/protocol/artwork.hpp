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

#include <atelier/protocol/base.hpp>

namespace atelier { namespace protocol {

   /**
    * @brief Register an artwork in an existing gallery
    *
    * The creator becomes the first owner and the artwork is listed for sale
    * at the given price.
    */
   struct artwork_create_operation : public base_operation
   {
      account_name_type creator;
      string            title;
      /// reference into an external content store, not interpreted
      string            content_ref;
      share_type        price;
      gallery_key_type  gallery;
      /// share of every secondary sale paid to the creator, in whole percent
      uint16_t          royalty_percent = 0;

      account_name_type caller()const { return creator; }
      void              validate()const;
   };

   /**
    * @brief Change the price of an artwork and list it for sale
    *
    * Only the current owner may do this.
    */
   struct artwork_update_price_operation : public base_operation
   {
      account_name_type owner;
      artwork_id_type   artwork;
      share_type        new_price;

      account_name_type caller()const { return owner; }
      /// only bounds the price, a non-positive price is rejected after the owner check
      void              validate()const;
   };

   /**
    * @brief Buy a listed artwork
    *
    * The full payment is split between the creator (royalty on secondary sales),
    * the platform administrator (platform fee) and the seller.
    */
   struct artwork_purchase_operation : public base_operation
   {
      account_name_type buyer;
      artwork_id_type   artwork;
      share_type        payment;

      account_name_type caller()const { return buyer; }
      void              validate()const;
   };

} } // atelier::protocol

FC_REFLECT( atelier::protocol::artwork_create_operation,
            (creator)(title)(content_ref)(price)(gallery)(royalty_percent)
          )
FC_REFLECT( atelier::protocol::artwork_update_price_operation,
            (owner)(artwork)(new_price)
          )
FC_REFLECT( atelier::protocol::artwork_purchase_operation,
            (buyer)(artwork)(payment)
          )
