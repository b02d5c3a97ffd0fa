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
    * How a purchase payment is divided. The three parts always add up to the payment.
    */
   struct payment_split
   {
      share_type royalty;
      share_type platform_fee;
      share_type seller_proceeds;
   };

   /// @return value * numerator / denominator, rounded down
   share_type calculate_percent( const share_type& value, uint32_t numerator, uint32_t denominator );

   /**
    * @param payment         full amount paid by the buyer
    * @param platform_fee    fee rate in tenths of a percent
    * @param royalty_percent creator royalty in whole percent
    * @param primary_sale    true if the seller is the creator, in which case no royalty is due
    */
   payment_split split_payment( const share_type& payment, uint16_t platform_fee, uint16_t royalty_percent,
                                bool primary_sale );

} } // atelier::chain

FC_REFLECT( atelier::chain::payment_split, (royalty)(platform_fee)(seller_proceeds) )
