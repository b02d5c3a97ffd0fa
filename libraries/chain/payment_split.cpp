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
#include <atelier/chain/payment_split.hpp>
#include <atelier/protocol/exceptions.hpp>

#include <fc/uint128.hpp>

namespace atelier { namespace chain {

share_type calculate_percent( const share_type& value, uint32_t numerator, uint32_t denominator )
{
   FC_ASSERT( denominator > 0 );
   if( value == 0 || numerator == 0 )
      return 0;
   FC_ASSERT( value > 0, "Can not take a percentage of a negative amount", ("value",value) );

   fc::uint128_t a( value.value );
   a *= numerator;
   a /= denominator;
   FC_ASSERT( a <= ATELIER_MAX_SHARE_SUPPLY, "overflow when calculating percent" );
   return static_cast<int64_t>(a);
}

payment_split split_payment( const share_type& payment, uint16_t platform_fee, uint16_t royalty_percent,
                             bool primary_sale )
{
   FC_ASSERT( royalty_percent <= ATELIER_100_PERCENT );
   FC_ASSERT( platform_fee <= ATELIER_MAX_PLATFORM_FEE );

   payment_split result;
   result.platform_fee = calculate_percent( payment, platform_fee, ATELIER_PLATFORM_FEE_DENOMINATOR );
   result.royalty = primary_sale ? share_type(0) : calculate_percent( payment, royalty_percent, ATELIER_100_PERCENT );
   ATELIER_ASSERT( result.royalty + result.platform_fee <= payment, atelier::protocol::insufficient_payment_exception,
                   "Payment of ${p} does not cover royalty ${r} and platform fee ${f}",
                   ("p",payment)("r",result.royalty)("f",result.platform_fee) );
   result.seller_proceeds = payment - result.royalty - result.platform_fee;
   return result;
}

} } // atelier::chain
