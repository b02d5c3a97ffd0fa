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
#include <atelier/protocol/artwork.hpp>
#include <atelier/protocol/exceptions.hpp>

namespace atelier { namespace protocol {

void artwork_create_operation::validate()const
{
   ATELIER_ASSERT( !title.empty(), invalid_argument_exception, "Title must not be empty", );
   ATELIER_ASSERT( price > 0, invalid_argument_exception, "Price must be greater than 0", ("price",price) );
   ATELIER_ASSERT( price <= ATELIER_MAX_SHARE_SUPPLY, invalid_argument_exception,
                   "Price exceeds the maximum supported amount", ("price",price) );
}

void artwork_update_price_operation::validate()const
{
   ATELIER_ASSERT( new_price <= ATELIER_MAX_SHARE_SUPPLY, invalid_argument_exception,
                   "Price exceeds the maximum supported amount", ("price",new_price) );
}

void artwork_purchase_operation::validate()const
{
   // a payment below the price is reported as insufficient by the evaluator
   ATELIER_ASSERT( payment <= ATELIER_MAX_SHARE_SUPPLY, invalid_argument_exception,
                   "Payment exceeds the maximum supported amount", ("payment",payment) );
}

} } // atelier::protocol
