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
#include <atelier/chain/platform_fee_evaluator.hpp>
#include <atelier/chain/database.hpp>

namespace atelier { namespace chain {

void_result platform_fee_update_evaluator::do_evaluate( const platform_fee_update_operation& op )
{ try {
   const database& d = db();
   ATELIER_ASSERT( op.administrator == d.get_global_properties().administrator, unauthorized_exception,
                   "Only the administrator can update the platform fee", ("caller",op.administrator) );
   ATELIER_ASSERT( op.new_fee <= ATELIER_MAX_PLATFORM_FEE, invalid_argument_exception,
                   "Fee cannot exceed 10%", ("fee",op.new_fee)("max",ATELIER_MAX_PLATFORM_FEE) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result platform_fee_update_evaluator::do_apply( const platform_fee_update_operation& o )
{ try {
   database& d = db();
   const auto& gpo = d.get_global_properties();
   const uint16_t old_fee = gpo.platform_fee;
   d.modify( gpo, [&o]( global_property_object& p ) {
      p.platform_fee = o.new_fee;
   });
   d.push_event( platform_fee_updated_event( o.administrator, old_fee, o.new_fee ) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // atelier::chain
