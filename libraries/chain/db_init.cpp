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
#include <atelier/chain/database.hpp>

#include <atelier/chain/artwork_evaluator.hpp>
#include <atelier/chain/artwork_object.hpp>
#include <atelier/chain/event_history_object.hpp>
#include <atelier/chain/gallery_evaluator.hpp>
#include <atelier/chain/gallery_object.hpp>
#include <atelier/chain/global_property_object.hpp>
#include <atelier/chain/platform_fee_evaluator.hpp>
#include <atelier/chain/review_evaluator.hpp>
#include <atelier/chain/review_object.hpp>

#include <fc/log/logger.hpp>

namespace atelier { namespace chain {

database::database()
{
   initialize_indexes();
   initialize_evaluators();
}

database::~database(){}

void database::initialize_evaluators()
{
   _operation_evaluators.resize( 255 );
   register_evaluator<gallery_create_evaluator>();
   register_evaluator<artwork_create_evaluator>();
   register_evaluator<artwork_update_price_evaluator>();
   register_evaluator<artwork_purchase_evaluator>();
   register_evaluator<review_add_evaluator>();
   register_evaluator<platform_fee_update_evaluator>();
}

void database::initialize_indexes()
{
   //Protocol object indexes
   add_index< gallery_index >();
   add_index< artwork_index >();
   add_index< review_index >();

   //Implementation object indexes
   add_index< global_property_index >();
   add_index< artwork_holding_index >();
   add_index< event_history_index >();
}

void database::initialize( const account_name_type& administrator, uint16_t platform_fee )
{ try {
   FC_ASSERT( !_initialized, "Database is already initialized" );
   ATELIER_ASSERT( !administrator.empty(), invalid_argument_exception, "Administrator must not be empty", );
   ATELIER_ASSERT( platform_fee <= ATELIER_MAX_PLATFORM_FEE, invalid_argument_exception,
                   "Fee cannot exceed 10%", ("fee",platform_fee) );

   create<global_property_object>( [&administrator,platform_fee]( global_property_object& p ) {
      p.administrator = administrator;
      p.platform_fee  = platform_fee;
   });
   if( !_payment_gateway )
      _payment_gateway = std::make_shared<escrow_ledger>();
   _initialized = true;

   ilog( "Registry initialized, administrator ${a}, platform fee ${f}", ("a",administrator)("f",platform_fee) );
} FC_CAPTURE_AND_RETHROW( (administrator)(platform_fee) ) }

void database::set_payment_gateway( std::shared_ptr<payment_gateway> gateway )
{
   FC_ASSERT( gateway, "Payment gateway must not be null" );
   _payment_gateway = std::move( gateway );
}

payment_gateway& database::get_payment_gateway()const
{
   FC_ASSERT( _payment_gateway, "No payment gateway configured" );
   return *_payment_gateway;
}

} } // atelier::chain
