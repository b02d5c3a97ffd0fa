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

#include <atelier/chain/evaluator.hpp>
#include <atelier/chain/payment_split.hpp>
#include <atelier/protocol/artwork.hpp>

namespace atelier { namespace chain {

   class artwork_object;
   class gallery_object;

   class artwork_create_evaluator : public evaluator<artwork_create_evaluator>
   {
      public:
         typedef artwork_create_operation operation_type;

         void_result do_evaluate( const artwork_create_operation& o );
         object_id_type do_apply( const artwork_create_operation& o );

      private:
         const gallery_object* _gallery = nullptr;
   };

   class artwork_update_price_evaluator : public evaluator<artwork_update_price_evaluator>
   {
      public:
         typedef artwork_update_price_operation operation_type;

         void_result do_evaluate( const artwork_update_price_operation& o );
         void_result do_apply( const artwork_update_price_operation& o );

      private:
         const artwork_object* _artwork = nullptr;
   };

   class artwork_purchase_evaluator : public evaluator<artwork_purchase_evaluator>
   {
      public:
         typedef artwork_purchase_operation operation_type;

         void_result do_evaluate( const artwork_purchase_operation& o );
         void_result do_apply( const artwork_purchase_operation& o );

      private:
         const artwork_object* _artwork = nullptr;
         payment_split         _split;
   };

} } // atelier::chain
