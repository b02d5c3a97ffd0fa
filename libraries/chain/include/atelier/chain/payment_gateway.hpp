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
    * @brief Moves value to accounts on behalf of the registry
    *
    * The registry never holds balances itself. It asks the gateway to pay out
    * the parts of a purchase and, when a later part fails, asks it to take
    * back the parts that already went through.
    */
   class payment_gateway
   {
      public:
         virtual ~payment_gateway() = default;

         /**
          * @return false if the recipient refuses the transfer
          *
          * Implementations may call back into the database from here.
          */
         virtual bool transfer( const account_name_type& to, share_type amount ) = 0;

         /// Undo a transfer previously accepted by this gateway
         virtual void reverse( const account_name_type& to, share_type amount ) = 0;
   };

   /**
    * @brief In-memory gateway that credits balances per account
    *
    * Transfers to accounts marked with reject_transfers_to() fail.
    */
   class escrow_ledger : public payment_gateway
   {
      public:
         bool transfer( const account_name_type& to, share_type amount ) override;
         void reverse( const account_name_type& to, share_type amount ) override;

         share_type get_balance( const account_name_type& account )const;
         const map<account_name_type, share_type>& get_balances()const { return _balances; }

         void reject_transfers_to( const account_name_type& account );
         void accept_transfers_to( const account_name_type& account );

      private:
         map<account_name_type, share_type> _balances;
         set<account_name_type>             _rejected;
   };

} } // atelier::chain
