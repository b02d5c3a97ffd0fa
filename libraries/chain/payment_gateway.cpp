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
#include <atelier/chain/payment_gateway.hpp>

namespace atelier { namespace chain {

bool escrow_ledger::transfer( const account_name_type& to, share_type amount )
{
   FC_ASSERT( amount > 0, "Transfer amount must be positive", ("to",to)("amount",amount) );
   if( _rejected.find( to ) != _rejected.end() )
      return false;
   _balances[to] += amount;
   return true;
}

void escrow_ledger::reverse( const account_name_type& to, share_type amount )
{
   auto itr = _balances.find( to );
   FC_ASSERT( itr != _balances.end() && itr->second >= amount,
              "Can not reverse more than was transferred", ("to",to)("amount",amount) );
   itr->second -= amount;
}

share_type escrow_ledger::get_balance( const account_name_type& account )const
{
   auto itr = _balances.find( account );
   return itr == _balances.end() ? share_type(0) : itr->second;
}

void escrow_ledger::reject_transfers_to( const account_name_type& account )
{
   _rejected.insert( account );
}

void escrow_ledger::accept_transfers_to( const account_name_type& account )
{
   _rejected.erase( account );
}

} } // atelier::chain
