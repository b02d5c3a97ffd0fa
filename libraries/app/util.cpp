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
#include <atelier/app/util.hpp>
#include <atelier/protocol/exceptions.hpp>

#include <fc/string.hpp>

#include <boost/algorithm/string.hpp>

#include <cctype>
#include <sstream>

namespace atelier { namespace app {

std::string amount_to_string( const protocol::share_type& amount, const uint8_t precision )
{ try {
   FC_ASSERT( precision <= 18 );
   const bool negative = amount < 0;
   std::string s = fc::to_string( negative ? -amount.value : amount.value );
   if( precision == 0 || amount == 0 )
      return s;

   std::stringstream ss;
   if( negative )
      ss << '-';
   auto pos = s.find_last_not_of( '0' ); // should be >= 0
   auto len = s.size();
   if( len > precision )
   {
      auto left_len = len - precision;
      ss << s.substr( 0, left_len );
      if( pos >= left_len )
         ss << '.' << s.substr( left_len, pos - left_len + 1 );
   }
   else
   {
      ss << "0.";
      for( auto i = precision - len; i > 0; --i )
         ss << '0';
      ss << s.substr( 0, pos + 1 );
   }
   return ss.str();
} FC_CAPTURE_AND_RETHROW( (amount)(precision) ) }

protocol::share_type amount_from_string( const std::string& amount, const uint8_t precision )
{ try {
   FC_ASSERT( precision <= 18 );
   std::string s = boost::algorithm::trim_copy( amount );
   ATELIER_ASSERT( !s.empty(), protocol::invalid_argument_exception, "Empty amount", );

   bool negative = false;
   if( s[0] == '-' )
   {
      negative = true;
      s.erase( 0, 1 );
   }

   std::string whole = s;
   std::string fraction;
   auto dot = s.find( '.' );
   if( dot != std::string::npos )
   {
      whole = s.substr( 0, dot );
      fraction = s.substr( dot + 1 );
   }
   ATELIER_ASSERT( !whole.empty() || !fraction.empty(), protocol::invalid_argument_exception,
                   "Invalid amount ${a}", ("a",amount) );
   ATELIER_ASSERT( fraction.size() <= precision, protocol::invalid_argument_exception,
                   "Too many decimal digits in ${a}", ("a",amount)("precision",precision) );
   for( char c : whole + fraction )
      ATELIER_ASSERT( std::isdigit( static_cast<unsigned char>( c ) ), protocol::invalid_argument_exception,
                      "Invalid amount ${a}", ("a",amount) );
   ATELIER_ASSERT( whole.size() + precision <= 18, protocol::invalid_argument_exception,
                   "Amount ${a} is too large", ("a",amount) );

   fraction.append( precision - fraction.size(), '0' );
   const std::string digits = whole + fraction;
   int64_t result = digits.empty() ? 0 : static_cast<int64_t>( fc::to_uint64( digits ) );
   return negative ? -result : result;
} FC_CAPTURE_AND_RETHROW( (amount)(precision) ) }

} } // atelier::app
