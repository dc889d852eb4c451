/*
 * Copyright (c) 2023 Michel Santos and contributors.
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
#include <curio/db/object_id.hpp>

#include <fc/string.hpp>

namespace curio { namespace db {

object_id_type::operator std::string()const
{
   return fc::to_string( uint64_t( space() ) ) + "." + fc::to_string( uint64_t( type() ) ) + "." + fc::to_string( instance() );
}

void to_variant( const object_id_type& var, fc::variant& vo, uint32_t max_depth )
{
   vo = std::string( var );
}

void from_variant( const fc::variant& var, object_id_type& vo, uint32_t max_depth )
{ try {
   const std::string s = var.get_string();
   auto first_dot = s.find('.');
   auto second_dot = s.find('.', first_dot == std::string::npos ? first_dot : first_dot + 1);
   FC_ASSERT( first_dot != std::string::npos && second_dot != std::string::npos && first_dot != second_dot,
              "Malformed object id ${s}", ("s",s) );
   const uint64_t space_id = fc::to_uint64( s.substr( 0, first_dot ) );
   const uint64_t type_id = fc::to_uint64( s.substr( first_dot + 1, second_dot - first_dot - 1 ) );
   FC_ASSERT( space_id <= 0xff && type_id <= 0xff, "Malformed object id ${s}", ("s",s) );
   vo = object_id_type( uint8_t(space_id), uint8_t(type_id), fc::to_uint64( s.substr( second_dot + 1 ) ) );
} FC_CAPTURE_AND_RETHROW( (var) ) }

} } // curio::db
