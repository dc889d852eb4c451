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
#pragma once
#include <fc/exception/exception.hpp>
#include <fc/variant.hpp>
#include <fc/reflect/reflect.hpp>

#include <string>

#define CURIO_DB_MAX_INSTANCE_ID  (uint64_t(-1)>>16)
#define CURIO_DB_MAX_NESTED_OBJECTS 200

namespace curio { namespace db {

   /**
    *  @brief Untyped identifier of an object held by the object database
    *
    *  The top 8 bits hold the space, the next 8 bits the type and the
    *  remaining 48 bits the instance within the index.
    */
   struct object_id_type
   {
      object_id_type( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i >> 48 == 0, "instance overflow", ("instance",i) );
         number = (uint64_t(s)<<56) | (uint64_t(t)<<48) | i;
      }
      object_id_type(){ number = 0; }

      uint8_t  space()const       { return number >> 56;              }
      uint8_t  type()const        { return number >> 48 & 0x00ff;     }
      uint16_t space_type()const  { return number >> 48;              }
      uint64_t instance()const    { return number & CURIO_DB_MAX_INSTANCE_ID; }
      bool     is_null()const     { return number == 0;               }
      explicit operator uint64_t()const { return number; }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator < ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }

      object_id_type& operator++() { ++number; return *this; }

      template<typename T>
      bool is()const
      {
         return (number >> 48) == ((uint64_t(T::space_id) << 8) | uint64_t(T::type_id));
      }

      explicit operator std::string()const;

      uint64_t number;
   };

   /**
    *  @brief Identifier of an object of a known space and type
    */
   template<uint8_t SpaceID, uint8_t TypeID>
   struct object_id
   {
      static constexpr uint8_t space_id = SpaceID;
      static constexpr uint8_t type_id = TypeID;

      object_id(){}
      explicit object_id( uint64_t i ):instance(i)
      {
         FC_ASSERT( (i >> 48) == 0, "instance overflow", ("instance",i) );
      }
      object_id( object_id_type id ):instance(id.instance())
      {
         FC_ASSERT( id.is<object_id>(), "object id ${id} is not of the expected space and type",
                    ("id",std::string(id)) );
      }

      operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance ); }
      explicit operator uint64_t()const { return object_id_type( *this ).number; }

      friend bool operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool operator < ( const object_id& a, const object_id& b ) { return a.instance < b.instance; }

      uint64_t instance = 0;
   };

   void to_variant( const object_id_type& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, object_id_type& vo, uint32_t max_depth = 1 );

   template<uint8_t SpaceID, uint8_t TypeID>
   void to_variant( const object_id<SpaceID,TypeID>& var, fc::variant& vo, uint32_t max_depth = 1 )
   {
      to_variant( object_id_type( var ), vo, max_depth );
   }

   template<uint8_t SpaceID, uint8_t TypeID>
   void from_variant( const fc::variant& var, object_id<SpaceID,TypeID>& vo, uint32_t max_depth = 1 )
   {
      object_id_type id;
      from_variant( var, id, max_depth );
      vo = object_id<SpaceID,TypeID>( id );
   }

} } // curio::db

FC_REFLECT( curio::db::object_id_type, (number) )
