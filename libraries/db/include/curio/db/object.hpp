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
#include <curio/db/object_id.hpp>

#include <fc/reflect/variant.hpp>

#include <memory>

namespace curio { namespace db {

   /**
    *  @brief base for all database objects
    *
    *  Every object is identified by an @ref object_id_type that encodes the
    *  index it lives in. Objects are copied into the undo log before they
    *  are modified, so derived classes must be copy and move assignable.
    */
   class object
   {
      public:
         object(){}
         virtual ~object(){}

         /// must be unique within its index
         object_id_type id;

         virtual std::unique_ptr<object> clone()const = 0;
         virtual void move_from( object& obj ) = 0;
         virtual fc::variant to_variant()const = 0;
   };

   /**
    * @class abstract_object
    * @brief   use the Curiously Recurring Template Pattern to automatically add the ability to
    *  clone, serialize, and move objects polymorphically.
    */
   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         virtual std::unique_ptr<object> clone()const override
         {
            return std::make_unique<DerivedClass>( *static_cast<const DerivedClass*>(this) );
         }

         virtual void move_from( object& obj ) override
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }

         virtual fc::variant to_variant()const override
         {
            return fc::variant( static_cast<const DerivedClass&>(*this), CURIO_DB_MAX_NESTED_OBJECTS );
         }
   };

} } // curio::db

FC_REFLECT( curio::db::object, (id) )
