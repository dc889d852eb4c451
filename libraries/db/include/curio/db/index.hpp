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
#include <curio/db/object.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/datastream.hpp>
#include <fc/io/fstream.hpp>
#include <fc/io/raw.hpp>

#include <fstream>

#include <functional>
#include <vector>

namespace curio { namespace db {
   class object_database;

   /**
    *  @class index
    *  @brief abstract base class for accessing objects indexed in various ways.
    *
    *  All indexes assume that there exists an object ID space that will grow
    *  forever in a sequential manner.  These IDs are used to identify the
    *  index, type, and instance of the object.
    */
   class index
   {
      public:
         virtual ~index(){}

         virtual uint8_t object_space_id()const = 0;
         virtual uint8_t object_type_id()const = 0;

         virtual object_id_type get_next_id()const = 0;
         virtual void           use_next_id() = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         /// Load the objects previously written by @ref save from @p db
         virtual void open( const fc::path& db ) = 0;
         virtual void save( const fc::path& db ) = 0;

         /**
          * Polymorphically insert by moving an object into the index.
          * This should throw if the object is already in the database.
          */
         virtual const object& insert( object&& obj ) = 0;

         /**
          * Builds a new object and assigns it the next available ID and then
          * initializes it with constructor and lastly inserts it into the index.
          */
         virtual const object& create( const std::function<void(object&)>& constructor ) = 0;

         /// @return nullptr if the object is not in the index
         virtual const object* find( object_id_type id )const = 0;

         const object& get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find Object", ("id",id) );
            return *maybe_found;
         }

         virtual void modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void remove( const object& obj ) = 0;

         virtual void inspect_all_objects( std::function<void(const object&)> inspector )const = 0;
         virtual size_t size()const = 0;
   };

   /**
    * Forwards the undo hooks of a @ref primary_index to the owning database.
    */
   class base_primary_index
   {
      public:
         explicit base_primary_index( object_database& db ):_db(db){}

      protected:
         void save_undo( const object& obj );
         void on_add( const object& obj );
         void on_remove( const object& obj );

         object_database& _db;
   };

   /**
    *  @class primary_index
    *  @brief  Wraps a derived index to intercept calls to create, modify, and remove so that
    *  their changes are recorded by the undo log and persisted by the database.
    *
    *  @see http://en.wikipedia.org/wiki/Curiously_recurring_template_pattern
    */
   template<typename DerivedIndex>
   class primary_index : public DerivedIndex, public base_primary_index
   {
      public:
         typedef typename DerivedIndex::object_type object_type;

         explicit primary_index( object_database& db )
            :base_primary_index(db),_next_id(object_type::space_id,object_type::type_id,0) {}

         virtual uint8_t object_space_id()const override
         { return object_type::space_id; }

         virtual uint8_t object_type_id()const override
         { return object_type::type_id; }

         virtual object_id_type get_next_id()const override              { return _next_id;    }
         virtual void           use_next_id()override                    { ++_next_id.number;  }
         virtual void           set_next_id( object_id_type id )override { _next_id = id;      }

         virtual void open( const fc::path& db )override
         {
            if( !fc::exists( db ) ) return;
            std::string content;
            fc::read_file_contents( db, content );
            fc::datastream<const char*> ds( content.data(), content.size() );
            try {
               fc::raw::unpack( ds, _next_id );
               std::vector<char> tmp;
               while( ds.remaining() )
               {
                  fc::raw::unpack( ds, tmp );
                  DerivedIndex::insert( fc::raw::unpack<object_type>( tmp ) );
               }
            } FC_CAPTURE_AND_RETHROW( (db) )
         }

         virtual void save( const fc::path& db ) override
         {
            std::ofstream out( db.generic_string(),
                               std::ofstream::binary | std::ofstream::out | std::ofstream::trunc );
            FC_ASSERT( out, "Unable to open ${db} for writing", ("db",db) );
            fc::raw::pack( out, _next_id );
            this->inspect_all_objects( [&out]( const object& o ) {
               const auto vec = fc::raw::pack( static_cast<const object_type&>(o) );
               const auto packed_vec = fc::raw::pack( vec );
               out.write( packed_vec.data(), packed_vec.size() );
            });
         }

         virtual const object& insert( object&& obj )override
         {
            const auto& result = DerivedIndex::insert( std::move( obj ) );
            on_add( result );
            return result;
         }

         virtual const object& create( const std::function<void(object&)>& constructor )override
         {
            const auto& result = DerivedIndex::create( constructor );
            on_add( result );
            return result;
         }

         virtual void remove( const object& obj ) override
         {
            on_remove( obj );
            DerivedIndex::remove( obj );
         }

         virtual void modify( const object& obj, const std::function<void(object&)>& m )override
         {
            save_undo( obj );
            DerivedIndex::modify( obj, m );
         }

      private:
         object_id_type _next_id;
   };

} } // curio::db
