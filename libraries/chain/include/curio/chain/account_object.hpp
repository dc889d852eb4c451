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
#include <curio/chain/types.hpp>
#include <curio/db/generic_index.hpp>

namespace curio { namespace chain {
   using namespace curio::db;

   /**
    * @brief A party of a sale: buyer, platform, creator or holder
    * @ingroup object
    */
   class account_object : public abstract_object<account_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = account_object_type;

         /// Unique name of the account
         string name;

         account_id_type get_id()const { return id; }
   };

   /**
    * @brief Tracks the native balance of a single account
    * @ingroup object
    * @ingroup implementation
    *
    * This object is indexed on owner so that a balance can be found quickly.
    */
   class account_balance_object : public abstract_object<account_balance_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_account_balance_object_type;

         account_id_type owner;
         share_type      balance;

         void adjust_balance( const share_type& delta ) { balance += delta; }
   };

   struct by_name;
   typedef multi_index_container<
      account_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_name>, member< account_object, string, &account_object::name > >
      >
   > account_multi_index_type;
   typedef generic_index<account_object, account_multi_index_type> account_index;

   struct by_owner;
   typedef multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>, member< account_balance_object, account_id_type, &account_balance_object::owner > >
      >
   > account_balance_multi_index_type;
   typedef generic_index<account_balance_object, account_balance_multi_index_type> account_balance_index;

} } // curio::chain

FC_REFLECT_DERIVED( curio::chain::account_object, (curio::db::object), (name) )
FC_REFLECT_DERIVED( curio::chain::account_balance_object, (curio::db::object), (owner)(balance) )
