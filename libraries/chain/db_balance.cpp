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
#include <curio/chain/database.hpp>

#include <curio/chain/account_object.hpp>
#include <curio/chain/exceptions.hpp>

namespace curio { namespace chain {

share_type database::get_balance( account_id_type owner )const
{
   const auto& index = get_index_type<account_balance_index>().indices().get<by_owner>();
   auto itr = index.find( owner );
   if( itr == index.end() )
      return 0;
   return itr->balance;
}

void database::adjust_balance( account_id_type account, share_type delta )
{ try {
   if( delta == 0 )
      return;

   CURIO_ASSERT( find<account_object>( account ) != nullptr, unknown_account,
                 "Account ${a} does not exist", ("a", account) );

   const auto& index = get_index_type<account_balance_index>().indices().get<by_owner>();
   auto itr = index.find( account );
   if( itr == index.end() )
   {
      CURIO_ASSERT( delta > 0, insufficient_balance,
                    "Insufficient Balance: ${a}'s balance of 0 is less than required ${r}",
                    ("a", account)("r", (-delta).value) );
      create<account_balance_object>( [account, delta]( account_balance_object& b ) {
         b.owner = account;
         b.balance = delta;
      });
   }
   else
   {
      if( delta < 0 )
         CURIO_ASSERT( itr->balance >= -delta, insufficient_balance,
                       "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                       ("a", account)("b", itr->balance.value)("r", (-delta).value) );
      modify( *itr, [delta]( account_balance_object& b ) {
         b.adjust_balance( delta );
      });
   }
} FC_CAPTURE_AND_RETHROW( (account)(delta) ) }

void database::transfer( account_id_type from, account_id_type to, share_type amount )
{ try {
   FC_ASSERT( amount >= 0, "Transfer amount should not be negative" );
   CURIO_ASSERT( find<account_object>( to ) != nullptr, unknown_account,
                 "Recipient account ${a} does not exist", ("a", to) );
   adjust_balance( from, -amount );
   adjust_balance( to, amount );
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

const account_object& database::create_account( const string& name, share_type initial_balance )
{ try {
   FC_ASSERT( !name.empty(), "Account name should not be empty" );
   FC_ASSERT( find_account( name ) == nullptr, "Account ${n} already exists", ("n", name) );
   FC_ASSERT( initial_balance >= 0, "Initial balance should not be negative" );

   const account_object& new_account = create<account_object>( [&name]( account_object& a ) {
      a.name = name;
   });
   const account_id_type owner = new_account.get_id();
   create<account_balance_object>( [owner, initial_balance]( account_balance_object& b ) {
      b.owner = owner;
      b.balance = initial_balance;
   });
   return new_account;
} FC_CAPTURE_AND_RETHROW( (name)(initial_balance) ) }

const account_object* database::find_account( const string& name )const
{
   const auto& accounts_by_name = get_index_type<account_index>().indices().get<by_name>();
   auto itr = accounts_by_name.find( name );
   if( itr == accounts_by_name.end() )
      return nullptr;
   return &*itr;
}

const account_object& database::get_account( const string& name )const
{
   const account_object* account = find_account( name );
   CURIO_ASSERT( account != nullptr, unknown_account, "No account named ${n}", ("n", name) );
   return *account;
}

} } // curio::chain
