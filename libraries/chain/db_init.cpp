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
#include <curio/chain/collectible_object.hpp>
#include <curio/chain/mint_evaluator.hpp>

namespace curio { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<mint_evaluator>();
   register_evaluator<mint_collaborative_evaluator>();
   register_evaluator<royalty_distribute_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();

   //Protocol object indexes
   add_index< primary_index<account_index> >();
   add_index< primary_index<collectible_index> >();

   //Implementation object indexes
   add_index< primary_index<account_balance_index> >();
   add_index< primary_index<royalty_schedule_index> >();
   add_index< primary_index<collectible_holding_index> >();
}

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   _config.verify_unchanged( genesis_state.config );
   FC_ASSERT( get_index_type<account_index>().indices().empty(),
              "The genesis state can only be applied to an empty database" );

   for( const auto& account : genesis_state.initial_accounts )
      create_account( account.name, account.balance );

   FC_ASSERT( find<account_object>( _config.platform_account ) != nullptr,
              "The platform account ${p} was not created by the genesis state", ("p", _config.platform_account) );

   ilog( "Initialized genesis state with ${n} accounts", ("n", genesis_state.initial_accounts.size()) );
} FC_CAPTURE_AND_RETHROW() }

} } // curio::chain
