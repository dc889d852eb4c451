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
#include "database_fixture.hpp"

#include <curio/chain/account_object.hpp>

#include <boost/test/unit_test.hpp>

namespace curio { namespace chain { namespace test {

genesis_state_type database_fixture::make_genesis( uint16_t platform_fee_bps )
{
   genesis_state_type genesis;
   genesis.config.platform_fee_bps = platform_fee_bps;
   genesis.config.platform_account = account_id_type(0);
   genesis.initial_accounts.emplace_back( "platform" );
   return genesis;
}

database_fixture::database_fixture()
   : database_fixture( CURIO_DEFAULT_PLATFORM_FEE_BPS )
{
}

database_fixture::database_fixture( uint16_t platform_fee_bps, std::shared_ptr<token_issuer> issuer )
   : genesis_state( make_genesis( platform_fee_bps ) ),
     db_ptr( new curio::chain::database( genesis_state.config, issuer ) ),
     db( *db_ptr )
{ try {
   db.init_genesis( genesis_state );
   platform_id = db.get_account( "platform" ).get_id();
} FC_LOG_AND_RETHROW() }

database_fixture::~database_fixture()
{
   BOOST_CHECK_EQUAL( db.get_undo_db().active_sessions(), 0u );
}

const account_object& database_fixture::create_account( const string& name, share_type initial_balance )
{
   return db.create_account( name, initial_balance );
}

void database_fixture::fund( account_id_type account, share_type amount )
{
   db.adjust_balance( account, amount );
}

share_type database_fixture::get_balance( account_id_type account )const
{
   return db.get_balance( account );
}

share_type database_fixture::total_balance()const
{
   share_type total;
   for( const account_balance_object& b : db.get_index_type<account_balance_index>().indices() )
      total += b.balance;
   return total;
}

mint_operation database_fixture::make_mint( account_id_type payer, account_id_type creator, share_type sale_amount )const
{
   mint_operation op;
   op.payer = payer;
   op.creator = creator;
   op.recipient_account = payer;
   op.platform = platform_id;
   op.sale_amount = sale_amount;
   op.metadata_reference = "ar://collectible-metadata";
   op.title = "Untitled";
   return op;
}

mint_collaborative_operation database_fixture::make_collaborative_mint( account_id_type buyer, share_type sale_amount,
                                                                        const vector<royalty_share>& shares )const
{
   mint_collaborative_operation op;
   op.buyer = buyer;
   op.buyer_account = buyer;
   op.platform = platform_id;
   op.sale_amount = sale_amount;
   op.shares = shares;
   for( const royalty_share& share : shares )
      op.creator_accounts.push_back( share.recipient );
   op.metadata_reference = "ar://collaborative-metadata";
   op.title = "Collaboration";
   return op;
}

} } } // curio::chain::test
