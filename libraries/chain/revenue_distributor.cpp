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
#include <curio/chain/revenue_distributor.hpp>
#include <curio/chain/database.hpp>
#include <curio/chain/exceptions.hpp>

namespace curio { namespace chain {

void revenue_distributor::verify_platform_account( const database& db, account_id_type platform )
{
   const account_id_type configured = db.get_config().platform_account;
   CURIO_ASSERT( platform == configured, platform_wallet_mismatch,
                 "The platform account ${p} is not the configured platform account ${c}",
                 ("p", platform)("c", configured) );
}

void revenue_distributor::verify_creator_accounts( const vector<royalty_share>& shares,
                                                   const vector<account_id_type>& creator_accounts )
{
   for( size_t i = 0; i < shares.size(); ++i )
   {
      CURIO_ASSERT( i < creator_accounts.size(), missing_creator_account,
                    "No creator account was supplied for share ${i} of ${n}", ("i", i)("n", shares.size()) );
      CURIO_ASSERT( creator_accounts[i] == shares[i].recipient, creator_account_mismatch,
                    "Creator account ${a} does not match the recipient ${r} of share ${i}",
                    ("a", creator_accounts[i])("r", shares[i].recipient)("i", i) );
   }
}

void revenue_distributor::settle_platform_fee( account_id_type payer, account_id_type platform,
                                               const distribution_result& result )
{ try {
   if( result.platform_fee > 0 )
      _db.transfer( payer, platform, result.platform_fee );
} FC_CAPTURE_AND_RETHROW( (payer)(platform)(result.platform_fee) ) }

vector<creator_payout> revenue_distributor::settle_creator_shares( account_id_type payer,
                                                                   const vector<royalty_share>& shares,
                                                                   const distribution_result& result )
{ try {
   FC_ASSERT( shares.size() == result.creator_amounts.size(),
              "The distribution does not match the schedule" );

   vector<creator_payout> payouts;
   payouts.reserve( shares.size() );
   for( size_t i = 0; i < shares.size(); ++i )
   {
      const share_type& amount = result.creator_amounts[i];
      if( amount > 0 )
         _db.transfer( payer, shares[i].recipient, amount );
      payouts.emplace_back( shares[i].recipient, shares[i].percentage, amount );
   }
   return payouts;
} FC_CAPTURE_AND_RETHROW( (payer)(shares) ) }

} } // curio::chain
