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
#include <curio/protocol/mint.hpp>

namespace curio { namespace chain {
   class database;

   /**
    * @brief Settles the transfers of a sale between the payer, the platform and the creators
    *
    * The account checks must run before the first transfer of an operation.
    * The settlement methods transfer from the payer in a fixed order: the platform
    * fee first, then each creator share in schedule order. A failing transfer
    * throws and the enclosing undo session discards every transfer already made.
    */
   class revenue_distributor
   {
      public:
         explicit revenue_distributor( database& db ) : _db(db) {}

         /**
          * Verify that the caller-supplied platform account is the configured one
          * @throws platform_wallet_mismatch
          */
         static void verify_platform_account( const database& db, account_id_type platform );

         /**
          * Match the caller-supplied creator accounts against the schedule by position
          * @throws missing_creator_account when fewer accounts than shares are supplied
          * @throws creator_account_mismatch when an account differs from the recipient of its position
          */
         static void verify_creator_accounts( const vector<royalty_share>& shares,
                                              const vector<account_id_type>& creator_accounts );

         /// Transfer the platform fee of @p result, if any, from @p payer to @p platform
         void settle_platform_fee( account_id_type payer, account_id_type platform,
                                   const distribution_result& result );

         /**
          * Transfer each nonzero creator amount of @p result from @p payer to its recipient
          * @return The amount owed to every share, in schedule order
          */
         vector<creator_payout> settle_creator_shares( account_id_type payer,
                                                       const vector<royalty_share>& shares,
                                                       const distribution_result& result );

      private:
         database& _db;
   };

} } // curio::chain
