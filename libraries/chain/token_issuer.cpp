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
#include <curio/chain/token_issuer.hpp>
#include <curio/chain/account_object.hpp>
#include <curio/chain/collectible_object.hpp>
#include <curio/chain/database.hpp>
#include <curio/chain/exceptions.hpp>

namespace curio { namespace chain {

void ledger_token_issuer::issue( database& db, const collectible_object& collectible,
                                 account_id_type holder, share_type units )
{ try {
   FC_ASSERT( units > 0, "The units to issue should be positive" );
   CURIO_ASSERT( db.find<account_object>( holder ) != nullptr, unknown_account,
                 "Holding account ${h} does not exist", ("h", holder) );

   const collectible_id_type collectible_id = collectible.get_id();
   const collectible_holding_object* holding = db.find_holding( holder, collectible_id );
   if( holding == nullptr )
   {
      db.create<collectible_holding_object>( [holder, collectible_id, units]( collectible_holding_object& h ) {
         h.owner = holder;
         h.collectible = collectible_id;
         h.amount = units;
      });
   }
   else
   {
      db.modify( *holding, [units]( collectible_holding_object& h ) {
         h.amount += units;
      });
   }

   db.modify( collectible, [units]( collectible_object& c ) {
      c.current_supply += units;
   });
} FC_CAPTURE_AND_RETHROW( (holder)(units) ) }

} } // curio::chain
