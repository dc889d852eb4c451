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

namespace curio { namespace chain {
   class database;
   class collectible_object;

   /**
    * @brief Issues units of a collectible to a holding account
    *
    * Implementations report failure by throwing. Changes made through the
    * database are part of the operation being applied and are undone with it.
    */
   class token_issuer
   {
      public:
         virtual ~token_issuer(){}

         virtual void issue( database& db, const collectible_object& collectible,
                             account_id_type holder, share_type units ) = 0;
   };

   /**
    * Records issued units as collectible_holding_object entries
    */
   class ledger_token_issuer : public token_issuer
   {
      public:
         virtual void issue( database& db, const collectible_object& collectible,
                             account_id_type holder, share_type units ) override;
   };

} } // curio::chain
