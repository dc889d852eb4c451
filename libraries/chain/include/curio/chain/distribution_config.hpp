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

   /**
    * @brief Process-wide settlement parameters, fixed when the database is constructed
    */
   struct distribution_config
   {
      /// Platform fee rate in hundredths of a percent
      uint16_t        platform_fee_bps = CURIO_DEFAULT_PLATFORM_FEE_BPS;

      /// The only account that may receive the platform fee
      account_id_type platform_account;

      void validate()const;

      /// Throw distribution_config_mismatch unless @p saved carries the same fee rate and platform account
      void verify_unchanged( const distribution_config& saved )const;
   };

   struct genesis_state_type
   {
      struct initial_account_type
      {
         initial_account_type() {}
         initial_account_type( const string& name, share_type balance = 0 )
            : name(name), balance(balance) {}

         string     name;
         share_type balance;
      };

      distribution_config          config;
      vector<initial_account_type> initial_accounts;
   };

} } // curio::chain

FC_REFLECT( curio::chain::distribution_config, (platform_fee_bps)(platform_account) )
FC_REFLECT( curio::chain::genesis_state_type::initial_account_type, (name)(balance) )
FC_REFLECT( curio::chain::genesis_state_type, (config)(initial_accounts) )
