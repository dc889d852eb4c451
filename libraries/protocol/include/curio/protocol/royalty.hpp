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
#include <curio/protocol/types.hpp>
#include <curio/protocol/exceptions.hpp>

namespace curio { namespace protocol {

   /**
    * @brief One entry of a royalty schedule
    *
    * The percentage applies to the amount that remains after the platform fee.
    */
   struct royalty_share
   {
      royalty_share() {}
      royalty_share( account_id_type r, uint8_t p ) : recipient(r), percentage(p) {}

      account_id_type recipient;
      uint8_t         percentage = 0;

      friend bool operator == ( const royalty_share& a, const royalty_share& b )
      {
         return a.recipient == b.recipient && a.percentage == b.percentage;
      }
   };

   struct fee_split
   {
      share_type fee;
      share_type net;
   };

   /**
    * @brief Amounts owed to each party of a sale
    *
    * remaining_amount is always sale_amount - platform_fee, while the creator
    * amounts may add up to less than remaining_amount because every share is
    * floored independently.
    */
   struct distribution_result
   {
      share_type         platform_fee;
      share_type         remaining_amount;
      vector<share_type> creator_amounts;
   };

   /**
    * Split a gross amount into a fee and the net amount
    * @param gross Gross amount, must not be negative
    * @param fee_rate_bps Fee rate in hundredths of a percent
    * @return fee = floor(gross * fee_rate_bps / CURIO_100_PERCENT) and net = gross - fee, saturated at zero
    */
   fee_split split_fee( const share_type& gross, uint16_t fee_rate_bps );

   /**
    * Floor of a whole-percent share of an amount
    */
   share_type calculate_creator_amount( const share_type& remaining, uint8_t percentage );

   /**
    * Compute the platform fee and each creator's amount of a sale
    * @param sale_amount Sale amount
    * @param shares Schedule, in payment order
    * @param fee_rate_bps Platform fee rate in hundredths of a percent
    */
   distribution_result calculate_distribution( const share_type& sale_amount,
                                               const vector<royalty_share>& shares,
                                               uint16_t fee_rate_bps );

   /**
    * Part of the remaining amount that no creator receives due to flooring
    */
   share_type distribution_residual( const distribution_result& result );

   /**
    * Verify the shape and total of a royalty schedule
    *
    * Checks are performed in this order and the first failure is thrown:
    * @ref no_creators, @ref too_many_creators, @ref invalid_creator_percentage,
    * @ref invalid_split_percentage.
    */
   void validate_royalty_shares( const vector<royalty_share>& shares );

} } // curio::protocol

FC_REFLECT( curio::protocol::royalty_share, (recipient)(percentage) )
FC_REFLECT( curio::protocol::fee_split, (fee)(net) )
FC_REFLECT( curio::protocol::distribution_result, (platform_fee)(remaining_amount)(creator_amounts) )
