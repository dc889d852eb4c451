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
#include <curio/protocol/royalty.hpp>

#include <fc/uint128.hpp>

#include <limits>

namespace curio { namespace protocol {

   fee_split split_fee( const share_type& gross, uint16_t fee_rate_bps ) {
      FC_ASSERT( gross >= 0, "Gross amount should not be negative" );

      // Widen so that gross * fee_rate_bps cannot overflow
      const fc::uint128_t A = fc::uint128_t( gross.value ) * fee_rate_bps;
      const fc::uint128_t fee = A / CURIO_100_PERCENT;
      FC_ASSERT( fee <= fc::uint128_t( std::numeric_limits<int64_t>::max() ),
                 "Overflow when calculating the fee of ${g} at ${r} basis points",
                 ("g", gross)("r", fee_rate_bps) );

      fee_split result;
      result.fee = static_cast<int64_t>( fee );
      result.net = result.fee >= gross ? share_type(0) : gross - result.fee;
      return result;
   }

   share_type calculate_creator_amount( const share_type& remaining, uint8_t percentage ) {
      if( remaining == 0 || percentage == 0 ) {
         return share_type(0);
      }
      FC_ASSERT( remaining > 0, "Remaining amount should not be negative" );

      const fc::uint128_t A = fc::uint128_t( remaining.value ) * percentage;
      const fc::uint128_t C = A / CURIO_ROYALTY_PERCENT_DENOMINATOR;
      FC_ASSERT( C <= fc::uint128_t( std::numeric_limits<int64_t>::max() ), "Overflow when calculating a creator share" );

      return static_cast<int64_t>( C );
   }

   distribution_result calculate_distribution( const share_type& sale_amount,
                                               const vector<royalty_share>& shares,
                                               uint16_t fee_rate_bps ) {
      const fee_split split = split_fee( sale_amount, fee_rate_bps );

      distribution_result result;
      result.platform_fee = split.fee;
      result.remaining_amount = split.net;
      result.creator_amounts.reserve( shares.size() );
      for( const royalty_share& share : shares ) {
         result.creator_amounts.push_back( calculate_creator_amount( result.remaining_amount, share.percentage ) );
      }
      return result;
   }

   share_type distribution_residual( const distribution_result& result ) {
      share_type distributed;
      for( const share_type& amount : result.creator_amounts ) {
         distributed += amount;
      }
      return result.remaining_amount - distributed;
   }

   void validate_royalty_shares( const vector<royalty_share>& shares ) {
      if( shares.empty() ) {
         FC_THROW_EXCEPTION( no_creators, "At least one creator is required", ("count", shares.size()) );
      }
      if( shares.size() > CURIO_MAX_ROYALTY_SHARES ) {
         FC_THROW_EXCEPTION( too_many_creators, "At most ${max} creators are allowed but ${count} were provided",
                             ("max", CURIO_MAX_ROYALTY_SHARES)("count", shares.size()) );
      }

      uint32_t total = 0;
      for( const royalty_share& share : shares ) {
         if( share.percentage == 0 || share.percentage >= CURIO_ROYALTY_PERCENT_DENOMINATOR ) {
            FC_THROW_EXCEPTION( invalid_creator_percentage,
                                "Creator percentage must be between 1 and 99, got ${p} for ${r}",
                                ("p", share.percentage)("r", share.recipient) );
         }
         total += share.percentage;
      }

      if( total != CURIO_ROYALTY_PERCENT_DENOMINATOR ) {
         FC_THROW_EXCEPTION( invalid_split_percentage, "Creator splits must total 100%, got ${total}%",
                             ("total", total) );
      }
   }

} } // curio::protocol
