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
#include <boost/test/unit_test.hpp>

#include <curio/protocol/royalty.hpp>

#include <fc/exception/exception.hpp>
#include <fc/uint128.hpp>

#include <limits>

using namespace curio::protocol;

BOOST_AUTO_TEST_SUITE( fee_split_tests )

BOOST_AUTO_TEST_CASE( split_fee_examples )
{ try {
   fee_split split = split_fee( 10000, 1000 );
   BOOST_CHECK_EQUAL( split.fee.value, 1000 );
   BOOST_CHECK_EQUAL( split.net.value, 9000 );

   split = split_fee( 12345, 1000 );
   BOOST_CHECK_EQUAL( split.fee.value, 1234 );
   BOOST_CHECK_EQUAL( split.net.value, 11111 );

   split = split_fee( 0, 1000 );
   BOOST_CHECK_EQUAL( split.fee.value, 0 );
   BOOST_CHECK_EQUAL( split.net.value, 0 );

   split = split_fee( 9, 1000 );
   BOOST_CHECK_EQUAL( split.fee.value, 0 );
   BOOST_CHECK_EQUAL( split.net.value, 9 );
} FC_LOG_AND_RETHROW() }

/**
 * fee + net == gross and the fee is the floor of gross * rate for every sampled pair
 */
BOOST_AUTO_TEST_CASE( split_fee_preserves_gross )
{ try {
   const int64_t max_amount = std::numeric_limits<int64_t>::max();
   const int64_t grosses[] = { 0, 1, 9, 10, 99, 101, 12345, 1000000, 999999999999LL, max_amount / 3, max_amount };
   const uint16_t rates[] = { 0, 1, 7, 250, 1000, 3333, 5000, 9999, 10000 };

   for( int64_t gross : grosses )
   {
      for( uint16_t rate : rates )
      {
         const fee_split split = split_fee( gross, rate );
         BOOST_CHECK_EQUAL( (split.fee + split.net).value, gross );
         BOOST_CHECK( split.fee >= 0 );
         BOOST_CHECK( split.net >= 0 );
         BOOST_CHECK( split.fee <= gross );

         const fc::uint128_t expected = fc::uint128_t( gross ) * rate / CURIO_100_PERCENT;
         BOOST_CHECK_EQUAL( split.fee.value, static_cast<int64_t>( expected ) );
      }
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( split_fee_rate_above_one_hundred_percent )
{ try {
   const fee_split split = split_fee( 100, 20000 );
   BOOST_CHECK_EQUAL( split.fee.value, 200 );
   BOOST_CHECK_EQUAL( split.net.value, 0 );

   BOOST_TEST_MESSAGE( "A fee that does not fit the share type is rejected" );
   BOOST_CHECK_THROW( split_fee( std::numeric_limits<int64_t>::max(), 20000 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( split_fee_rejects_negative_gross )
{ try {
   BOOST_CHECK_THROW( split_fee( -1, 1000 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( creator_amounts_are_floored )
{ try {
   BOOST_CHECK_EQUAL( calculate_creator_amount( 900, 50 ).value, 450 );
   BOOST_CHECK_EQUAL( calculate_creator_amount( 901, 33 ).value, 297 );
   BOOST_CHECK_EQUAL( calculate_creator_amount( 901, 34 ).value, 306 );
   BOOST_CHECK_EQUAL( calculate_creator_amount( 1, 99 ).value, 0 );
   BOOST_CHECK_EQUAL( calculate_creator_amount( 0, 50 ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( distribution_three_creators )
{ try {
   const vector<royalty_share> shares = {
      royalty_share( account_id_type(1), 50 ),
      royalty_share( account_id_type(2), 30 ),
      royalty_share( account_id_type(3), 20 )
   };
   const distribution_result result = calculate_distribution( 1000000, shares, CURIO_DEFAULT_PLATFORM_FEE_BPS );

   BOOST_CHECK_EQUAL( result.platform_fee.value, 100000 );
   BOOST_CHECK_EQUAL( result.remaining_amount.value, 900000 );
   BOOST_REQUIRE_EQUAL( result.creator_amounts.size(), 3u );
   BOOST_CHECK_EQUAL( result.creator_amounts[0].value, 450000 );
   BOOST_CHECK_EQUAL( result.creator_amounts[1].value, 270000 );
   BOOST_CHECK_EQUAL( result.creator_amounts[2].value, 180000 );
   BOOST_CHECK_EQUAL( distribution_residual( result ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( distribution_two_equal_creators )
{ try {
   const vector<royalty_share> shares = {
      royalty_share( account_id_type(1), 50 ),
      royalty_share( account_id_type(2), 50 )
   };

   distribution_result result = calculate_distribution( 2000000, shares, CURIO_DEFAULT_PLATFORM_FEE_BPS );
   BOOST_CHECK_EQUAL( result.platform_fee.value, 200000 );
   BOOST_CHECK_EQUAL( result.creator_amounts[0].value, 900000 );
   BOOST_CHECK_EQUAL( result.creator_amounts[1].value, 900000 );

   result = calculate_distribution( 1000, shares, CURIO_DEFAULT_PLATFORM_FEE_BPS );
   BOOST_CHECK_EQUAL( result.platform_fee.value, 100 );
   BOOST_CHECK_EQUAL( result.creator_amounts[0].value, 450 );
   BOOST_CHECK_EQUAL( result.creator_amounts[1].value, 450 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( distribution_large_sale )
{ try {
   const vector<royalty_share> shares = {
      royalty_share( account_id_type(1), 33 ),
      royalty_share( account_id_type(2), 33 ),
      royalty_share( account_id_type(3), 34 )
   };
   const distribution_result result = calculate_distribution( 1000000000, shares, CURIO_DEFAULT_PLATFORM_FEE_BPS );

   BOOST_CHECK_EQUAL( result.platform_fee.value, 100000000 );
   BOOST_CHECK_EQUAL( result.creator_amounts[0].value, 297000000 );
   BOOST_CHECK_EQUAL( result.creator_amounts[1].value, 297000000 );
   BOOST_CHECK_EQUAL( result.creator_amounts[2].value, 306000000 );
} FC_LOG_AND_RETHROW() }

/**
 * Flooring each share independently can leave up to count - 1 units undistributed.
 * The residual is reported and is not assigned to any party.
 */
BOOST_AUTO_TEST_CASE( distribution_residual_is_not_distributed )
{ try {
   const vector<royalty_share> shares = {
      royalty_share( account_id_type(1), 33 ),
      royalty_share( account_id_type(2), 33 ),
      royalty_share( account_id_type(3), 34 )
   };
   distribution_result result = calculate_distribution( 1001, shares, CURIO_DEFAULT_PLATFORM_FEE_BPS );
   BOOST_CHECK_EQUAL( result.platform_fee.value, 100 );
   BOOST_CHECK_EQUAL( result.remaining_amount.value, 901 );
   BOOST_CHECK_EQUAL( result.creator_amounts[0].value, 297 );
   BOOST_CHECK_EQUAL( result.creator_amounts[1].value, 297 );
   BOOST_CHECK_EQUAL( result.creator_amounts[2].value, 306 );
   BOOST_CHECK_EQUAL( distribution_residual( result ).value, 1 );

   const vector<royalty_share> halves = {
      royalty_share( account_id_type(1), 50 ),
      royalty_share( account_id_type(2), 50 )
   };
   result = calculate_distribution( 10, halves, CURIO_DEFAULT_PLATFORM_FEE_BPS );
   BOOST_CHECK_EQUAL( result.platform_fee.value, 1 );
   BOOST_CHECK_EQUAL( result.creator_amounts[0].value, 4 );
   BOOST_CHECK_EQUAL( result.creator_amounts[1].value, 4 );
   BOOST_CHECK_EQUAL( distribution_residual( result ).value, 1 );

   BOOST_TEST_MESSAGE( "The residual never reaches the number of creators" );
   for( int64_t sale = 0; sale < 2000; sale += 7 )
   {
      result = calculate_distribution( sale, shares, CURIO_DEFAULT_PLATFORM_FEE_BPS );
      BOOST_CHECK( distribution_residual( result ) >= 0 );
      BOOST_CHECK( distribution_residual( result ) < int64_t( shares.size() ) );
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
