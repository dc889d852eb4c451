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

#include <curio/chain/collectible_object.hpp>
#include <curio/chain/database.hpp>
#include <curio/chain/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace curio::chain;
using namespace curio::chain::test;

namespace {

vector<royalty_share> make_shares( const vector<uint8_t>& percentages )
{
   vector<royalty_share> shares;
   uint64_t instance = 1;
   for( uint8_t p : percentages )
      shares.emplace_back( account_id_type( instance++ ), p );
   return shares;
}

}

BOOST_AUTO_TEST_SUITE( royalty_schedule_tests )

BOOST_AUTO_TEST_CASE( valid_schedules_are_accepted )
{ try {
   BOOST_CHECK_NO_THROW( validate_royalty_shares( make_shares( { 50, 30, 20 } ) ) );
   BOOST_CHECK_NO_THROW( validate_royalty_shares( make_shares( { 50, 50 } ) ) );
   BOOST_CHECK_NO_THROW( validate_royalty_shares( make_shares( { 99, 1 } ) ) );
   BOOST_CHECK_NO_THROW( validate_royalty_shares( make_shares( { 10, 10, 10, 10, 10, 10, 10, 10, 10, 10 } ) ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( empty_schedule_is_rejected )
{ try {
   CURIO_REQUIRE_THROW( validate_royalty_shares( vector<royalty_share>() ), no_creators );
   REQUIRE_EXCEPTION_WITH_TEXT( validate_royalty_shares( vector<royalty_share>() ), "NoCreators" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( too_many_creators_are_rejected )
{ try {
   vector<uint8_t> percentages( 11, 9 );
   percentages[10] = 10;
   CURIO_REQUIRE_THROW( validate_royalty_shares( make_shares( percentages ) ), too_many_creators );
   REQUIRE_EXCEPTION_WITH_TEXT( validate_royalty_shares( make_shares( percentages ) ), "TooManyCreators" );

   BOOST_TEST_MESSAGE( "The count is checked before any percentage" );
   percentages[0] = 0;
   CURIO_REQUIRE_THROW( validate_royalty_shares( make_shares( percentages ) ), too_many_creators );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( out_of_range_percentages_are_rejected )
{ try {
   CURIO_REQUIRE_THROW( validate_royalty_shares( make_shares( { 100 } ) ), invalid_creator_percentage );
   CURIO_REQUIRE_THROW( validate_royalty_shares( make_shares( { 0, 100 } ) ), invalid_creator_percentage );
   CURIO_REQUIRE_THROW( validate_royalty_shares( make_shares( { 50, 0, 50 } ) ), invalid_creator_percentage );
   CURIO_REQUIRE_THROW( validate_royalty_shares( make_shares( { 150 } ) ), invalid_creator_percentage );
   REQUIRE_EXCEPTION_WITH_TEXT( validate_royalty_shares( make_shares( { 100 } ) ), "InvalidCreatorPercentage" );

   BOOST_TEST_MESSAGE( "Each percentage is checked before the total" );
   CURIO_REQUIRE_THROW( validate_royalty_shares( make_shares( { 0, 20 } ) ), invalid_creator_percentage );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( wrong_totals_are_rejected )
{ try {
   CURIO_REQUIRE_THROW( validate_royalty_shares( make_shares( { 50, 49 } ) ), invalid_split_percentage );
   CURIO_REQUIRE_THROW( validate_royalty_shares( make_shares( { 60, 50 } ) ), invalid_split_percentage );
   CURIO_REQUIRE_THROW( validate_royalty_shares( make_shares( { 99, 99, 99 } ) ), invalid_split_percentage );
   REQUIRE_EXCEPTION_WITH_TEXT( validate_royalty_shares( make_shares( { 50, 49 } ) ), "InvalidSplitPercentage" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( validation_does_not_modify_the_schedule )
{ try {
   const vector<royalty_share> shares = make_shares( { 50, 30, 20 } );
   const vector<royalty_share> copy = shares;
   validate_royalty_shares( shares );
   BOOST_CHECK( shares == copy );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( schedule_is_recorded_by_first_mint, database_fixture )
{ try {
   ACTORS( (buyer)(alice)(bob) );
   fund( buyer_id, 1000000 );

   const vector<royalty_share> shares = { royalty_share( alice_id, 70 ), royalty_share( bob_id, 30 ) };
   const collaborative_mint_result result =
      apply<collaborative_mint_result>( make_collaborative_mint( buyer_id, 1000000, shares ) );

   const royalty_schedule_object& schedule = db.get_royalty_schedule( result.collectible );
   BOOST_CHECK( schedule.collectible == result.collectible );
   BOOST_CHECK( schedule.shares == shares );
   BOOST_CHECK_EQUAL( schedule.platform_fee_bps, CURIO_DEFAULT_PLATFORM_FEE_BPS );
   BOOST_CHECK_EQUAL( schedule.creator_count(), 2 );

   const vector<account_id_type> recipients = schedule.recipients();
   BOOST_REQUIRE_EQUAL( recipients.size(), 2u );
   BOOST_CHECK( recipients[0] == alice_id );
   BOOST_CHECK( recipients[1] == bob_id );

   const collectible_object& collectible = db.get_collectible( result.collectible );
   BOOST_CHECK_EQUAL( collectible.metadata_reference, "ar://collaborative-metadata" );
   BOOST_CHECK_EQUAL( collectible.title, "Collaboration" );
   BOOST_CHECK( collectible.minted_by == buyer_id );
   BOOST_CHECK_EQUAL( collectible.creator_count, 2 );
   BOOST_CHECK_EQUAL( collectible.current_supply.value, 1 );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( missing_schedule_is_reported, database_fixture )
{ try {
   BOOST_CHECK( db.find_royalty_schedule( collectible_id_type(7) ) == nullptr );
   CURIO_REQUIRE_THROW( db.get_royalty_schedule( collectible_id_type(7) ), royalty_schedule_not_found );
   CURIO_REQUIRE_THROW( db.get_collectible( collectible_id_type(7) ), unknown_collectible );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( single_creator_mint_records_no_schedule, database_fixture )
{ try {
   ACTORS( (buyer)(alice) );
   fund( buyer_id, 10000 );

   const mint_result result = apply<mint_result>( make_mint( buyer_id, alice_id, 10000 ) );
   BOOST_CHECK( db.find_royalty_schedule( result.collectible ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_collectible( result.collectible ).creator_count, 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
