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

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/io/raw.hpp>

#include "../common/database_fixture.hpp"

using namespace curio::chain;
using namespace curio::chain::test;

BOOST_FIXTURE_TEST_SUITE( serialization_tests, database_fixture )

BOOST_AUTO_TEST_CASE( object_ids_use_dotted_notation )
{ try {
   const account_id_type account(5);
   const fc::variant v( account, CURIO_MAX_NESTED_OBJECTS );
   BOOST_CHECK_EQUAL( v.as_string(), "1.1.5" );
   BOOST_CHECK( v.as<account_id_type>( CURIO_MAX_NESTED_OBJECTS ) == account );

   BOOST_TEST_MESSAGE( "An ID of another type is rejected" );
   const fc::variant collectible( "1.2.5" );
   BOOST_CHECK_THROW( collectible.as<account_id_type>( CURIO_MAX_NESTED_OBJECTS ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_state_from_json )
{ try {
   const std::string json =
      "{\"config\":{\"platform_fee_bps\":250,\"platform_account\":\"1.1.0\"},"
      "\"initial_accounts\":[{\"name\":\"platform\",\"balance\":0},{\"name\":\"alice\",\"balance\":\"5000\"}]}";
   const genesis_state_type genesis =
      fc::json::from_string( json ).as<genesis_state_type>( CURIO_MAX_NESTED_OBJECTS );

   BOOST_CHECK_EQUAL( genesis.config.platform_fee_bps, 250 );
   BOOST_CHECK( genesis.config.platform_account == account_id_type(0) );
   BOOST_REQUIRE_EQUAL( genesis.initial_accounts.size(), 2u );
   BOOST_CHECK_EQUAL( genesis.initial_accounts[1].name, "alice" );
   BOOST_CHECK_EQUAL( genesis.initial_accounts[1].balance.value, 5000 );

   curio::chain::database other( genesis.config );
   other.init_genesis( genesis );
   BOOST_CHECK_EQUAL( other.get_balance( other.get_account( "alice" ).get_id() ).value, 5000 );

   BOOST_TEST_MESSAGE( "A configuration above 100 percent is rejected" );
   distribution_config bad = genesis.config;
   bad.platform_fee_bps = CURIO_100_PERCENT + 1;
   BOOST_CHECK_THROW( curio::chain::database rejected( bad ), fc::exception );

   BOOST_TEST_MESSAGE( "A genesis state that disagrees with the configuration is rejected" );
   genesis_state_type mismatched = genesis;
   mismatched.config.platform_fee_bps = 1000;
   curio::chain::database third( genesis.config );
   CURIO_REQUIRE_THROW( third.init_genesis( mismatched ), distribution_config_mismatch );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( operation_from_json )
{ try {
   ACTORS( (buyer)(alice)(bob) );
   fund( buyer_id, 1000000 );

   const std::string json =
      "[1,{"
      "\"buyer\":\"1.1.1\",\"buyer_account\":\"1.1.1\",\"platform\":\"1.1.0\",\"sale_amount\":1000000,"
      "\"shares\":[{\"recipient\":\"1.1.2\",\"percentage\":50},{\"recipient\":\"1.1.3\",\"percentage\":50}],"
      "\"creator_accounts\":[\"1.1.2\",\"1.1.3\"],"
      "\"metadata_reference\":\"ar://from-json\",\"title\":\"From JSON\"}]";
   const operation op = fc::json::from_string( json ).as<operation>( CURIO_MAX_NESTED_OBJECTS );
   BOOST_REQUIRE( op.which() == operation::tag<mint_collaborative_operation>::value );

   const collaborative_mint_result result = apply<collaborative_mint_result>( op );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 450000 );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 450000 );
   BOOST_CHECK_EQUAL( db.get_collectible( result.collectible ).title, "From JSON" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( schedule_survives_packing )
{ try {
   ACTORS( (buyer)(alice)(bob)(carol) );
   fund( buyer_id, 1000 );

   const vector<royalty_share> shares = {
      royalty_share( alice_id, 33 ), royalty_share( bob_id, 33 ), royalty_share( carol_id, 34 )
   };
   const collaborative_mint_result result =
      apply<collaborative_mint_result>( make_collaborative_mint( buyer_id, 1000, shares ) );
   const royalty_schedule_object& schedule = db.get_royalty_schedule( result.collectible );

   const vector<char> packed = fc::raw::pack( schedule );
   const royalty_schedule_object unpacked = fc::raw::unpack<royalty_schedule_object>( packed );
   BOOST_CHECK( unpacked.id == schedule.id );
   BOOST_CHECK( unpacked.collectible == result.collectible );
   BOOST_CHECK( unpacked.shares == shares );
   BOOST_CHECK_EQUAL( unpacked.platform_fee_bps, CURIO_DEFAULT_PLATFORM_FEE_BPS );
} FC_LOG_AND_RETHROW() }

/**
 * Every index is written on close and read back on open, without applying the genesis state again
 */
BOOST_AUTO_TEST_CASE( database_survives_reopening )
{ try {
   fc::temp_directory data_dir( fc::temp_directory_path() );

   ACTORS( (buyer)(alice)(bob) );
   fund( buyer_id, 2000000 );

   const vector<royalty_share> shares = { royalty_share( alice_id, 70 ), royalty_share( bob_id, 30 ) };
   const collaborative_mint_result result =
      apply<collaborative_mint_result>( make_collaborative_mint( buyer_id, 1000000, shares ) );

   bool genesis_loaded = false;
   auto genesis_loader = [this, &genesis_loaded]() {
      genesis_loaded = true;
      return genesis_state;
   };
   db.open( data_dir.path(), genesis_loader );
   BOOST_CHECK( !genesis_loaded );
   db.close();

   curio::chain::database reopened( genesis_state.config );
   reopened.open( data_dir.path(), genesis_loader );
   BOOST_CHECK( !genesis_loaded );

   BOOST_CHECK_EQUAL( reopened.get_balance( alice_id ).value, 630000 );
   BOOST_CHECK_EQUAL( reopened.get_balance( bob_id ).value, 270000 );
   BOOST_CHECK_EQUAL( reopened.get_balance( buyer_id ).value, 1000000 );
   BOOST_CHECK_EQUAL( reopened.get_balance( platform_id ).value, 100000 );
   BOOST_CHECK_EQUAL( reopened.get_holding( buyer_id, result.collectible ).value, 1 );

   const royalty_schedule_object& schedule = reopened.get_royalty_schedule( result.collectible );
   BOOST_CHECK( schedule.shares == shares );
   BOOST_CHECK_EQUAL( schedule.platform_fee_bps, CURIO_DEFAULT_PLATFORM_FEE_BPS );

   BOOST_TEST_MESSAGE( "New objects continue after the reopened IDs" );
   const account_object& dave = reopened.create_account( "dave" );
   BOOST_CHECK( dave.get_id() == account_id_type( bob_id.instance + 1 ) );

   BOOST_TEST_MESSAGE( "A subsequent sale on the reopened database uses the stored schedule" );
   mint_collaborative_operation op = make_collaborative_mint( buyer_id, 1000000, shares );
   op.collectible = result.collectible;
   reopened.apply_operation( op );
   BOOST_CHECK_EQUAL( reopened.get_balance( alice_id ).value, 1260000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( empty_database_applies_genesis_on_open )
{ try {
   fc::temp_directory data_dir( fc::temp_directory_path() );

   genesis_state_type genesis = make_genesis( CURIO_DEFAULT_PLATFORM_FEE_BPS );
   genesis.initial_accounts.emplace_back( "alice", 700 );

   curio::chain::database fresh( genesis.config );
   fresh.open( data_dir.path(), [&genesis]() { return genesis; } );
   BOOST_CHECK_EQUAL( fresh.get_balance( fresh.get_account( "alice" ).get_id() ).value, 700 );
   fresh.close();

   BOOST_CHECK( fc::exists( data_dir.path() / "object_database" ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( saved_configuration_cannot_be_changed )
{ try {
   fc::temp_directory data_dir( fc::temp_directory_path() );
   const fc::path genesis_file = data_dir.path() / "genesis.json";
   fc::json::save_to_file( genesis_state, genesis_file );

   const genesis_state_type saved =
      fc::json::from_file( genesis_file ).as<genesis_state_type>( CURIO_MAX_NESTED_OBJECTS );
   genesis_state.config.verify_unchanged( saved.config );

   ACTOR( mallory );
   distribution_config moved = saved.config;
   moved.platform_account = mallory_id;
   REQUIRE_EXCEPTION_WITH_TEXT( moved.verify_unchanged( saved.config ), "DistributionConfigMismatch" );

   distribution_config cheaper = saved.config;
   cheaper.platform_fee_bps = 500;
   CURIO_REQUIRE_THROW( cheaper.verify_unchanged( saved.config ), distribution_config_mismatch );
} FC_LOG_AND_RETHROW() }

/**
 * Operations flushed after they were applied stay on disk when a later operation fails
 */
BOOST_AUTO_TEST_CASE( flushed_operations_survive_a_later_failure )
{ try {
   fc::temp_directory data_dir( fc::temp_directory_path() );
   db.open( data_dir.path(), [this]() { return genesis_state; } );

   ACTORS( (buyer)(alice)(bob)(mallory) );
   fund( buyer_id, 2000000 );

   const vector<royalty_share> shares = { royalty_share( alice_id, 50 ), royalty_share( bob_id, 50 ) };
   const collaborative_mint_result result =
      apply<collaborative_mint_result>( make_collaborative_mint( buyer_id, 1000000, shares ) );
   db.flush();

   mint_collaborative_operation rejected = make_collaborative_mint( buyer_id, 1000000, shares );
   rejected.platform = mallory_id;
   CURIO_REQUIRE_THROW( db.apply_operation( rejected ), platform_wallet_mismatch );

   curio::chain::database reopened( genesis_state.config );
   reopened.open( data_dir.path(), [this]() { return genesis_state; } );
   BOOST_CHECK( reopened.get_royalty_schedule( result.collectible ).shares == shares );
   BOOST_CHECK_EQUAL( reopened.get_balance( alice_id ).value, 450000 );
   BOOST_CHECK_EQUAL( reopened.get_balance( buyer_id ).value, 1000000 );
   BOOST_CHECK_EQUAL( reopened.get_holding( buyer_id, result.collectible ).value, 1 );
} FC_LOG_AND_RETHROW() }

/**
 * Sales of an existing collectible take the fee rate recorded with its schedule,
 * whatever rate the database is configured with
 */
BOOST_AUTO_TEST_CASE( later_sales_use_recorded_fee_rate )
{ try {
   fc::temp_directory data_dir( fc::temp_directory_path() );

   ACTORS( (buyer)(collector)(alice)(bob) );
   fund( buyer_id, 3000000 );
   fund( collector_id, 10000 );

   const vector<royalty_share> shares = { royalty_share( alice_id, 50 ), royalty_share( bob_id, 50 ) };
   const collaborative_mint_result minted =
      apply<collaborative_mint_result>( make_collaborative_mint( buyer_id, 1000000, shares ) );
   BOOST_CHECK_EQUAL( minted.platform_fee.value, 100000 );

   db.open( data_dir.path(), [this]() { return genesis_state; } );
   db.close();

   distribution_config lower_rate = genesis_state.config;
   lower_rate.platform_fee_bps = 500;
   curio::chain::database reopened( lower_rate );
   reopened.open( data_dir.path(), [this]() { return genesis_state; } );

   BOOST_TEST_MESSAGE( "A subsequent sale keeps the 10 percent fee" );
   mint_collaborative_operation resale = make_collaborative_mint( buyer_id, 1000000, shares );
   resale.collectible = minted.collectible;
   const collaborative_mint_result resold =
      reopened.apply_operation( resale ).get<collaborative_mint_result>();
   BOOST_CHECK_EQUAL( resold.platform_fee.value, 100000 );
   BOOST_CHECK_EQUAL( reopened.get_balance( platform_id ).value, 200000 );
   BOOST_CHECK_EQUAL( reopened.get_balance( alice_id ).value, 900000 );

   BOOST_TEST_MESSAGE( "A secondary distribution keeps the 10 percent fee" );
   royalty_distribute_operation secondary;
   secondary.collectible = minted.collectible;
   secondary.payer = collector_id;
   secondary.platform = platform_id;
   secondary.sale_amount = 10000;
   secondary.creator_accounts = { alice_id, bob_id };
   const distribution_result distributed =
      reopened.apply_operation( secondary ).get<distribution_result>();
   BOOST_CHECK_EQUAL( distributed.platform_fee.value, 1000 );
   BOOST_CHECK_EQUAL( reopened.get_balance( platform_id ).value, 201000 );
   BOOST_CHECK_EQUAL( reopened.get_balance( bob_id ).value, 904500 );

   BOOST_TEST_MESSAGE( "A new collectible takes the configured 5 percent fee" );
   const collaborative_mint_result fresh =
      reopened.apply_operation( make_collaborative_mint( buyer_id, 1000000, shares ) ).get<collaborative_mint_result>();
   BOOST_CHECK_EQUAL( fresh.platform_fee.value, 50000 );
   BOOST_CHECK_EQUAL( reopened.get_royalty_schedule( fresh.collectible ).platform_fee_bps, 500 );
   BOOST_CHECK_EQUAL( reopened.get_royalty_schedule( minted.collectible ).platform_fee_bps, 1000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
