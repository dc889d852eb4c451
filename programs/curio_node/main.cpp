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
#include <iostream>
#include <string>
#include <vector>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>

#include <curio/chain/database.hpp>
#include <curio/mint_history/mint_history.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

using namespace curio::chain;
using namespace std;
namespace bpo = boost::program_options;

namespace {

genesis_state_type load_genesis( const fc::path& genesis_json_filename )
{ try {
   std::cerr << "curio_node:  Reading genesis from file " << genesis_json_filename.preferred_string() << "\n";
   std::string genesis_json;
   fc::read_file_contents( genesis_json_filename, genesis_json );
   return fc::json::from_string( genesis_json ).as< genesis_state_type >( CURIO_MAX_NESTED_OBJECTS );
} FC_CAPTURE_AND_RETHROW( (genesis_json_filename) ) }

}

int main( int argc, char** argv )
{
   try
   {
      bpo::options_description cli_options("Curio settlement node");
      cli_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("data-dir,d", bpo::value<boost::filesystem::path>()->default_value("curio_node_data"), "Directory containing the object database")
            ("genesis-json,g", bpo::value<boost::filesystem::path>(), "File to read the genesis state from, required on first start")
            ("operation,o", bpo::value<std::vector<std::string>>()->composing(), "JSON of an operation to apply (may specify multiple times)")
            ("get-schedule", bpo::value<std::string>(), "Print the royalty schedule of a collectible, e.g. 1.2.0")
            ("get-balance", bpo::value<std::string>(), "Print the balance of the named account")
            ;

      curio::mint_history::mint_history history;
      bpo::options_description plugin_cli_options("mint_history plugin");
      bpo::options_description plugin_cfg_options;
      history.plugin_set_program_options( plugin_cli_options, plugin_cfg_options );
      cli_options.add( plugin_cli_options );

      bpo::variables_map options;
      try
      {
         boost::program_options::store( boost::program_options::parse_command_line(argc, argv, cli_options), options );
         boost::program_options::notify( options );
      }
      catch (const boost::program_options::error& e)
      {
         std::cerr << "curio_node:  error parsing command line: " << e.what() << "\n";
         return 1;
      }

      if( options.count("help") )
      {
         std::cout << cli_options << "\n";
         return 1;
      }

      const fc::path data_dir = options["data-dir"].as<boost::filesystem::path>();
      const fc::path saved_genesis = data_dir / "genesis.json";

      genesis_state_type genesis;
      if( options.count("genesis-json") )
      {
         genesis = load_genesis( options["genesis-json"].as<boost::filesystem::path>() );
         if( fc::exists( saved_genesis ) )
            genesis.config.verify_unchanged( load_genesis( saved_genesis ).config );
      }
      else if( fc::exists( saved_genesis ) )
         genesis = load_genesis( saved_genesis );
      else
      {
         std::cerr << "--genesis-json option is required for a new data directory\n";
         return 1;
      }

      database db( genesis.config );
      history.plugin_initialize( db, options );
      db.open( data_dir, [&genesis]{ return genesis; } );
      if( !fc::exists( saved_genesis ) )
      {
         fc::create_directories( data_dir );
         fc::json::save_to_file( genesis, saved_genesis );
      }
      history.plugin_startup();

      if( options.count("operation") )
      {
         for( const std::string& op_json : options["operation"].as<std::vector<std::string>>() )
         {
            const operation op = fc::json::from_string( op_json ).as<operation>( CURIO_MAX_NESTED_OBJECTS );
            const operation_result result = db.apply_operation( op );
            db.flush();
            std::cout << fc::json::to_pretty_string( result ) << "\n";
         }
      }

      if( options.count("get-schedule") )
      {
         const collectible_id_type collectible =
            fc::variant( options["get-schedule"].as<std::string>(), 1 ).as<collectible_id_type>( 1 );
         std::cout << fc::json::to_pretty_string( db.get_royalty_schedule( collectible ) ) << "\n";
      }

      if( options.count("get-balance") )
      {
         const account_object& account = db.get_account( options["get-balance"].as<std::string>() );
         std::cout << fc::json::to_pretty_string( db.get_balance( account.get_id() ) ) << "\n";
      }

      history.plugin_shutdown();
      db.close();
   }
   catch ( const fc::exception& e )
   {
      std::cout << e.to_detail_string() << "\n";
      return 1;
   }
   return 0;
}
