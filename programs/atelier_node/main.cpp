/*
 * Copyright (c) 2020-2023 Revolution Populi Limited, and contributors.
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
#include <atelier/app/application.hpp>
#include <atelier/app/database_api.hpp>
#include <atelier/app/util.hpp>
#include <atelier/listing_history/listing_history_plugin.hpp>

#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <memory>
#include <set>

using namespace atelier;
namespace bpo = boost::program_options;

namespace {

/// Applies every operation of the file in order. A rejected operation is reported and the batch goes on.
std::pair<uint32_t,uint32_t> apply_operations_file( chain::database& db, const boost::filesystem::path& file )
{
   const auto ops = fc::json::from_file( fc::path( file.string() ) )
                       .as< std::vector<protocol::operation> >( ATELIER_MAX_NESTED_OBJECTS );
   ilog( "Applying ${n} operations from ${f}", ("n",ops.size())("f",file.string()) );

   uint32_t applied = 0;
   uint32_t rejected = 0;
   for( const auto& op : ops )
   {
      try
      {
         auto result = db.push_operation( op );
         ++applied;
         ilog( "Applied operation by ${c}: ${r}", ("c",protocol::operation_caller( op ))("r",result) );
      }
      catch( const fc::exception& e )
      {
         ++rejected;
         wlog( "Rejected operation by ${c}: ${e}", ("c",protocol::operation_caller( op ))("e",e.to_string()) );
      }
   }
   return std::make_pair( applied, rejected );
}

std::vector<chain::event_history_object> collect_events( const app::database_api& api, uint32_t page_size )
{
   std::vector<chain::event_history_object> result;
   uint64_t start = 0;
   while( true )
   {
      auto page = api.get_events( start, page_size );
      if( page.empty() )
         break;
      start = page.back().sequence() + 1;
      result.insert( result.end(), page.begin(), page.end() );
   }
   return result;
}

} // anonymous namespace

int main( int argc, char** argv )
{
   auto node = std::make_unique<app::application>();
   try {
      bpo::options_description app_options("Atelier Node");
      bpo::options_description cfg_options("Atelier Node");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("config-file,c", bpo::value<boost::filesystem::path>(), "Path to a configuration file")
            ("operations", bpo::value<boost::filesystem::path>(),
             "JSON file with an array of operations to apply, each one as [tag, {fields}]")
            ("event-log", bpo::value<boost::filesystem::path>(),
             "File to write the event log to as JSON once all operations are applied")
            ;
      cfg_options.add_options()
            ("plugins", bpo::value<std::string>()->default_value("listing_history"),
             "Space-separated list of plugins to activate")
            ;

      node->register_plugin<listing_history::listing_history_plugin>();

      bpo::variables_map options;
      try
      {
         bpo::options_description cli, cfg;
         node->set_program_options( cli, cfg );
         app_options.add( cfg_options );
         app_options.add( cli );
         cfg_options.add( cfg );
         bpo::store( bpo::parse_command_line( argc, argv, app_options ), options );

         if( options.count("config-file") > 0 )
         {
            const auto config_file = options["config-file"].as<boost::filesystem::path>();
            FC_ASSERT( boost::filesystem::exists( config_file ), "Configuration file ${f} does not exist",
                       ("f",config_file.string()) );
            bpo::store( bpo::parse_config_file<char>( config_file.string().c_str(), cfg_options, true ), options );
         }
      }
      catch( const boost::program_options::error& e )
      {
         std::cerr << "Error parsing command line: " << e.what() << "\n";
         return 1;
      }

      if( options.count("help") > 0 )
      {
         std::cout << app_options << "\n";
         return 0;
      }

      std::set<std::string> plugins;
      boost::split( plugins, options.at("plugins").as<std::string>(), [](char c){ return c == ' '; } );
      for( const auto& plug : plugins )
      {
         if( !plug.empty() )
            node->enable_plugin( plug );
      }

      bpo::notify( options );
      node->initialize( options );
      node->startup();

      auto db = node->chain_database();
      app::database_api api( *db, &node->get_options() );

      if( options.count("operations") > 0 )
      {
         const auto counts = apply_operations_file( *db, options["operations"].as<boost::filesystem::path>() );
         ilog( "${a} operations applied, ${r} rejected", ("a",counts.first)("r",counts.second) );
      }

      const auto events = collect_events( api, node->get_options().api_limit_get_events );
      if( options.count("event-log") > 0 )
      {
         const auto log_file = options["event-log"].as<boost::filesystem::path>();
         fc::json::save_to_file( fc::variant( events, ATELIER_MAX_NESTED_OBJECTS ), fc::path( log_file.string() ) );
         ilog( "Wrote ${n} events to ${f}", ("n",events.size())("f",log_file.string()) );
      }

      if( node->is_plugin_enabled( "listing_history" ) )
      {
         auto history = node->get_plugin<listing_history::listing_history_plugin>( "listing_history" );
         for( const auto& listing : history->get_listings_for_sale() )
            ilog( "For sale: ${id} \"${t}\" at ${p} ${s}",
                  ("id",listing.artwork)("t",listing.title)
                  ("p",app::amount_to_string( listing.price ))("s",ATELIER_SYMBOL) );
         const auto fees = history->get_account_earnings( api.get_administrator() );
         ilog( "Platform fees collected: ${f} ${s}", ("f",app::amount_to_string( fees.platform_fees ))("s",ATELIER_SYMBOL) );
      }

      node->shutdown();
      return 0;
   } catch( const fc::exception& e ) {
      elog( "Exiting with error:\n${e}", ("e",e.to_detail_string()) );
      node->shutdown();
      return 1;
   }
}
