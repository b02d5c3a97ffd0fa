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
#include <atelier/app/plugin.hpp>

#include <fc/log/logger.hpp>

#include <map>

namespace atelier { namespace app {

namespace bpo = boost::program_options;

namespace detail {

   class application_impl
   {
      public:
         explicit application_impl( application* self )
            : _self(self),
              _chain_db( std::make_shared<chain::database>() )
         {}

         void initialize( const bpo::variables_map& options );
         void startup();
         void shutdown();

         void set_api_limit();
         void initialize_plugins();
         void startup_plugins();
         void shutdown_plugins();

         application* _self;

         const bpo::variables_map* _options = nullptr;
         application_options _app_options;

         std::shared_ptr<chain::database> _chain_db;
         std::shared_ptr<chain::payment_gateway> _payment_gateway;

         std::map<string, std::shared_ptr<abstract_plugin>> _active_plugins;
         std::map<string, std::shared_ptr<abstract_plugin>> _available_plugins;

         bool _is_finished_initializing = false;
   };

   void application_impl::set_api_limit()
   {
      if( _options->count("api-limit-get-events") > 0 )
         _app_options.api_limit_get_events = _options->at("api-limit-get-events").as<uint32_t>();
      if( _options->count("api-limit-get-reviews") > 0 )
         _app_options.api_limit_get_reviews = _options->at("api-limit-get-reviews").as<uint32_t>();
   }

   void application_impl::initialize( const bpo::variables_map& options )
   { try {
      _options = &options;
      set_api_limit();

      const string administrator = options.count("administrator") > 0
                                   ? options.at("administrator").as<string>()
                                   : string( ATELIER_DEFAULT_ADMINISTRATOR );
      const uint32_t platform_fee = options.count("platform-fee") > 0
                                    ? options.at("platform-fee").as<uint32_t>()
                                    : uint32_t( ATELIER_DEFAULT_PLATFORM_FEE );
      ATELIER_ASSERT( platform_fee <= ATELIER_MAX_PLATFORM_FEE, protocol::invalid_argument_exception,
                      "platform-fee cannot exceed ${max}", ("max",ATELIER_MAX_PLATFORM_FEE)("fee",platform_fee) );

      if( _payment_gateway )
         _chain_db->set_payment_gateway( _payment_gateway );
      _chain_db->initialize( administrator, static_cast<uint16_t>( platform_fee ) );

      initialize_plugins();
   } FC_CAPTURE_AND_RETHROW() }

   void application_impl::startup()
   {
      startup_plugins();
      _is_finished_initializing = true;
   }

   void application_impl::shutdown()
   {
      ilog( "Shutting down application" );
      shutdown_plugins();
   }

   void application_impl::initialize_plugins()
   {
      for( const auto& entry : _active_plugins )
      {
         ilog( "Initializing plugin ${name}", ( "name", entry.second->plugin_name() ) );
         entry.second->plugin_initialize( *_options );
         ilog( "Initialized plugin ${name}", ( "name", entry.second->plugin_name() ) );
      }
   }

   void application_impl::startup_plugins()
   {
      for( const auto& entry : _active_plugins )
      {
         ilog( "Starting plugin ${name}", ( "name", entry.second->plugin_name() ) );
         entry.second->plugin_startup();
         ilog( "Started plugin ${name}", ( "name", entry.second->plugin_name() ) );
      }
   }

   void application_impl::shutdown_plugins()
   {
      for( const auto& entry : _active_plugins )
      {
         ilog( "Stopping plugin ${name}", ( "name", entry.second->plugin_name() ) );
         entry.second->plugin_shutdown();
         ilog( "Stopped plugin ${name}", ( "name", entry.second->plugin_name() ) );
      }
   }

} // namespace detail

application::application()
   : my( new detail::application_impl( this ) )
{}

application::~application()
{
   ilog( "Application quitting" );
}

void application::set_program_options( bpo::options_description& command_line_options,
                                       bpo::options_description& configuration_file_options )const
{
   const auto& default_opts = application_options::get_default();
   configuration_file_options.add_options()
         ("administrator", bpo::value<string>()->default_value( ATELIER_DEFAULT_ADMINISTRATOR ),
          "Account allowed to change the platform fee, receives the platform fee of every sale")
         ("platform-fee", bpo::value<uint32_t>()->default_value( ATELIER_DEFAULT_PLATFORM_FEE ),
          "Initial platform fee in tenths of a percent, at most 100")
         ("api-limit-get-events", bpo::value<uint32_t>()->default_value( default_opts.api_limit_get_events ),
          "For database_api::get_events to set max limit value")
         ("api-limit-get-reviews", bpo::value<uint32_t>()->default_value( default_opts.api_limit_get_reviews ),
          "For database_api::get_reviews to set max limit value")
         ;
   command_line_options.add( configuration_file_options );
   command_line_options.add( _cli_options );
   configuration_file_options.add( _cfg_options );
}

void application::initialize( const bpo::variables_map& options )
{
   my->initialize( options );
}

void application::startup()
{
   my->startup();
}

void application::shutdown()
{
   my->shutdown();
}

std::shared_ptr<abstract_plugin> application::get_plugin( const string& name )const
{
   auto itr = my->_active_plugins.find( name );
   if( itr == my->_active_plugins.end() )
      return nullptr;
   return itr->second;
}

bool application::is_plugin_enabled( const string& name )const
{
   return my->_active_plugins.find( name ) != my->_active_plugins.end();
}

void application::enable_plugin( const string& name )
{
   FC_ASSERT( my->_available_plugins.find( name ) != my->_available_plugins.end(), "Unknown plugin '" + name + "'" );
   my->_active_plugins[name] = my->_available_plugins[name];
}

void application::add_available_plugin( std::shared_ptr<abstract_plugin> p )
{
   my->_available_plugins[p->plugin_name()] = p;
}

void application::set_payment_gateway( std::shared_ptr<chain::payment_gateway> gateway )
{
   FC_ASSERT( !my->_is_finished_initializing, "Payment gateway can not be replaced after startup" );
   my->_payment_gateway = std::move( gateway );
}

std::shared_ptr<chain::database> application::chain_database()const
{
   return my->_chain_db;
}

const application_options& application::get_options()const
{
   return my->_app_options;
}

} } // atelier::app
