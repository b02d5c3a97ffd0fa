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
#pragma once

#include <atelier/chain/database.hpp>

#include <boost/program_options.hpp>

namespace atelier { namespace app {

   namespace detail { class application_impl; }
   using std::string;

   class abstract_plugin;

   class application_options
   {
      public:
         uint32_t api_limit_get_events = ATELIER_DEFAULT_API_LIMIT_GET_EVENTS;
         uint32_t api_limit_get_reviews = ATELIER_DEFAULT_API_LIMIT_GET_EVENTS;

         static const application_options& get_default()
         {
            static const application_options default_options;
            return default_options;
         }
   };

   class application
   {
      public:
         application();
         ~application();

         void set_program_options( boost::program_options::options_description& command_line_options,
                                   boost::program_options::options_description& configuration_file_options )const;
         void initialize( const boost::program_options::variables_map& options );
         void startup();
         void shutdown();

         template<typename PluginType>
         std::shared_ptr<PluginType> register_plugin( bool auto_load = false )
         {
            auto plug = std::make_shared<PluginType>( *this );

            string cli_plugin_desc = plug->plugin_name() + " plugin. " + plug->plugin_description() + "\nOptions";
            boost::program_options::options_description plugin_cli_options( cli_plugin_desc ), plugin_cfg_options;
            plug->plugin_set_program_options( plugin_cli_options, plugin_cfg_options );

            if( !plugin_cli_options.options().empty() )
               _cli_options.add( plugin_cli_options );

            if( !plugin_cfg_options.options().empty() )
               _cfg_options.add( plugin_cfg_options );

            add_available_plugin( plug );

            if( auto_load )
               enable_plugin( plug->plugin_name() );

            return plug;
         }

         std::shared_ptr<abstract_plugin> get_plugin( const string& name )const;

         template<typename PluginType>
         std::shared_ptr<PluginType> get_plugin( const string& name ) const
         {
            std::shared_ptr<abstract_plugin> abs_plugin = get_plugin( name );
            std::shared_ptr<PluginType> result = std::dynamic_pointer_cast<PluginType>( abs_plugin );
            FC_ASSERT( result != std::shared_ptr<PluginType>(), "Unable to load plugin '${p}'", ("p",name) );
            return result;
         }

         bool is_plugin_enabled( const string& name )const;
         void enable_plugin( const string& name );

         /// Must be called before initialize() to pay out through something other than the built-in escrow ledger
         void set_payment_gateway( std::shared_ptr<chain::payment_gateway> gateway );

         std::shared_ptr<chain::database> chain_database()const;

         const application_options& get_options()const;

      private:
         void add_available_plugin( std::shared_ptr<abstract_plugin> p );

         std::shared_ptr<detail::application_impl> my;

         boost::program_options::options_description _cli_options;
         boost::program_options::options_description _cfg_options;
   };

} } // atelier::app

FC_REFLECT( atelier::app::application_options,
            (api_limit_get_events)
            (api_limit_get_reviews)
          )
