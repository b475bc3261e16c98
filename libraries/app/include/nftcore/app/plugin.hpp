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

#include <nftcore/chain/database.hpp>

#include <boost/program_options.hpp>

namespace nftcore { namespace app {

/**
 * Plugins observe a database and add functionality that is not part of the collection rules
 */
class abstract_plugin
{
   public:
      virtual ~abstract_plugin() {}

      virtual std::string plugin_name()const = 0;
      virtual std::string plugin_description()const = 0;

      /**
       * @brief Fill in command line and config file options the plugin recognizes
       *
       * @param command_line_options options that may only be given on the command line
       * @param config_file_options options that may also appear in the config file
       */
      virtual void plugin_set_program_options(
         boost::program_options::options_description& command_line_options,
         boost::program_options::options_description& config_file_options
         ) = 0;

      /**
       * @brief Perform early startup routines and register plugin indexes and callbacks
       */
      virtual void plugin_initialize( const boost::program_options::variables_map& options ) = 0;

      virtual void plugin_startup() = 0;

      /**
       * @brief Cease all activity and release resources
       */
      virtual void plugin_shutdown() = 0;
};

/**
 * Provides basic default implementations of abstract_plugin functions
 */
class plugin : public abstract_plugin
{
   public:
      explicit plugin( chain::database& db ) : _db( db ) {}
      ~plugin() override {}

      std::string plugin_name()const override { return "<unknown plugin>"; }
      std::string plugin_description()const override { return "<no description>"; }
      void plugin_set_program_options(
         boost::program_options::options_description&,
         boost::program_options::options_description& ) override {}
      void plugin_initialize( const boost::program_options::variables_map& ) override {}
      void plugin_startup() override {}
      void plugin_shutdown() override {}

      chain::database& database() { return _db; }
      const chain::database& database()const { return _db; }

   protected:
      chain::database& _db;
};

} } // nftcore::app
