/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
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
#include <lotvault/chain/exceptions.hpp>
#include <lotvault/chain/fee_policy.hpp>
#include <lotvault/chain/local_collaborators.hpp>
#include <lotvault/chain/staking_pool.hpp>

#include <lotvault/protocol/fixed_point.hpp>

#include <fc/io/json.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/crypto/hex.hpp>
#include <fc/variant_object.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>

using namespace lotvault::chain;
using namespace lotvault::protocol;
namespace bpo = boost::program_options;

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

fc::log_level string_to_level( const std::string& level )
{
   fc::log_level result;
   if( level == "info" )
      result = fc::log_level::info;
   else if( level == "debug" )
      result = fc::log_level::debug;
   else if( level == "warn" )
      result = fc::log_level::warn;
   else if( level == "error" )
      result = fc::log_level::error;
   else if( level == "all" )
      result = fc::log_level::all;
   else
      FC_THROW( "Log level not allowed. Allowed levels are info, debug, warn, error and all." );

   return result;
}

void setup_logging( const std::string& console_level )
{
   fc::logging_config cfg;

   fc::console_appender::config console_appender_config;
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::debug,
         fc::console_appender::color::green ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::warn,
         fc::console_appender::color::brown ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::error,
         fc::console_appender::color::red ) );
   cfg.appenders.push_back( fc::appender_config( "default", "console", fc::variant( console_appender_config, 20 ) ) );
   cfg.loggers = { fc::logger_config( "default" ) };
   cfg.loggers.front().level = string_to_level( console_level );
   cfg.loggers.front().appenders = { "default" };

   fc::configure_logging( cfg );
}

/// Amounts are given in base units, i.e. already multiplied by LOTVAULT_SCALE
share_type parse_amount( const std::string& s )
{ try {
   FC_ASSERT( !s.empty(), "Empty amount" );
   share_type result = 0;
   for( char c : s )
   {
      FC_ASSERT( c >= '0' && c <= '9', "Invalid character ${c} in amount", ("c",std::string(1,c)) );
      result = checked_add( checked_mul( result, 10 ), share_type( c - '0' ) );
   }
   return result;
} FC_CAPTURE_AND_RETHROW( (s) ) }

void write_default_config_file( const fc::path& config_ini_path, const bpo::options_description& cfg_options )
{
   ilog( "Writing new config file at ${path}", ("path",config_ini_path) );
   if( !fc::exists( config_ini_path.parent_path() ) )
      fc::create_directories( config_ini_path.parent_path() );

   std::ofstream out_cfg( config_ini_path.preferred_string() );
   for( const boost::shared_ptr<bpo::option_description>& od : cfg_options.options() )
   {
      if( !od->description().empty() )
         out_cfg << "# " << od->description() << "\n";
      boost::any store;
      if( !od->semantic()->apply_default( store ) )
         out_cfg << "# " << od->long_name() << " = \n";
      else
      {
         auto example = od->format_parameter();
         if( example.empty() )
            // This is a boolean switch
            out_cfg << od->long_name() << " = " << "false\n";
         else
         {
            // The string is formatted "arg (=<interesting part>)"
            example.erase( 0, 6 );
            example.erase( example.length() - 1 );
            out_cfg << od->long_name() << " = " << example << "\n";
         }
      }
      out_cfg << "\n";
   }
}

/// Reads config.ini from @p data_dir, writing one with the defaults first if it does not exist
void load_configuration_options( const fc::path& data_dir, const bpo::options_description& cfg_options,
                                 bpo::variables_map& options )
{
   const auto config_ini_path = data_dir / "config.ini";
   if( !fc::exists( config_ini_path ) )
      write_default_config_file( config_ini_path, cfg_options );

   bpo::store( bpo::parse_config_file<char>( config_ini_path.preferred_string().c_str(), cfg_options, true ),
               options );
}

pool_parameters parameters_from_options( const bpo::variables_map& options )
{
   pool_parameters params;
   params.unit_size = parse_amount( options.at("unit-size").as<std::string>() );
   params.units_per_lot = options.at("units-per-lot").as<uint32_t>();
   params.admin_fee = parse_amount( options.at("admin-fee").as<std::string>() );
   params.buffer = parse_amount( options.at("buffer").as<std::string>() );
   params.refund_fees_on_withdraw = options.at("refund-fees-on-withdraw").as<bool>();
   params.validate();
   return params;
}

/// The main program
int main( int argc, char** argv )
{
   fc::oexception unhandled_exception;
   try {
      bpo::options_description app_options("LotVault Pool Replay");
      bpo::options_description cfg_options("LotVault Pool Replay");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("data-dir,d", bpo::value<boost::filesystem::path>()->default_value("pool_replay_data_dir"),
                    "Directory containing the configuration file")
            ("operations,o", bpo::value<std::string>(), "JSON file with the array of operations to replay")
            ("continue-on-error", "Log failed operations and keep replaying instead of stopping")
            ("log-level", bpo::value<std::string>()->default_value("info"),
                    "Level of console logging. Allowed levels: info, debug, warn, error, all");

      const std::string default_unit_size = fc::variant( share_type( LOTVAULT_DEFAULT_UNIT_SIZE ), 1 ).as_string();
      const std::string default_buffer = fc::variant( share_type( LOTVAULT_DEFAULT_BUFFER ), 1 ).as_string();

      cfg_options.add_options()
            ("unit-size", bpo::value<std::string>()->default_value( default_unit_size ),
                    "Capital provisioned per unit, in base units")
            ("units-per-lot", bpo::value<uint32_t>()->default_value( LOTVAULT_DEFAULT_UNITS_PER_LOT ),
                    "Number of units one provisioning batch may create")
            ("admin-fee", bpo::value<std::string>()->default_value( "0" ),
                    "Flat fee per unit, in base units")
            ("buffer", bpo::value<std::string>()->default_value( default_buffer ),
                    "Tolerance above the capacity limit, in base units")
            ("refund-fees-on-withdraw", bpo::value<bool>()->default_value( LOTVAULT_DEFAULT_REFUND_FEES_ON_WITHDRAW ),
                    "Refund withdrawal fees from the accrued fee instead of adding them to it")
            ("operator", bpo::value<std::string>()->default_value( "operator" ),
                    "Account name of the pool operator")
            ("fee-percent", bpo::value<uint16_t>()->default_value( 0 ),
                    "Deposit and withdrawal fee in 1/100 of a percent, 0 disables fee processing")
            ("withdrawal-credentials", bpo::value<std::string>()->default_value( "" ),
                    "Hex encoded 32 byte withdrawal credentials handed to the provisioning sink");

      bpo::variables_map options;
      try
      {
         bpo::options_description all_cli( app_options );
         all_cli.add( cfg_options );
         bpo::store( bpo::parse_command_line( argc, argv, all_cli ), options );
      }
      catch( const boost::program_options::error& e )
      {
         disable_default_logging();
         std::cerr << "Error parsing command line: " << e.what() << "\n";
         return EXIT_FAILURE;
      }

      if( options.count("help") > 0 )
      {
         disable_default_logging();
         std::cout << app_options << "\n" << cfg_options << "\n";
         return EXIT_SUCCESS;
      }

      setup_logging( options.at("log-level").as<std::string>() );

      fc::path data_dir = options["data-dir"].as<boost::filesystem::path>();
      if( data_dir.is_relative() )
         data_dir = fc::current_path() / data_dir;
      load_configuration_options( data_dir, cfg_options, options );
      bpo::notify( options );

      FC_ASSERT( options.count("operations") > 0, "No operations file given, see --help" );
      const fc::path operations_file( options.at("operations").as<std::string>() );
      FC_ASSERT( fc::exists( operations_file ), "Operations file ${f} does not exist", ("f",operations_file) );

      const auto ops = fc::json::from_file( operations_file ).as<vector<operation>>( LOTVAULT_MAX_NESTED_OBJECTS );

      const std::string pool_operator = options.at("operator").as<std::string>();

      local_share_token token;
      local_wrapped_vault vault( token );
      local_provisioning_sink sink;
      staking_pool pool( pool_operator, parameters_from_options( options ), token, vault, sink );

      const uint16_t fee_percent = options.at("fee-percent").as<uint16_t>();
      pool.register_fee_policy( "percent", std::make_shared<percent_fee_policy>( fee_percent, fee_percent ) );
      if( fee_percent > 0 )
      {
         pool_fee_policy_update_operation select_fee;
         select_fee.account = pool_operator;
         select_fee.fee_policy = string( "percent" );
         pool.push_operation( select_fee );
      }

      const std::string credentials_hex = options.at("withdrawal-credentials").as<std::string>();
      if( !credentials_hex.empty() )
      {
         pool_withdrawal_credentials_update_operation set_credentials;
         set_credentials.account = pool_operator;
         set_credentials.withdrawal_credentials.resize( LOTVAULT_WITHDRAWAL_CREDENTIALS_SIZE );
         const auto size = fc::from_hex( credentials_hex, set_credentials.withdrawal_credentials.data(),
                                         set_credentials.withdrawal_credentials.size() );
         FC_ASSERT( size == LOTVAULT_WITHDRAWAL_CREDENTIALS_SIZE && credentials_hex.size() == size * 2,
                    "Withdrawal credentials must be ${n} bytes of hex", ("n",LOTVAULT_WITHDRAWAL_CREDENTIALS_SIZE) );
         pool.push_operation( set_credentials );
      }

      const bool continue_on_error = options.count("continue-on-error") > 0;
      ilog( "Replaying ${n} operations from ${f}", ("n",ops.size())("f",operations_file) );

      vector<fc::variant> results;
      size_t failed = 0;
      for( size_t i = 0; i < ops.size(); ++i )
      {
         try {
            results.emplace_back( pool.push_operation( ops[i] ), LOTVAULT_MAX_NESTED_OBJECTS );
         } catch( const fc::exception& e ) {
            if( !continue_on_error )
               throw;
            ++failed;
            elog( "Operation ${i} failed: ${e}", ("i",i)("e",e.to_string()) );
            fc::mutable_variant_object error;
            error["error"] = e.to_string();
            error["code"] = e.code();
            results.emplace_back( error );
         }
      }

      const pool_object state = pool.get_pool();
      fc::mutable_variant_object summary;
      summary["pool"] = fc::variant( state, LOTVAULT_MAX_NESTED_OBJECTS );
      summary["parameters"] = fc::variant( pool.get_parameters(), LOTVAULT_MAX_NESTED_OBJECTS );
      summary["operator"] = pool.get_pool_operator();
      summary["paused"] = pool.is_paused();
      summary["fee_policy"] = fc::variant( pool.get_fee_policy_name(), 1 );
      summary["capacity_limit"] = fc::variant( pool.get_capacity_limit(), 1 );
      summary["remaining_capacity"] = fc::variant( pool.get_remaining_capacity(), 1 );
      summary["max_deposit_before_fee"] = fc::variant( pool.get_max_deposit_before_fee(), 1 );
      summary["share_supply"] = fc::variant( token.total_supply(), 1 );
      summary["wrapped_supply"] = fc::variant( vault.total_supply(), 1 );
      summary["provisioned"] = fc::variant( sink.total_provisioned(), 1 );
      summary["claimed_shares_decimal"] = to_decimal_string( state.claimed_shares );
      summary["results"] = results;
      summary["failed"] = failed;
      std::cout << fc::json::to_pretty_string( summary ) << "\n";

      ilog( "Replayed ${n} operations, ${f} failed", ("n",ops.size())("f",failed) );
      return EXIT_SUCCESS;
   } catch( const fc::exception& e ) {
      unhandled_exception = e;
   }

   if( unhandled_exception )
   {
      elog( "Exiting with error:\n${e}", ("e",unhandled_exception->to_detail_string()) );
      return EXIT_FAILURE;
   }
   return EXIT_SUCCESS;
}
