/**
 * @file       wasmbridge_run.cpp
 * @brief      Command line runner for WebAssembly command and reactor modules
 */
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "api/executor.hpp"
#include "base/logger.hpp"
#include "base/wasmbridge_version.hpp"

namespace
{
    /// process exit status used when the module could not be run at all
    constexpr int kRunnerFailureStatus = 255;

    struct Options
    {
        std::string                 module_path;
        std::vector<std::string>    guest_args;
        std::vector<std::string>    env;
        boost::optional<std::string> config_path;
        boost::optional<std::string> log_level;
        boost::optional<std::string> program_name;
        bool                        no_inherit_env = false;
        int                         stdin_fd       = 0;
        int                         stdout_fd      = 1;
        int                         stderr_fd      = 2;
    };

    /**
     * @brief       Parses the runner options
     * @return      Options, or none when the process should exit with @p status
     */
    boost::optional<Options> parseCommandLine( int argc, char **argv, int &status )
    {
        namespace po = boost::program_options;
        try
        {
            Options     o;
            std::string config_path;
            std::string log_level;
            std::string program_name;

            po::options_description desc( "wasmbridge-run options" );
            desc.add_options()( "help,h", "print usage message" )
                ( "version", "print version and exit" )
                ( "config,c", po::value( &config_path ), "JSON runtime configuration file" )
                ( "log-level,l", po::value( &log_level ), "trace, debug, info, warn, error, critical or off" )
                ( "program-name,p", po::value( &program_name ), "guest argv[0]" )
                ( "no-inherit-env", po::bool_switch( &o.no_inherit_env ), "do not pass the host environment to the guest" )
                ( "env,e", po::value( &o.env )->composing(), "guest environment variable KEY=VALUE, repeatable" )
                ( "stdin-fd", po::value( &o.stdin_fd )->default_value( 0 ), "host descriptor for the guest stdin, negative for the default" )
                ( "stdout-fd", po::value( &o.stdout_fd )->default_value( 1 ), "host descriptor for the guest stdout, negative for the default" )
                ( "stderr-fd", po::value( &o.stderr_fd )->default_value( 2 ), "host descriptor for the guest stderr, negative for the default" );

            po::options_description hidden;
            hidden.add_options()( "module", po::value( &o.module_path ), "module to run" )
                ( "args", po::value( &o.guest_args ), "guest arguments" );

            po::options_description all;
            all.add( desc ).add( hidden );

            po::positional_options_description positional;
            positional.add( "module", 1 ).add( "args", -1 );

            po::variables_map vm;
            po::store( po::command_line_parser( argc, argv ).options( all ).positional( positional ).run(), vm );
            po::notify( vm );

            if ( vm.count( "version" ) != 0 )
            {
                std::cout << wasmbridge::version::WasmBridgeVersionText() << std::endl;
                status = 0;
                return boost::none;
            }
            if ( vm.count( "help" ) != 0 || o.module_path.empty() )
            {
                std::cerr << "Usage: wasmbridge-run [options] <module.wasm> [--] [guest args...]\n"
                          << desc << "\n";
                status = vm.count( "help" ) != 0 ? 0 : kRunnerFailureStatus;
                return boost::none;
            }

            if ( !config_path.empty() )
            {
                o.config_path = config_path;
            }
            if ( !log_level.empty() )
            {
                o.log_level = log_level;
            }
            if ( !program_name.empty() )
            {
                o.program_name = program_name;
            }
            return o;
        }
        catch ( const std::exception &e )
        {
            std::cerr << e.what() << std::endl;
        }
        status = kRunnerFailureStatus;
        return boost::none;
    }

    boost::optional<std::vector<uint8_t>> readModule( const std::string &path )
    {
        std::ifstream file( path, std::ios::binary );
        if ( !file )
        {
            return boost::none;
        }
        return std::vector<uint8_t>( std::istreambuf_iterator<char>( file ), std::istreambuf_iterator<char>() );
    }
}

int main( int argc, char *argv[] )
{
    int  status  = 0;
    auto options = parseCommandLine( argc, argv, status );
    if ( !options )
    {
        return status;
    }

    auto logger = wasmbridge::base::createLogger( "WasmBridge" );

    wasmbridge::api::ExecutionRequest request;
    if ( options->config_path )
    {
        auto config = wasmbridge::config::loadRuntimeConfig( *options->config_path );
        if ( !config )
        {
            logger->error( "Cannot load configuration {}: {}", *options->config_path, config.error().message() );
            return kRunnerFailureStatus;
        }
        request.config = config.value();
    }
    if ( options->log_level )
    {
        request.config.log_level = *options->log_level;
    }
    if ( options->program_name )
    {
        request.config.program_name = *options->program_name;
    }
    if ( options->no_inherit_env )
    {
        request.config.inherit_environment = false;
    }

    auto level = wasmbridge::config::parseLogLevel( request.config.log_level );
    if ( !level )
    {
        logger->error( "Unknown log level {}", request.config.log_level );
        return kRunnerFailureStatus;
    }
    wasmbridge::base::setLogLevel( level.value() );

    auto bytes = readModule( options->module_path );
    if ( !bytes )
    {
        logger->error( "Cannot read module {}", options->module_path );
        return kRunnerFailureStatus;
    }

    request.wasm      = *bytes;
    request.args      = options->guest_args;
    request.stdin_fd  = options->stdin_fd;
    request.stdout_fd = options->stdout_fd;
    request.stderr_fd = options->stderr_fd;
    if ( request.config.inherit_environment )
    {
        request.environment = wasmbridge::api::captureHostEnvironment();
    }
    // the session builder replaces repeated names in place
    for ( const auto &entry : options->env )
    {
        auto eq = entry.find( '=' );
        if ( eq == std::string::npos || eq == 0 )
        {
            logger->error( "Environment entry {} is not KEY=VALUE", entry );
            return kRunnerFailureStatus;
        }
        request.environment.emplace_back( entry.substr( 0, eq ), entry.substr( eq + 1 ) );
    }

    try
    {
        auto exit_code = wasmbridge::api::executeWasm( request );
        if ( !exit_code )
        {
            logger->error( "Execution failed: {}", exit_code.error().message() );
            return kRunnerFailureStatus;
        }
        return exit_code.value();
    }
    catch ( const std::exception &e )
    {
        logger->critical( "Execution aborted: {}", e.what() );
    }
    return kRunnerFailureStatus;
}
