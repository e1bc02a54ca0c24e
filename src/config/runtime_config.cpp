#include "config/runtime_config.hpp"

#include <fstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include "base/logger.hpp"

namespace wasmbridge::config
{
    namespace
    {
        /// Absent entry is boost::none, a present entry must convert to T
        template <typename T>
        outcome::result<boost::optional<T>> readEntry( const boost::property_tree::ptree &tree, const std::string &key )
        {
            auto child = tree.get_child_optional( key );
            if ( !child )
            {
                return boost::optional<T>{};
            }
            auto value = child->get_value_optional<T>();
            if ( !value )
            {
                return ConfigError::INVALID_VALUE;
            }
            return value;
        }

        outcome::result<void> loadFields( const boost::property_tree::ptree &tree, RuntimeConfig &config )
        {
            OUTCOME_TRY( name, readEntry<std::string>( tree, "program_name" ) );
            if ( name )
            {
                if ( name->empty() )
                {
                    return ConfigError::INVALID_VALUE;
                }
                config.program_name = *name;
            }

            OUTCOME_TRY( stack_size, readEntry<size_t>( tree, "stack_size" ) );
            if ( stack_size )
            {
                if ( *stack_size < RuntimeConfig::kMinStackSize )
                {
                    return ConfigError::INVALID_VALUE;
                }
                config.stack_size = *stack_size;
            }

            OUTCOME_TRY( inherit, readEntry<bool>( tree, "inherit_environment" ) );
            if ( inherit )
            {
                config.inherit_environment = *inherit;
            }

            OUTCOME_TRY( level, readEntry<std::string>( tree, "log_level" ) );
            if ( level )
            {
                OUTCOME_TRY( parseLogLevel( *level ) );
                config.log_level = *level;
            }

            OUTCOME_TRY( depth, readEntry<size_t>( tree, "trap_trail_depth" ) );
            if ( depth )
            {
                config.trap_trail_depth = *depth;
            }
            return outcome::success();
        }
    } // namespace

    outcome::result<spdlog::level::level_enum> parseLogLevel( const std::string &name )
    {
        auto level = spdlog::level::from_str( name );
        // from_str falls back to "off" for names it does not know
        if ( level == spdlog::level::off && name != "off" )
        {
            return ConfigError::INVALID_VALUE;
        }
        return level;
    }

    outcome::result<RuntimeConfig> parseRuntimeConfig( std::istream &input )
    {
        boost::property_tree::ptree tree;
        try
        {
            boost::property_tree::read_json( input, tree );
        }
        catch ( const boost::property_tree::json_parser_error &e )
        {
            base::createLogger( "RuntimeConfig" )->error( "Parser error: {}, line {}: {}", e.filename(), e.line(), e.message() );
            return ConfigError::PARSER_ERROR;
        }

        RuntimeConfig config;
        OUTCOME_TRY( loadFields( tree, config ) );
        return config;
    }

    outcome::result<RuntimeConfig> loadRuntimeConfig( const std::string &file_path )
    {
        std::ifstream file( file_path );
        if ( !file.is_open() )
        {
            base::createLogger( "RuntimeConfig" )->error( "Cannot open config file {}", file_path );
            return ConfigError::FILE_NOT_FOUND;
        }
        return parseRuntimeConfig( file );
    }

} // namespace wasmbridge::config
