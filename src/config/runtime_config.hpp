#ifndef WASMBRIDGE_CONFIG_RUNTIME_CONFIG_HPP
#define WASMBRIDGE_CONFIG_RUNTIME_CONFIG_HPP

#include <cstddef>
#include <istream>
#include <string>

#include <spdlog/common.h>

#include "config/config_error.hpp"

namespace wasmbridge::config
{
    /**
     * @brief Tunables of one execution call. Every field has a usable default,
     * a configuration file only overrides what it names.
     */
    struct RuntimeConfig
    {
        /// Lower bound of the execution thread's stack
        static constexpr size_t kMinStackSize = 8 * 1024 * 1024;

        std::string program_name{ "wasmbridge" };       ///< guest argv[0]
        size_t      stack_size{ kMinStackSize };        ///< execution thread stack in bytes
        bool        inherit_environment{ true };        ///< pass the host environment to the guest
        std::string log_level{ "info" };                ///< spdlog level name
        size_t      trap_trail_depth{ 16 };             ///< host calls kept for trap diagnostics
    };

    /**
     * @brief Converts a level name ("trace" ... "off") to the spdlog enum
     */
    outcome::result<spdlog::level::level_enum> parseLogLevel( const std::string &name );

    /**
     * @brief Reads a JSON document of the form
     * { "program_name": "...", "stack_size": 8388608, "inherit_environment": true,
     *   "log_level": "info", "trap_trail_depth": 16 }
     * @param input stream with the document
     * @return configuration with defaults for absent keys
     */
    outcome::result<RuntimeConfig> parseRuntimeConfig( std::istream &input );

    /**
     * @brief Same as parseRuntimeConfig() for a file on disk
     */
    outcome::result<RuntimeConfig> loadRuntimeConfig( const std::string &file_path );

} // namespace wasmbridge::config

#endif // WASMBRIDGE_CONFIG_RUNTIME_CONFIG_HPP
