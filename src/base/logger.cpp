#include "base/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag )
    {
        // stdout may be the guest's stream, diagnostics never go there
        auto logger = spdlog::stderr_color_mt( tag );
        setGlobalPattern( *logger );
        return logger;
    }
} // namespace

namespace wasmbridge::base
{
    Logger createLogger( const std::string &tag )
    {
        static std::mutex           mutex;
        std::lock_guard<std::mutex> lock( mutex );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag );
        }
        return logger;
    }

    void setLogLevel( spdlog::level::level_enum level )
    {
        spdlog::set_level( level );
    }
} // namespace wasmbridge::base
