#include "base/logger.hpp"

#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    constexpr const char *kGlobalPattern = "[%Y-%m-%d %H:%M:%S][%l][%n] %v";
    constexpr const char *kDebugPattern  = "[%Y-%m-%d %H:%M:%S.%e][th:%t][%l][%n] %v";

    std::mutex &loggerMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    spdlog::level::level_enum &currentLevel()
    {
        static spdlog::level::level_enum level = spdlog::level::info;
        return level;
    }

    bool isDebugLevel( spdlog::level::level_enum level )
    {
        return level <= spdlog::level::debug;
    }

    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag, const std::string &basepath )
    {
        std::shared_ptr<spdlog::logger> logger;
        if ( !basepath.empty() )
        {
            logger = spdlog::basic_logger_mt( tag, basepath );
        }
        else
        {
            logger = spdlog::stdout_color_mt( tag );
        }
        logger->set_level( currentLevel() );
        logger->set_pattern( isDebugLevel( currentLevel() ) ? kDebugPattern : kGlobalPattern );
        return logger;
    }
} // namespace

namespace csync::base
{
    Logger createLogger( const std::string &tag, const std::string &basepath )
    {
        std::lock_guard<std::mutex> lock( loggerMutex() );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag, basepath );
        }
        return logger;
    }

    void setLoggingLevel( spdlog::level::level_enum level )
    {
        std::lock_guard<std::mutex> lock( loggerMutex() );
        currentLevel() = level;
        spdlog::apply_all(
            [level]( const std::shared_ptr<spdlog::logger> &logger )
            {
                logger->set_level( level );
                logger->set_pattern( isDebugLevel( level ) ? kDebugPattern : kGlobalPattern );
            } );
    }
} // namespace csync::base
