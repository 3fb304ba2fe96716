#include "network/stream/stream_options.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "application/impl/config_reader/pt_util.hpp"

namespace csync::network::stream
{
    using application::ConfigReaderError;

    outcome::result<Priority> PriorityFromString( const std::string &name )
    {
        auto lower = boost::algorithm::to_lower_copy( name );
        for ( size_t level = 0; level < kPriorityLevels; ++level )
        {
            auto priority = static_cast<Priority>( level );
            if ( lower == boost::algorithm::to_lower_copy( std::string( ToString( priority ) ) ) )
            {
                return priority;
            }
        }
        return ConfigReaderError::INVALID_VALUE;
    }

    outcome::result<StreamOptions> ParseStreamOptions( const boost::property_tree::ptree &tree )
    {
        StreamOptions options;

        OUTCOME_TRY( workers, application::readOr<size_t>( tree, "stream.worker_threads", options.worker_threads ) );
        OUTCOME_TRY( capacity, application::readOr<size_t>( tree, "stream.queue_capacity", options.queue_capacity ) );
        if ( workers == 0 || capacity == 0 )
        {
            return ConfigReaderError::INVALID_VALUE;
        }
        options.worker_threads = workers;
        options.queue_capacity = capacity;

        OUTCOME_TRY( level_name, application::readOr<std::string>( tree, "stream.log_level", "info" ) );
        auto level = spdlog::level::from_str( level_name );
        // from_str falls back to off for names it does not know
        if ( level == spdlog::level::off && level_name != "off" )
        {
            return ConfigReaderError::INVALID_VALUE;
        }
        options.log_level = level;

        OUTCOME_TRY( priority_name,
                     application::readOr<std::string>( tree, "stream.default_priority", ToString( options.default_priority ) ) );
        OUTCOME_TRY( priority, PriorityFromString( priority_name ) );
        options.default_priority = priority;

        OUTCOME_TRY( retry_ms,
                     application::readOr<uint64_t>( tree,
                                                    "stream.empty_batch_retry_ms",
                                                    static_cast<uint64_t>( options.empty_batch_retry.count() ) ) );
        options.empty_batch_retry = std::chrono::milliseconds( retry_ms );

        return options;
    }

    outcome::result<StreamOptions> LoadStreamOptions( const std::string &path )
    {
        boost::property_tree::ptree tree;
        try
        {
            boost::property_tree::read_json( path, tree );
        }
        catch ( const boost::property_tree::json_parser_error & )
        {
            return ConfigReaderError::PARSER_ERROR;
        }
        OUTCOME_TRY( application::ensure( tree.get_child_optional( "stream" ) ) );
        return ParseStreamOptions( tree );
    }
}
