#ifndef CHUNKSYNC_NETWORK_STREAM_STREAM_OPTIONS_HPP
#define CHUNKSYNC_NETWORK_STREAM_STREAM_OPTIONS_HPP

#include <chrono>
#include <string>

#include <boost/property_tree/ptree.hpp>
#include <spdlog/spdlog.h>

#include "network/stream/stream_id.hpp"
#include "outcome/outcome.hpp"

namespace csync::network::stream
{
    /**
     * @brief Tunables of a Streamer
     */
    struct StreamOptions
    {
        /// threads serving the negotiators
        size_t worker_threads = 2;
        /// frames each priority queue of a peer holds before Push fails
        size_t queue_capacity = 4096;
        spdlog::level::level_enum log_level = spdlog::level::info;
        /// used by callers that do not pick a priority
        Priority default_priority = Priority::Mid;
        /// delay before asking a server again after it produced an empty batch
        std::chrono::milliseconds empty_batch_retry{ 200 };
    };

    /**
     * @brief Reads the "stream" section of a configuration tree. Absent keys keep their defaults.
     * @return PARSER_ERROR for values of the wrong type, INVALID_VALUE for unknown names or zero counts
     */
    outcome::result<StreamOptions> ParseStreamOptions( const boost::property_tree::ptree &tree );

    /// Reads StreamOptions from a JSON file, MISSING_ENTRY when it has no "stream" section
    outcome::result<StreamOptions> LoadStreamOptions( const std::string &path );

    outcome::result<Priority> PriorityFromString( const std::string &name );
}

#endif // CHUNKSYNC_NETWORK_STREAM_STREAM_OPTIONS_HPP
