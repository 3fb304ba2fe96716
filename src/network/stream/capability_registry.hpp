#ifndef CHUNKSYNC_NETWORK_STREAM_CAPABILITY_REGISTRY_HPP
#define CHUNKSYNC_NETWORK_STREAM_CAPABILITY_REGISTRY_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/optional.hpp>

#include "base/logger.hpp"
#include "network/stream/client.hpp"
#include "network/stream/server.hpp"

namespace csync::network::stream
{
    /**
     * @brief Stream kinds a node can serve and request, by name.
     * Filled at startup and sealed before the node starts talking to peers. Lookups after sealing
     * take no lock.
     */
    class CapabilityRegistry
    {
    public:
        /**
         * @brief Installs the client factory of a stream kind, replacing a previous one
         * @return REGISTRY_SEALED after Seal()
         */
        outcome::result<void> RegisterClientFunc( const std::string &name, ClientFunc func );

        /**
         * @brief Installs the server factory of a stream kind, replacing a previous one
         * @return REGISTRY_SEALED after Seal()
         */
        outcome::result<void> RegisterServerFunc( const std::string &name, ServerFunc func );

        /// @return STREAM_NOT_REGISTERED without client factory
        outcome::result<ClientFunc> GetClientFunc( const std::string &name ) const;

        /// @return STREAM_NOT_REGISTERED without server factory
        outcome::result<ServerFunc> GetServerFunc( const std::string &name ) const;

        void Seal();

        bool IsSealed() const;

    private:
        struct Entry
        {
            ClientFunc client;
            ServerFunc server;
        };

        boost::optional<Entry> Find( const std::string &name ) const;

        mutable std::mutex                     mutex_;
        std::atomic<bool>                      sealed_{ false };
        std::unordered_map<std::string, Entry> entries_;

        base::Logger logger_ = base::createLogger( "CapabilityRegistry" );
    };
}

#endif // CHUNKSYNC_NETWORK_STREAM_CAPABILITY_REGISTRY_HPP
