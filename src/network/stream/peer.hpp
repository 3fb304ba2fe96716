#ifndef CHUNKSYNC_NETWORK_STREAM_PEER_HPP
#define CHUNKSYNC_NETWORK_STREAM_PEER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/optional.hpp>
#include <libp2p/peer/peer_id.hpp>

#include "base/logger.hpp"
#include "network/stream/peer_connection.hpp"
#include "network/stream/priority_queue.hpp"

namespace csync::network::stream
{
    class ClientFetcher;
    class ServerNegotiator;

    /// Parameters of a subscription this node requested
    struct SubscribeRequest
    {
        boost::optional<Range> history;
        Priority               priority = Priority::Low;
    };

    /**
     * @brief Requesting side entry. The fetcher is null until the first offer arrives.
     */
    struct ClientSubscription
    {
        SubscribeRequest               request;
        std::shared_ptr<ClientFetcher> fetcher;
    };

    /**
     * @brief Session with one connected peer: the subscription table in both directions and the
     * outgoing queues drained by a dedicated writer thread.
     */
    class Peer
    {
    public:
        Peer( libp2p::peer::PeerId id, std::shared_ptr<PeerConnection> connection, size_t queue_capacity );

        ~Peer();

        Peer( const Peer & )            = delete;
        Peer &operator=( const Peer & ) = delete;

        const libp2p::peer::PeerId &Id() const
        {
            return id_;
        }

        /// Starts the writer thread
        void Start();

        /// Stops the writer thread and drops the queued frames
        void Stop();

        /**
         * @brief Encodes a message and queues it on the given priority
         * @return QUEUE_FULL or PEER_CLOSED when it cannot be queued
         */
        outcome::result<void> Send( const Message &message, Priority priority );

        /**
         * @brief Records a subscription this node requested
         * @return ALREADY_SUBSCRIBED when the key has a pending or active client entry
         */
        outcome::result<void> AddClient( const StreamID &stream, const SubscribeRequest &request );

        boost::optional<ClientSubscription> FindClient( const StreamID &stream ) const;

        /**
         * @brief Installs the fetcher of a pending entry
         * @return the fetcher now serving the key, an earlier one if it won the race, null when the entry is gone
         */
        std::shared_ptr<ClientFetcher> ActivateClient( const StreamID &stream, std::shared_ptr<ClientFetcher> fetcher );

        /**
         * @brief Removes the client entry of a key
         * @param expected when set, the entry is removed only if it is served by this fetcher
         */
        boost::optional<ClientSubscription> RemoveClient( const StreamID                       &stream,
                                                          const std::shared_ptr<ClientFetcher> &expected = nullptr );

        /**
         * @brief Removes the entries still waiting for their first offer whose key matches
         * @return the removed keys
         */
        std::vector<StreamID> RemovePendingClients( const std::function<bool( const StreamID & )> &match );

        /// @return false when the key already has a negotiator
        bool AddServer( const StreamID &stream, std::shared_ptr<ServerNegotiator> negotiator );

        std::shared_ptr<ServerNegotiator> FindServer( const StreamID &stream ) const;

        /**
         * @brief Removes the negotiator of a key
         * @param expected when set, the entry is removed only if it holds this negotiator
         */
        std::shared_ptr<ServerNegotiator> RemoveServer( const StreamID                          &stream,
                                                        const std::shared_ptr<ServerNegotiator> &expected = nullptr );

        /// Empties the table, the caller releases what it returns
        void TakeAll( std::vector<ClientSubscription> &clients, std::vector<std::shared_ptr<ServerNegotiator>> &servers );

        size_t QueuedFrames( Priority priority ) const
        {
            return queue_.Size( priority );
        }

    private:
        void WriteLoop();

        const libp2p::peer::PeerId      id_;
        std::shared_ptr<PeerConnection> connection_;
        PriorityFrameQueue              queue_;
        std::thread                     writer_;
        std::mutex                      writer_mutex_;

        mutable std::mutex                                                    table_mutex_;
        std::unordered_map<StreamID, ClientSubscription>                      clients_;
        std::unordered_map<StreamID, std::shared_ptr<ServerNegotiator>>       servers_;

        base::Logger logger_ = base::createLogger( "Peer" );
    };
}

#endif // CHUNKSYNC_NETWORK_STREAM_PEER_HPP
