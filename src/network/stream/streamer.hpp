#ifndef CHUNKSYNC_NETWORK_STREAM_STREAMER_HPP
#define CHUNKSYNC_NETWORK_STREAM_STREAMER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/optional.hpp>
#include <gsl/span>
#include <libp2p/peer/peer_id.hpp>

#include "base/logger.hpp"
#include "network/stream/capability_registry.hpp"
#include "network/stream/peer.hpp"
#include "network/stream/stream_options.hpp"

namespace csync::network::stream
{
    /**
     * @brief Node-level entry point of chunk streaming. Owns the peer sessions and the worker
     * threads, subscribes to peers and dispatches the frames they send.
     */
    class Streamer : public std::enable_shared_from_this<Streamer>
    {
    public:
        using PeerId = libp2p::peer::PeerId;

        /// A subscription was torn down after a failure
        using SubscriptionErrorHandler =
            std::function<void( const PeerId &peer, const StreamID &stream, const std::error_code &error )>;

        /// The peer refused a subscription request
        using SubscribeErrorHandler = std::function<void( const PeerId &peer, const std::string &error )>;

        using ChunkDeliveryHandler = std::function<void( const PeerId &peer, const ChunkDeliveryMsg &delivery )>;

        /**
         * @brief Seals the registry and starts the worker threads
         */
        Streamer( std::shared_ptr<CapabilityRegistry> registry, StreamOptions options );

        ~Streamer();

        Streamer( const Streamer & )            = delete;
        Streamer &operator=( const Streamer & ) = delete;

        /**
         * @brief Creates the session of a connected peer and starts its writer
         * @return PEER_ALREADY_CONNECTED when a session exists, the existing one is kept
         */
        outcome::result<void> AddPeer( const PeerId &peer, std::shared_ptr<PeerConnection> connection );

        /**
         * @brief Tears down every subscription of a disconnected peer without notifying it
         * @return UNKNOWN_PEER without session
         */
        outcome::result<void> RemovePeer( const PeerId &peer );

        /**
         * @brief Asks a peer for a stream
         * @param history range to replay, for a live stream replayed next to the live tail
         * @param priority priority of the subscription traffic
         * @return "stream <name> not registered" without client factory, UNKNOWN_PEER, ALREADY_SUBSCRIBED
         */
        outcome::result<void> Subscribe( const PeerId                 &peer,
                                         const StreamID               &stream,
                                         const boost::optional<Range> &history,
                                         Priority                      priority );

        /**
         * @brief Ends a subscription in both directions and notifies the peer.
         * Succeeds without sending anything when there is no entry.
         */
        outcome::result<void> Unsubscribe( const PeerId &peer, const StreamID &stream );

        /// Asks the peer to subscribe to a stream of this node
        outcome::result<void> RequestSubscription( const PeerId                 &peer,
                                                   const StreamID               &stream,
                                                   const boost::optional<Range> &history,
                                                   Priority                      priority );

        /**
         * @brief Entry point of the transport for every received frame
         * @return the decode error of a malformed frame, UNKNOWN_PEER without session.
         * Messages for unknown subscriptions are discarded and succeed.
         */
        outcome::result<void> HandleMessage( const PeerId &peer, uint8_t code, gsl::span<const uint8_t> payload );

        /// Removes every peer and joins the worker threads
        void Stop();

        void SetSubscriptionErrorHandler( SubscriptionErrorHandler handler );
        void SetSubscribeErrorHandler( SubscribeErrorHandler handler );
        void SetChunkDeliveryHandler( ChunkDeliveryHandler handler );

        bool HasClientSubscription( const PeerId &peer, const StreamID &stream ) const;
        bool HasServerSubscription( const PeerId &peer, const StreamID &stream ) const;

        /// Last takeover proof the peer sent for a stream this node serves
        boost::optional<TakeoverProof> LastTakeoverProof( const PeerId &peer, const StreamID &stream ) const;

        const StreamOptions &Options() const
        {
            return options_;
        }

    private:
        std::shared_ptr<Peer> FindPeer( const PeerId &peer ) const;

        outcome::result<void> OnUnsubscribe( const std::shared_ptr<Peer> &peer, const UnsubscribeMsg &msg );
        outcome::result<void> OnOfferedHashes( const std::shared_ptr<Peer> &peer, OfferedHashesMsg msg );
        outcome::result<void> OnWantedHashes( const std::shared_ptr<Peer> &peer, WantedHashesMsg msg );
        outcome::result<void> OnTakeoverProof( const std::shared_ptr<Peer> &peer, TakeoverProofMsg msg );
        outcome::result<void> OnSubscribe( const std::shared_ptr<Peer> &peer, const SubscribeMsg &msg );
        outcome::result<void> OnChunkDelivery( const std::shared_ptr<Peer> &peer, const ChunkDeliveryMsg &msg );
        outcome::result<void> OnSubscribeError( const std::shared_ptr<Peer> &peer, const SubscribeErrorMsg &msg );
        outcome::result<void> OnRequestSubscription( const std::shared_ptr<Peer> &peer, const RequestSubscriptionMsg &msg );

        /// Records the pending client entries of a subscription and sends Subscribe
        outcome::result<void> AddSubscription( const std::shared_ptr<Peer>  &session,
                                               const StreamID               &stream,
                                               const boost::optional<Range> &history,
                                               Priority                      priority );

        /// Creates and starts the negotiator of one served stream, duplicates are ignored
        void StartServer( const std::shared_ptr<Peer>  &peer,
                          const ServerFunc             &server_func,
                          const StreamID               &stream,
                          Range                         start,
                          const boost::optional<Range> &bound,
                          Priority                      priority );

        /// Instantiates the client of a pending entry on its first offer
        outcome::result<std::shared_ptr<ClientFetcher>> ActivateClient( const std::shared_ptr<Peer> &peer,
                                                                         const StreamID              &stream,
                                                                         const SubscribeRequest      &request );

        void OnServerFinished( const std::weak_ptr<Peer>               &weak_peer,
                               const std::shared_ptr<ServerNegotiator> &negotiator,
                               outcome::result<void>                    result );

        void OnClientFailed( const std::weak_ptr<Peer>            &weak_peer,
                             const std::shared_ptr<ClientFetcher> &fetcher,
                             const std::error_code                &error );

        /// Reports a failed subscription: notifies the peer and the error handler
        void ReportFailure( const std::shared_ptr<Peer> &peer, const StreamID &stream, const std::error_code &error );

        /// Removes and releases the entries of a key in both directions
        bool DropEntries( const std::shared_ptr<Peer> &peer, const StreamID &stream );

        static void Release( std::vector<ClientSubscription>                &clients,
                             std::vector<std::shared_ptr<ServerNegotiator>> &servers );

        std::shared_ptr<CapabilityRegistry> registry_;
        StreamOptions                       options_;

        boost::asio::io_context                                                  context_;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
        std::vector<std::thread>                                                 workers_;
        std::atomic<bool>                                                        stopped_{ false };

        mutable std::mutex                                 peers_mutex_;
        std::unordered_map<PeerId, std::shared_ptr<Peer>> peers_;

        mutable std::mutex       handlers_mutex_;
        SubscriptionErrorHandler subscription_error_handler_;
        SubscribeErrorHandler    subscribe_error_handler_;
        ChunkDeliveryHandler     chunk_delivery_handler_;

        base::Logger logger_ = base::createLogger( "Streamer" );
    };
}

#endif // CHUNKSYNC_NETWORK_STREAM_STREAMER_HPP
