#ifndef CHUNKSYNC_NETWORK_STREAM_CLIENT_FETCHER_HPP
#define CHUNKSYNC_NETWORK_STREAM_CLIENT_FETCHER_HPP

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include "base/logger.hpp"
#include "network/stream/client.hpp"
#include "network/stream/fetch_barrier.hpp"

namespace csync::network::stream
{
    /**
     * @brief Requesting side of one (peer, stream) subscription.
     * Answers every offer with a want mask right away and reports the batch to the Client once
     * all wanted chunks arrived. Several batches may be outstanding at once.
     */
    class ClientFetcher : public std::enable_shared_from_this<ClientFetcher>
    {
    public:
        using Sender = std::function<outcome::result<void>( const Message &, Priority )>;

        /// Called at most once, with the failure that ends the subscription
        using FailureHandler = std::function<void( const std::shared_ptr<ClientFetcher> &, const std::error_code & )>;

        ClientFetcher( boost::asio::io_context &context,
                       StreamID                 stream,
                       std::shared_ptr<Client>  client,
                       Priority                 priority,
                       Sender                   send,
                       FailureHandler           failed );

        void OnOfferedHashes( OfferedHashesMsg msg );

        /// Aborts the outstanding batches and closes the client
        void Stop();

        const StreamID &Stream() const
        {
            return stream_;
        }

        bool IsStopped() const
        {
            return stopped_.load();
        }

        /// Batches whose wanted chunks did not all arrive yet
        size_t OutstandingBatches() const;

        /// Batches reported to the Client so far
        uint64_t CompletedBatches() const
        {
            return completed_batches_.load();
        }

    private:
        void HandleOffer( const OfferedHashesMsg &msg );

        void OnBatchFetched( uint64_t batch_id, const OfferedHashesMsg &msg, outcome::result<void> result );

        outcome::result<void> CompleteBatch( const OfferedHashesMsg &msg );

        void Fail( const std::error_code &error );

        using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

        StreamID                stream_;
        std::shared_ptr<Client> client_;
        Priority                priority_;
        Sender                  send_;
        FailureHandler          failed_;
        Strand                  strand_;

        std::atomic<bool>     stopped_{ false };
        std::atomic<bool>     failed_called_{ false };
        std::atomic<uint64_t> completed_batches_{ 0 };

        mutable std::mutex                                mutex_;
        uint64_t                                          next_batch_id_ = 0;
        std::map<uint64_t, std::shared_ptr<FetchBarrier>> barriers_;

        base::Logger logger_ = base::createLogger( "ClientFetcher" );
    };
}

#endif // CHUNKSYNC_NETWORK_STREAM_CLIENT_FETCHER_HPP
