#ifndef CHUNKSYNC_NETWORK_STREAM_SERVER_NEGOTIATOR_HPP
#define CHUNKSYNC_NETWORK_STREAM_SERVER_NEGOTIATOR_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include <boost/asio/deadline_timer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/optional.hpp>

#include "base/logger.hpp"
#include "network/stream/server.hpp"

namespace csync::network::stream
{
    /**
     * @brief Offering side of one (peer, stream) subscription.
     * Produces a batch, offers it, waits for the wanted hashes, delivers the wanted chunks and
     * continues from the cursor the client reports. All work runs serialized on a strand of the
     * Streamer's io_context.
     */
    class ServerNegotiator : public std::enable_shared_from_this<ServerNegotiator>
    {
    public:
        using Sender = std::function<outcome::result<void>( const Message &, Priority )>;

        /// Called once: success when a bounded historical stream is exhausted, the failure otherwise
        using FinishedHandler = std::function<void( const std::shared_ptr<ServerNegotiator> &, outcome::result<void> )>;

        /**
         * @param context executor running the negotiation
         * @param stream subscription served
         * @param server application side producing batches
         * @param start first cursor handed to SetNextBatch
         * @param bound history range of a historical negotiation, none for live or unbounded ones
         * @param priority priority of the offers and deliveries
         * @param send queues a message to the peer
         * @param finished completion and failure report
         * @param empty_batch_retry delay before polling the server again after an empty batch
         */
        ServerNegotiator( boost::asio::io_context   &context,
                          StreamID                   stream,
                          std::shared_ptr<Server>    server,
                          Range                      start,
                          boost::optional<Range>     bound,
                          Priority                   priority,
                          Sender                     send,
                          FinishedHandler            finished,
                          std::chrono::milliseconds  empty_batch_retry );

        /// Schedules the first batch
        void Start();

        /// Stops the negotiation and closes the server; later messages are discarded
        void Stop();

        void OnWantedHashes( WantedHashesMsg msg );

        void OnTakeoverProof( TakeoverProofMsg msg );

        const StreamID &Stream() const
        {
            return stream_;
        }

        bool IsStopped() const
        {
            return stopped_.load();
        }

        Range Cursor() const;

        boost::optional<TakeoverProof> LastTakeoverProof() const;

        /// True while an offer waits for its wanted hashes
        bool HasOutstandingOffer() const;

    private:
        void ProduceBatch();

        void HandleWanted( const WantedHashesMsg &msg );

        outcome::result<void> DeliverWanted( const Batch &batch, const WantedHashesMsg &msg );

        void ScheduleRetry();

        void Finish( outcome::result<void> result );

        using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

        StreamID                  stream_;
        std::shared_ptr<Server>   server_;
        boost::optional<Range>    bound_;
        Priority                  priority_;
        Sender                    send_;
        FinishedHandler           finished_;
        std::chrono::milliseconds empty_batch_retry_;

        Strand                      strand_;
        boost::asio::deadline_timer retry_timer_;
        std::atomic<bool>           stopped_{ false };
        std::atomic<bool>           finished_called_{ false };

        mutable std::mutex             state_mutex_;
        Range                          cursor_;
        boost::optional<Batch>         outstanding_;
        boost::optional<TakeoverProof> last_takeover_;

        base::Logger logger_ = base::createLogger( "ServerNegotiator" );
    };
}

#endif // CHUNKSYNC_NETWORK_STREAM_SERVER_NEGOTIATOR_HPP
