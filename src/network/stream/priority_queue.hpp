#ifndef CHUNKSYNC_NETWORK_STREAM_PRIORITY_QUEUE_HPP
#define CHUNKSYNC_NETWORK_STREAM_PRIORITY_QUEUE_HPP

#include <array>
#include <condition_variable>
#include <deque>
#include <mutex>

#include <boost/optional.hpp>

#include "network/stream/messages.hpp"

namespace csync::network::stream
{
    struct QueuedFrame
    {
        Priority priority;
        Frame    frame;
    };

    /**
     * @brief Outgoing frames of one peer, one bounded FIFO per priority level.
     * Pop always serves the highest non-empty level first.
     */
    class PriorityFrameQueue
    {
    public:
        /**
         * @param capacity frames each level holds before Push fails
         */
        explicit PriorityFrameQueue( size_t capacity );

        /**
         * @return QUEUE_FULL when the level is at capacity, PEER_CLOSED after Close()
         */
        outcome::result<void> Push( Priority priority, Frame frame );

        /**
         * @brief Blocks until a frame is available
         * @return none once the queue is closed
         */
        boost::optional<QueuedFrame> Pop();

        boost::optional<QueuedFrame> TryPop();

        /// Wakes blocked readers and drops every queued frame
        void Close();

        bool IsClosed() const;

        size_t Size( Priority priority ) const;

    private:
        boost::optional<QueuedFrame> PopLocked();

        const size_t                                   capacity_;
        mutable std::mutex                             mutex_;
        std::condition_variable                        not_empty_;
        std::array<std::deque<Frame>, kPriorityLevels> levels_;
        bool                                           closed_ = false;
    };
}

#endif // CHUNKSYNC_NETWORK_STREAM_PRIORITY_QUEUE_HPP
