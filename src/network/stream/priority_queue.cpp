#include "network/stream/priority_queue.hpp"

#include "network/stream/stream_error.hpp"

namespace csync::network::stream
{
    PriorityFrameQueue::PriorityFrameQueue( size_t capacity ) : capacity_( capacity )
    {
    }

    outcome::result<void> PriorityFrameQueue::Push( Priority priority, Frame frame )
    {
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( closed_ )
            {
                return StreamError::PEER_CLOSED;
            }
            auto &level = levels_[static_cast<size_t>( priority )];
            if ( level.size() >= capacity_ )
            {
                return StreamError::QUEUE_FULL;
            }
            level.push_back( std::move( frame ) );
        }
        not_empty_.notify_one();
        return outcome::success();
    }

    boost::optional<QueuedFrame> PriorityFrameQueue::Pop()
    {
        std::unique_lock<std::mutex> lock( mutex_ );
        not_empty_.wait( lock,
                         [this]
                         {
                             if ( closed_ )
                             {
                                 return true;
                             }
                             for ( const auto &level : levels_ )
                             {
                                 if ( !level.empty() )
                                 {
                                     return true;
                                 }
                             }
                             return false;
                         } );
        return PopLocked();
    }

    boost::optional<QueuedFrame> PriorityFrameQueue::TryPop()
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return PopLocked();
    }

    void PriorityFrameQueue::Close()
    {
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            closed_ = true;
            for ( auto &level : levels_ )
            {
                level.clear();
            }
        }
        not_empty_.notify_all();
    }

    bool PriorityFrameQueue::IsClosed() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return closed_;
    }

    size_t PriorityFrameQueue::Size( Priority priority ) const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return levels_[static_cast<size_t>( priority )].size();
    }

    boost::optional<QueuedFrame> PriorityFrameQueue::PopLocked()
    {
        if ( closed_ )
        {
            return boost::none;
        }
        for ( size_t i = kPriorityLevels; i-- > 0; )
        {
            auto &level = levels_[i];
            if ( !level.empty() )
            {
                QueuedFrame queued{ static_cast<Priority>( i ), std::move( level.front() ) };
                level.pop_front();
                return queued;
            }
        }
        return boost::none;
    }
}
