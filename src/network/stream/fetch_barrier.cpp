#include "network/stream/fetch_barrier.hpp"

namespace csync::network::stream
{
    std::shared_ptr<FetchBarrier> FetchBarrier::Create( std::vector<std::shared_ptr<FetchHandle>> handles,
                                                        Completion                                completion )
    {
        auto barrier = std::make_shared<FetchBarrier>( CreateToken{}, std::move( handles ), std::move( completion ) );
        barrier->Start();
        return barrier;
    }

    FetchBarrier::FetchBarrier( CreateToken, std::vector<std::shared_ptr<FetchHandle>> handles, Completion completion ) :
        handles_( std::move( handles ) ), completion_( std::move( completion ) ), pending_( handles_.size() )
    {
    }

    void FetchBarrier::Start()
    {
        if ( handles_.empty() )
        {
            OnHandleResolved( outcome::success() );
            return;
        }
        // copy, handles may resolve and run the callback while we iterate
        auto handles = handles_;
        for ( auto &handle : handles )
        {
            handle->OnResolved( [weak = weak_from_this()]( const outcome::result<void> &result )
                                {
                                    if ( auto self = weak.lock() )
                                    {
                                        self->OnHandleResolved( result );
                                    }
                                } );
        }
    }

    void FetchBarrier::Abort()
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        done_ = true;
        completion_ = nullptr;
        handles_.clear();
    }

    bool FetchBarrier::IsDone() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return done_;
    }

    size_t FetchBarrier::Pending() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return pending_;
    }

    void FetchBarrier::OnHandleResolved( const outcome::result<void> &result )
    {
        Completion completion;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( done_ )
            {
                return;
            }
            if ( result && pending_ > 1 )
            {
                --pending_;
                return;
            }
            pending_ = result ? 0 : pending_;
            done_    = true;
            completion.swap( completion_ );
            handles_.clear();
        }
        if ( completion )
        {
            completion( result );
        }
    }
}
