#include "network/stream/fetch_handle.hpp"

#include "network/stream/stream_error.hpp"

namespace csync::network::stream
{
    bool FetchHandle::Resolve( outcome::result<void> result )
    {
        std::vector<ResolvedCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( result_ )
            {
                return false;
            }
            result_ = result;
            callbacks.swap( callbacks_ );
        }
        resolved_cv_.notify_all();

        for ( auto &callback : callbacks )
        {
            callback( result );
        }
        return true;
    }

    bool FetchHandle::Abort()
    {
        return Resolve( outcome::failure( make_error_code( StreamError::FETCH_ABORTED ) ) );
    }

    bool FetchHandle::IsResolved() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return result_.has_value();
    }

    outcome::result<void> FetchHandle::Wait()
    {
        std::unique_lock<std::mutex> lock( mutex_ );
        resolved_cv_.wait( lock, [this] { return result_.has_value(); } );
        return *result_;
    }

    boost::optional<outcome::result<void>> FetchHandle::WaitFor( std::chrono::milliseconds timeout )
    {
        std::unique_lock<std::mutex> lock( mutex_ );
        if ( !resolved_cv_.wait_for( lock, timeout, [this] { return result_.has_value(); } ) )
        {
            return boost::none;
        }
        return result_;
    }

    void FetchHandle::OnResolved( ResolvedCallback callback )
    {
        boost::optional<outcome::result<void>> resolved;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( !result_ )
            {
                callbacks_.push_back( std::move( callback ) );
                return;
            }
            resolved = result_;
        }
        callback( *resolved );
    }
}
