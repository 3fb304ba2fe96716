#ifndef CHUNKSYNC_NETWORK_STREAM_FETCH_HANDLE_HPP
#define CHUNKSYNC_NETWORK_STREAM_FETCH_HANDLE_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

#include <boost/optional.hpp>

#include "outcome/outcome.hpp"

namespace csync::network::stream
{
    /**
     * @brief Cancellable handle of one outstanding chunk fetch.
     * Resolved exactly once, either by the party that delivers the chunk or by Abort().
     * Thread safe; callbacks run on the resolving thread.
     */
    class FetchHandle
    {
    public:
        using ResolvedCallback = std::function<void( const outcome::result<void> & )>;

        /**
         * @brief Resolves the handle
         * @param result success when the chunk arrived, the fetch failure otherwise
         * @return false when the handle was already resolved, the result is then dropped
         */
        bool Resolve( outcome::result<void> result );

        /// Resolves the handle with FETCH_ABORTED
        bool Abort();

        bool IsResolved() const;

        /// Blocks until the handle is resolved
        outcome::result<void> Wait();

        /**
         * @brief Blocks until the handle is resolved or the timeout expired
         * @return none on timeout
         */
        boost::optional<outcome::result<void>> WaitFor( std::chrono::milliseconds timeout );

        /**
         * @brief Registers a callback for the resolution.
         * Runs immediately on the calling thread when the handle is already resolved.
         */
        void OnResolved( ResolvedCallback callback );

    private:
        mutable std::mutex                     mutex_;
        std::condition_variable                resolved_cv_;
        boost::optional<outcome::result<void>> result_;
        std::vector<ResolvedCallback>          callbacks_;
    };
}

#endif // CHUNKSYNC_NETWORK_STREAM_FETCH_HANDLE_HPP
